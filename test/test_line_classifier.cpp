/// @file test_line_classifier.cpp
/// @brief Unit tests for print-type-size line recognition

#include <gtest/gtest.h>

#include <typesizes/line_classifier.hpp>

namespace typesizes {
namespace test {

class LineClassifierTest : public ::testing::Test {
protected:
    LineClassifier classifier_;
};

// ============================================================================
// Wrapper Tests
// ============================================================================

TEST_F(LineClassifierTest, StripWrapperReturnsPayload) {
    auto tail = classifier_.strip_wrapper(
        "print-type-size type: `A`: 1 bytes, alignment: 1 bytes");
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "type: `A`: 1 bytes, alignment: 1 bytes");
}

TEST_F(LineClassifierTest, StripWrapperKeepsIndentation) {
    auto tail = classifier_.strip_wrapper("print-type-size     field `a`: 1 bytes");
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "    field `a`: 1 bytes");
}

TEST_F(LineClassifierTest, StripWrapperRejectsOtherOutput) {
    EXPECT_FALSE(classifier_.strip_wrapper("   Compiling foo v0.1.0").has_value());
    EXPECT_FALSE(classifier_.strip_wrapper("print-type-sizes type: `A`").has_value());
    EXPECT_FALSE(classifier_.strip_wrapper("xprint-type-size type: `A`").has_value());
    EXPECT_FALSE(classifier_.strip_wrapper("print-type-size").has_value());
    EXPECT_FALSE(classifier_.strip_wrapper("").has_value());
}

TEST_F(LineClassifierTest, StripWrapperDropsCarriageReturn) {
    auto tail = classifier_.strip_wrapper("print-type-size     padding: 3 bytes\r");
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "    padding: 3 bytes");
}

TEST_F(LineClassifierTest, CustomPrefixMatchesLiterally) {
    LineClassifier custom("note: [layout]");
    EXPECT_EQ(custom.wrapper_prefix(), "note: [layout]");

    auto tail = custom.strip_wrapper("note: [layout] type: `A`: 1 bytes, alignment: 1 bytes");
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "type: `A`: 1 bytes, alignment: 1 bytes");

    EXPECT_FALSE(custom.strip_wrapper("note: l type: `A`").has_value());
    EXPECT_FALSE(custom.strip_wrapper("print-type-size type: `A`").has_value());
}

// ============================================================================
// Header Tests
// ============================================================================

TEST_F(LineClassifierTest, HeaderMatch) {
    auto h = LineClassifier::match_header("type: `Foo`: 16 bytes, alignment: 8 bytes");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, "Foo");
    EXPECT_EQ(h->size, "16");
    EXPECT_EQ(h->alignment, "8");
}

TEST_F(LineClassifierTest, HeaderNameWithGenericsAndSpaces) {
    auto h = LineClassifier::match_header(
        "type: `std::collections::HashMap<u8, Vec<u16>>`: 48 bytes, alignment: 8 bytes");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, "std::collections::HashMap<u8, Vec<u16>>");
}

TEST_F(LineClassifierTest, HeaderWithVeryLongName) {
    const std::string name = "core::future::from_generator::GenFuture<[static generator@" +
                             std::string(200000, 'x') + "]>";
    auto h = LineClassifier::match_header("type: `" + name + "`: 1024 bytes, alignment: 8 bytes");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, name);
    EXPECT_EQ(h->size, "1024");
}

TEST_F(LineClassifierTest, HeaderNeedsQuotedName) {
    EXPECT_FALSE(LineClassifier::match_header("type: ``: 1 bytes, alignment: 1 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_header("type: `Foo: 1 bytes, alignment: 1 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_header("type: Foo: 1 bytes, alignment: 1 bytes").has_value());
}

TEST_F(LineClassifierTest, HeaderRejectsOtherShapes) {
    EXPECT_FALSE(LineClassifier::match_header("type: `Foo`: 16 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_header("  type: `Foo`: 16 bytes, alignment: 8 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_header("type: `Foo`: many bytes, alignment: 8 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_header("    field `a`: 8 bytes").has_value());
}

// ============================================================================
// Element Tests
// ============================================================================

TEST_F(LineClassifierTest, FieldWithAllGroups) {
    auto e = LineClassifier::match_element(
        "    field `.0`: 8 bytes, offset: 16 bytes, alignment: 8 bytes");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->indent, 4u);
    EXPECT_EQ(e->kind, "field");
    EXPECT_EQ(e->name, std::optional<std::string>(".0"));
    EXPECT_EQ(e->size, "8");
    EXPECT_EQ(e->offset, std::optional<std::string>("16"));
    EXPECT_EQ(e->alignment, std::optional<std::string>("8"));
}

TEST_F(LineClassifierTest, FieldWithAlignmentOnly) {
    auto e = LineClassifier::match_element("        field `.0`: 4 bytes, alignment: 4 bytes");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->indent, 8u);
    EXPECT_FALSE(e->offset.has_value());
    EXPECT_EQ(e->alignment, std::optional<std::string>("4"));
}

TEST_F(LineClassifierTest, UnnamedElements) {
    auto d = LineClassifier::match_element("    discriminant: 1 bytes");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, "discriminant");
    EXPECT_FALSE(d->name.has_value());

    auto p = LineClassifier::match_element("    padding: 3 bytes");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->kind, "padding");

    auto ep = LineClassifier::match_element("    end padding: 5 bytes");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->kind, "end padding");
    EXPECT_EQ(ep->size, "5");
}

TEST_F(LineClassifierTest, VariantLine) {
    auto v = LineClassifier::match_element("    variant `Some`: 4 bytes");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, "variant");
    EXPECT_EQ(v->name, std::optional<std::string>("Some"));
    EXPECT_FALSE(v->offset.has_value());
    EXPECT_FALSE(v->alignment.has_value());
}

TEST_F(LineClassifierTest, UnknownKindStillMatchesShape) {
    auto e = LineClassifier::match_element("    upvar `.x`: 8 bytes");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, "upvar");
}

TEST_F(LineClassifierTest, TabsCountAsIndentation) {
    auto e = LineClassifier::match_element("\tfield `a`: 1 bytes");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->indent, 1u);
}

TEST_F(LineClassifierTest, ElementWithVeryLongName) {
    const std::string name(150000, 'y');
    auto e = LineClassifier::match_element("        field `" + name + "`: 8 bytes, alignment: 8 bytes");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->indent, 8u);
    EXPECT_EQ(e->name, std::optional<std::string>(name));
    EXPECT_EQ(e->alignment, std::optional<std::string>("8"));
}

TEST_F(LineClassifierTest, ElementNameNeedsSeparatorAndClosingQuote) {
    EXPECT_FALSE(LineClassifier::match_element("    field`a`: 4 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    field `a: 4 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    field ``: 4 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    ").has_value());
}

TEST_F(LineClassifierTest, StripWrapperOfVeryLongLine) {
    const std::string payload = "type: `" + std::string(120000, 'z') + "`: 1 bytes, alignment: 1 bytes";
    auto tail = classifier_.strip_wrapper("print-type-size " + payload);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->size(), payload.size());
}

TEST_F(LineClassifierTest, ElementRejectsOtherShapes) {
    EXPECT_FALSE(LineClassifier::match_element("field `a`: 4 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("type: `Foo`: 16 bytes, alignment: 8 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    field `a`: 4 bytes, type: bool").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    Field `a`: 4 bytes").has_value());
    EXPECT_FALSE(LineClassifier::match_element("    field `a`: -4 bytes").has_value());
}

} // namespace test
} // namespace typesizes
