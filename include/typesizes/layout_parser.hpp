#pragma once

#include "layout_types.hpp"
#include "config.hpp"
#include "line_classifier.hpp"
#include "parse_result.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typesizes {

/// Rebuilds type layout trees from `-Zprint-type-sizes` output.
///
/// Lines without the wrapper prefix are ignored. Each `type:` header starts
/// a record whose body is read by indentation: one indentation unit per
/// nesting level, where a deeper block belongs to the variant line right
/// before it.
///
/// Fatal errors (unknown element kinds, nested blocks under anything but a
/// bare variant, ...) fail the whole parse and no types are returned. A line
/// where a header was expected is recoverable: it is skipped, or with
/// HeaderRecovery::DropRemainder everything after it is dropped.
class LayoutParser {
public:
    explicit LayoutParser(const ParseOptions& opts = Config::instance().options().parse);

    /// Parse raw lines as captured from the compiler
    [[nodiscard]] ParseResult parse(const std::vector<std::string>& raw_lines) const;

    /// Parse captured text, split on newlines
    [[nodiscard]] ParseResult parse_text(std::string_view text) const;

    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

private:
    /// Payload of a wrapped line with its 1-based position in the raw input
    struct PayloadLine {
        std::size_t number;
        std::string text;
    };

    /// Unconsumed payload lines and collected diagnostics
    struct ParseState {
        const std::vector<PayloadLine>& lines;
        std::size_t pos = 0;
        std::vector<ParseDiagnostic> diagnostics;

        explicit ParseState(const std::vector<PayloadLine>& l) : lines(l) {}

        [[nodiscard]] bool at_end() const noexcept { return pos >= lines.size(); }
        [[nodiscard]] const PayloadLine& peek() const { return lines[pos]; }
        void advance() noexcept { ++pos; }
    };

    /// Relation of a line's indentation to the level being built
    enum class IndentRelation {
        Shallower,  // Belongs to an enclosing level
        Same,       // Sibling at this level
        Deeper      // Member block of the previous variant
    };

    [[nodiscard]] std::vector<PayloadLine> extract_payload(const std::vector<std::string>& raw_lines) const;

    /// Type assembler: one header plus its body, or nullopt for a skipped line
    [[nodiscard]] std::optional<TypeRecord> parse_type(ParseState& state) const;

    /// Tree builder: elements at `depth` until the indentation drops or a
    /// non-element line is reached
    [[nodiscard]] std::vector<Node> parse_tree(ParseState& state, std::size_t depth) const;

    [[nodiscard]] IndentRelation compare_indent(std::size_t indent, std::size_t depth,
                                                const PayloadLine& line) const;

    /// The variant stub a deeper block starting at `line` belongs to
    [[nodiscard]] const Variant& member_owner(const std::vector<Node>& tree,
                                              const PayloadLine& line) const;

    ParseOptions options_;
    LineClassifier classifier_;
};

/// Parse with the given options
[[nodiscard]] ParseResult parse_layouts(const std::vector<std::string>& raw_lines,
                                        const ParseOptions& opts = Config::instance().options().parse);

} // namespace typesizes
