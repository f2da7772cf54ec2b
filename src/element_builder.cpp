/// @file element_builder.cpp
/// @brief Element line to layout node conversion

#include <typesizes/element_builder.hpp>
#include <typesizes/utils.hpp>

#include <charconv>

namespace typesizes {

namespace {

    struct KindEntry {
        std::string_view keyword;
        NodeKind kind;
    };

    constexpr KindEntry KNOWN_KINDS[] = {
        { "discriminant", NodeKind::Discriminant },
        { "padding",      NodeKind::Padding },
        { "end padding",  NodeKind::EndPadding },
        { "field",        NodeKind::Field },
        { "variant",      NodeKind::Variant },
    };

    std::optional<NodeKind> lookup_kind(std::string_view keyword) noexcept {
        for (const auto& entry : KNOWN_KINDS) {
            if (entry.keyword == keyword) return entry.kind;
        }
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_optional(const std::optional<std::string>& digits,
                                                std::size_t line_no, std::string_view line) {
        if (!digits) return std::nullopt;
        return parse_number(*digits, line_no, line);
    }

    const std::string& require_name(const ElementMatch& match, std::size_t line_no, std::string_view line) {
        if (!match.name) {
            throw ParseError(ErrorKind::MissingName, line_no, std::string(line),
                             format_string("%s line has no name", match.kind.c_str()));
        }
        return *match.name;
    }

} // anonymous namespace

bool is_known_element_kind(std::string_view kind) noexcept {
    return lookup_kind(kind).has_value();
}

std::uint64_t parse_number(std::string_view digits, std::size_t line_no, std::string_view line) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw ParseError(ErrorKind::InvalidNumber, line_no, std::string(line),
                         format_string("number out of range: %.*s",
                                       static_cast<int>(digits.size()), digits.data()));
    }
    return value;
}

Node build_element(const ElementMatch& match, std::size_t line_no, std::string_view line) {
    const auto kind = lookup_kind(match.kind);
    if (!kind) {
        throw ParseError(ErrorKind::UnknownElementKind, line_no, std::string(line),
                         format_string("unknown element kind '%s'", match.kind.c_str()));
    }

    const std::uint64_t size = parse_number(match.size, line_no, line);

    switch (*kind) {
        case NodeKind::Discriminant:
            return Discriminant{size};

        case NodeKind::Padding:
            return Padding{size};

        case NodeKind::EndPadding:
            return EndPadding{size};

        case NodeKind::Field: {
            Field field;
            field.name = require_name(match, line_no, line);
            field.size = size;
            field.offset = parse_optional(match.offset, line_no, line);
            field.alignment = parse_optional(match.alignment, line_no, line);
            return field;
        }

        case NodeKind::Variant: {
            Variant variant;
            variant.name = require_name(match, line_no, line);
            variant.size = size;
            return variant;
        }
    }

    throw ParseError(ErrorKind::UnknownElementKind, line_no, std::string(line),
                     format_string("unhandled element kind '%s'", match.kind.c_str()));
}

} // namespace typesizes
