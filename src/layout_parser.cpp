/// @file layout_parser.cpp
/// @brief Indentation-driven reconstruction of type layout trees

#include <typesizes/layout_parser.hpp>
#include <typesizes/element_builder.hpp>
#include <typesizes/line_source.hpp>
#include <typesizes/utils.hpp>

#include <stdexcept>

namespace typesizes {

LayoutParser::LayoutParser(const ParseOptions& opts)
    : options_(opts)
    , classifier_(opts.wrapper_prefix) {
    if (options_.indent_unit == 0) {
        throw std::invalid_argument("indent_unit must be positive");
    }
}

ParseResult LayoutParser::parse(const std::vector<std::string>& raw_lines) const {
    const std::vector<PayloadLine> payload = extract_payload(raw_lines);
    if (options_.debug_mode) {
        log_message(LogLevel::Debug, "%zu of %zu lines carry '%s'", payload.size(), raw_lines.size(),
                    options_.wrapper_prefix.c_str());
    }

    ParseState state(payload);
    std::vector<TypeRecord> types;
    ParseResult result;

    try {
        while (!state.at_end()) {
            if (auto type = parse_type(state)) {
                types.push_back(std::move(*type));
            }
        }
        result = ParseResult::make_ok(std::move(types), std::move(state.diagnostics));
    } catch (const ParseError& e) {
        if (options_.debug_mode) {
            log_message(LogLevel::Debug, "Parse failed at line %zu: %s", e.line(), e.what());
        }
        result = ParseResult::make_error(e, std::move(state.diagnostics));
    }

    result.lines_total = raw_lines.size();
    result.lines_payload = payload.size();
    return result;
}

ParseResult LayoutParser::parse_text(std::string_view text) const {
    return parse(split_lines(text));
}

std::vector<LayoutParser::PayloadLine>
LayoutParser::extract_payload(const std::vector<std::string>& raw_lines) const {
    std::vector<PayloadLine> payload;
    for (std::size_t i = 0; i < raw_lines.size(); ++i) {
        if (auto tail = classifier_.strip_wrapper(raw_lines[i])) {
            payload.push_back(PayloadLine{i + 1, std::move(*tail)});
        }
    }
    return payload;
}

std::optional<TypeRecord> LayoutParser::parse_type(ParseState& state) const {
    const PayloadLine& line = state.peek();
    state.advance();

    auto header = LineClassifier::match_header(line.text);
    if (!header) {
        // Element lines right after the bad line have no type to belong to
        std::size_t orphans = 0;
        while (!state.at_end() && LineClassifier::match_element(state.peek().text)) {
            state.advance();
            ++orphans;
        }

        ParseDiagnostic diag;
        diag.kind = ErrorKind::MalformedHeader;
        diag.line = line.number;
        diag.text = line.text;
        diag.message = orphans == 0
            ? std::string("expected type header")
            : format_string("expected type header, skipped %zu element lines", orphans);

        log_error("Ignoring line %zu (expected type): %s", line.number, line.text.c_str());
        state.diagnostics.push_back(std::move(diag));

        if (options_.header_recovery == HeaderRecovery::DropRemainder && !state.at_end()) {
            log_warning("Dropping %zu lines after line %zu",
                        state.lines.size() - state.pos, line.number);
            state.pos = state.lines.size();
        }
        return std::nullopt;
    }

    TypeRecord type;
    type.name = std::move(header->name);
    type.size = parse_number(header->size, line.number, line.text);
    type.alignment = parse_number(header->alignment, line.number, line.text);
    type.line = line.number;
    type.children = parse_tree(state, 1);

    if (options_.debug_mode) {
        log_message(LogLevel::Debug, "Type `%s`: %llu bytes, alignment %llu, %zu nodes",
                    type.name.c_str(),
                    static_cast<unsigned long long>(type.size),
                    static_cast<unsigned long long>(type.alignment),
                    type.node_count());
    }
    return type;
}

std::vector<Node> LayoutParser::parse_tree(ParseState& state, std::size_t depth) const {
    std::vector<Node> tree;

    while (!state.at_end()) {
        const PayloadLine& line = state.peek();
        auto element = LineClassifier::match_element(line.text);
        if (!element) {
            // Next header (or stray payload): this type is complete
            break;
        }

        switch (compare_indent(element->indent, depth, line)) {
            case IndentRelation::Shallower:
                // Left for the enclosing level to consume
                return tree;

            case IndentRelation::Deeper: {
                const Variant& owner = member_owner(tree, line);
                if (depth + 1 > options_.max_depth) {
                    throw ParseError(ErrorKind::NestingTooDeep, line.number, line.text,
                                     format_string("nesting deeper than %zu levels", options_.max_depth));
                }
                std::vector<Node> members = parse_tree(state, depth + 1);
                tree.back() = owner.with_children(std::move(members));
                break;
            }

            case IndentRelation::Same:
                tree.push_back(build_element(*element, line.number, line.text));
                state.advance();
                break;
        }
    }

    return tree;
}

LayoutParser::IndentRelation
LayoutParser::compare_indent(std::size_t indent, std::size_t depth, const PayloadLine& line) const {
    const std::size_t unit = options_.indent_unit;

    if (options_.strict_indentation && indent % unit != 0) {
        throw ParseError(ErrorKind::MisalignedIndentation, line.number, line.text,
                         format_string("indentation of %zu is not a multiple of %zu", indent, unit));
    }

    // Indentation between two levels counts as the deeper one
    const std::size_t expected = depth * unit;
    if (indent > expected) {
        return IndentRelation::Deeper;
    }
    if (indent + unit <= expected) {
        return IndentRelation::Shallower;
    }
    return IndentRelation::Same;
}

const Variant& LayoutParser::member_owner(const std::vector<Node>& tree, const PayloadLine& line) const {
    if (tree.empty()) {
        throw ParseError(ErrorKind::StructuralMismatch, line.number, line.text,
                         "nested element without a preceding variant");
    }

    const Node& prev = tree.back();
    const Variant* variant = prev.get_if<Variant>();
    if (!variant) {
        throw ParseError(ErrorKind::StructuralMismatch, line.number, line.text,
                         format_string("%s cannot own nested elements", node_kind_name(prev.kind())));
    }
    if (variant->has_children()) {
        throw ParseError(ErrorKind::StructuralMismatch, line.number, line.text,
                         format_string("variant `%s` already has members", variant->name.c_str()));
    }
    return *variant;
}

ParseResult parse_layouts(const std::vector<std::string>& raw_lines, const ParseOptions& opts) {
    return LayoutParser(opts).parse(raw_lines);
}

} // namespace typesizes
