/// @file parse_result.cpp
/// @brief Parse result reporting

#include <typesizes/parse_result.hpp>
#include <typesizes/utils.hpp>

namespace typesizes {

const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                  return "none";
        case ErrorKind::UnknownElementKind:    return "unknown element kind";
        case ErrorKind::StructuralMismatch:    return "structural mismatch";
        case ErrorKind::MissingName:           return "missing name";
        case ErrorKind::InvalidNumber:         return "invalid number";
        case ErrorKind::MisalignedIndentation: return "misaligned indentation";
        case ErrorKind::NestingTooDeep:        return "nesting too deep";
        case ErrorKind::MalformedHeader:       return "malformed type header";
        default:                               return "???";
    }
}

std::string ParseResult::summary() const {
    std::string result = format_string("Parse result: %s\n", status_string());
    result += format_string("Lines: %zu total, %zu payload\n", lines_total, lines_payload);
    result += format_string("Types: %zu\n", types.size());

    if (has_diagnostics()) {
        result += format_string("Skipped lines (%zu):\n", diagnostics.size());
        for (const auto& d : diagnostics) {
            result += format_string("  - line %zu: %s\n", d.line, d.message.c_str());
        }
    }

    if (is_error()) {
        result += format_string("Error (%s) at line %zu: %s\n",
                                error_kind_string(error_kind), error_line, error_message.c_str());
        result += format_string("  > %s\n", error_text.c_str());
    }

    return result;
}

} // namespace typesizes
