#pragma once

#include "layout_types.hpp"
#include "line_classifier.hpp"
#include "parse_result.hpp"
#include <cstdint>
#include <string_view>

namespace typesizes {

/// Build the node for one matched element line.
///
/// Variants are returned with absent children; the tree builder completes
/// them once their members are known. Throws ParseError for a kind outside
/// discriminant/padding/end padding/field/variant, for a field or variant
/// without a name, and for sizes that do not fit in 64 bits.
[[nodiscard]] Node build_element(const ElementMatch& match, std::size_t line_no, std::string_view line);

/// Convert captured digits. Throws ParseError(InvalidNumber) on overflow.
[[nodiscard]] std::uint64_t parse_number(std::string_view digits, std::size_t line_no, std::string_view line);

/// True for the five element keywords the diagnostics use
[[nodiscard]] bool is_known_element_kind(std::string_view kind) noexcept;

} // namespace typesizes
