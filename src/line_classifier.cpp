/// @file line_classifier.cpp
/// @brief Recognizers for print-type-size lines

#include <typesizes/line_classifier.hpp>
#include <typesizes/utils.hpp>

#include <cctype>
#include <regex>

namespace typesizes {

namespace {

    // Names are split off by hand; the patterns only see the numeric tail
    // after the closing backtick, so their length stays bounded.

    // 1 size, 2 alignment
    const std::regex& header_tail_pattern() {
        static const std::regex pattern(
            R"(^: (\d+) bytes, alignment: (\d+) bytes$)");
        return pattern;
    }

    // 1 size, 3 offset, 5 alignment
    const std::regex& element_tail_pattern() {
        static const std::regex pattern(
            R"(^: (\d+) bytes(, offset: (\d+) bytes)?(, alignment: (\d+) bytes)?$)");
        return pattern;
    }

    constexpr std::string_view HEADER_LEAD = "type: `";

    bool is_kind_char(char c) noexcept {
        return (c >= 'a' && c <= 'z') || c == ' ';
    }

    std::optional<std::string> optional_group(const std::cmatch& m, std::size_t idx) {
        if (!m[idx].matched) return std::nullopt;
        return m[idx].str();
    }

    /// Split "`name`rest" at its backticks; nullopt if unterminated or empty
    std::optional<std::string_view> quoted_name(std::string_view text, std::string_view& rest) {
        const auto close = text.find('`', 1);
        if (text.empty() || text.front() != '`' || close == std::string_view::npos || close == 1) {
            return std::nullopt;
        }
        rest = text.substr(close + 1);
        return text.substr(1, close - 1);
    }

} // anonymous namespace

LineClassifier::LineClassifier(const std::string& wrapper_prefix)
    : prefix_(wrapper_prefix)
    , lead_(wrapper_prefix + " ") {}

std::optional<std::string> LineClassifier::strip_wrapper(std::string_view raw) const {
    const std::string_view line = strip_cr(raw);
    if (!starts_with(line, lead_)) {
        return std::nullopt;
    }
    return std::string(line.substr(lead_.size()));
}

std::optional<HeaderMatch> LineClassifier::match_header(std::string_view line) {
    line = strip_cr(line);
    if (!starts_with(line, HEADER_LEAD)) {
        return std::nullopt;
    }

    std::string_view tail;
    auto name = quoted_name(line.substr(HEADER_LEAD.size() - 1), tail);
    if (!name) {
        return std::nullopt;
    }

    std::cmatch m;
    if (!std::regex_match(tail.data(), tail.data() + tail.size(), m, header_tail_pattern())) {
        return std::nullopt;
    }

    HeaderMatch header;
    header.name = std::string(*name);
    header.size = m[1].str();
    header.alignment = m[2].str();
    return header;
}

std::optional<ElementMatch> LineClassifier::match_element(std::string_view line) {
    line = strip_cr(line);

    std::size_t pos = 0;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos == line.size() || line[pos] < 'a' || line[pos] > 'z') {
        return std::nullopt;
    }

    ElementMatch element;
    element.indent = pos;

    std::size_t kind_end = pos + 1;
    while (kind_end < line.size() && is_kind_char(line[kind_end])) {
        ++kind_end;
    }

    std::string_view kind = line.substr(pos, kind_end - pos);
    std::string_view tail = line.substr(kind_end);

    if (!tail.empty() && tail.front() == '`') {
        // Kind and name are separated by one space
        if (kind.size() < 2 || kind.back() != ' ') {
            return std::nullopt;
        }
        kind.remove_suffix(1);
        auto name = quoted_name(tail, tail);
        if (!name) {
            return std::nullopt;
        }
        element.name = std::string(*name);
    }

    std::cmatch m;
    if (!std::regex_match(tail.data(), tail.data() + tail.size(), m, element_tail_pattern())) {
        return std::nullopt;
    }

    element.kind = std::string(kind);
    element.size = m[1].str();
    element.offset = optional_group(m, 3);
    element.alignment = optional_group(m, 5);
    return element;
}

} // namespace typesizes
