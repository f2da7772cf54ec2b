#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace typesizes {

/// Captures of a `type: `name`: N bytes, alignment: M bytes` line
struct HeaderMatch {
    std::string name;
    std::string size;           // Raw digits
    std::string alignment;      // Raw digits
};

/// Captures of an indented element line
struct ElementMatch {
    std::size_t                indent = 0;     // Leading whitespace length
    std::string                kind;           // e.g. "field", "end padding"
    std::optional<std::string> name;
    std::string                size;           // Raw digits
    std::optional<std::string> offset;         // Raw digits, when reported
    std::optional<std::string> alignment;      // Raw digits, when reported
};

/// Recognizers for the three line shapes of `-Zprint-type-sizes` output.
///
/// Backticked names are split off by hand and may be arbitrarily long; only
/// the numeric tail of a line goes through a regex, compiled once per process.
class LineClassifier {
public:
    explicit LineClassifier(const std::string& wrapper_prefix = "print-type-size");

    /// Payload after the wrapper prefix, or nullopt for unrelated output
    [[nodiscard]] std::optional<std::string> strip_wrapper(std::string_view raw) const;

    [[nodiscard]] static std::optional<HeaderMatch> match_header(std::string_view line);
    [[nodiscard]] static std::optional<ElementMatch> match_element(std::string_view line);

    [[nodiscard]] const std::string& wrapper_prefix() const noexcept { return prefix_; }

private:
    std::string prefix_;
    std::string lead_;          // Prefix plus the separating space
};

} // namespace typesizes
