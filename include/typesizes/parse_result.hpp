#pragma once

#include "layout_types.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace typesizes {

/// Category of a parse failure
enum class ErrorKind {
    None,
    UnknownElementKind,     // Inner line with a kind outside the known keywords
    StructuralMismatch,     // Nested block under something that is not a bare variant
    MissingName,            // Field or variant line without a name
    InvalidNumber,          // Numeric value that does not fit in 64 bits
    MisalignedIndentation,  // Indentation not a multiple of the unit (strict mode)
    NestingTooDeep,         // Nesting beyond the configured maximum
    MalformedHeader         // Line where a type header was expected
};

[[nodiscard]] const char* error_kind_string(ErrorKind kind) noexcept;

/// Fatal parse failure. Carries the 1-based position and text of the
/// offending line of the raw input.
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, std::size_t line, std::string text, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
        , line_(line)
        , text_(std::move(text)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    ErrorKind   kind_;
    std::size_t line_;
    std::string text_;
};

/// Recoverable problem found while parsing
struct ParseDiagnostic {
    ErrorKind   kind = ErrorKind::None;
    std::size_t line = 0;       // 1-based line in the raw input
    std::string text;           // Offending payload
    std::string message;
};

/// Result of parsing one diagnostic stream
struct ParseResult {
    enum class Status {
        Ok,          // Every payload line was understood
        Recovered,   // Types parsed, but some lines were skipped
        Error        // Fatal error, no types returned
    };

    Status status = Status::Ok;
    std::vector<TypeRecord> types;
    std::vector<ParseDiagnostic> diagnostics;

    // Fatal error details (Status::Error only)
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::size_t error_line = 0;
    std::string error_text;

    // Statistics
    std::size_t lines_total = 0;      // Raw lines seen
    std::size_t lines_payload = 0;    // Lines carrying the wrapper prefix

    [[nodiscard]] bool is_ok() const noexcept {
        return status == Status::Ok;
    }

    [[nodiscard]] bool is_recovered() const noexcept {
        return status == Status::Recovered;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return status == Status::Error;
    }

    /// True when types are available (Ok or Recovered)
    [[nodiscard]] bool succeeded() const noexcept {
        return status != Status::Error;
    }

    [[nodiscard]] bool has_diagnostics() const noexcept {
        return !diagnostics.empty();
    }

    /// Get a string description of the status
    [[nodiscard]] const char* status_string() const noexcept {
        switch (status) {
            case Status::Ok:        return "OK";
            case Status::Recovered: return "OK (recovered)";
            case Status::Error:     return "ERROR";
            default:                return "INVALID";
        }
    }

    /// Generate a diagnostic summary
    [[nodiscard]] std::string summary() const;

    /// Factory methods
    static ParseResult make_ok(std::vector<TypeRecord>&& types,
                               std::vector<ParseDiagnostic>&& diagnostics)
    {
        ParseResult r;
        r.status = diagnostics.empty() ? Status::Ok : Status::Recovered;
        r.types = std::move(types);
        r.diagnostics = std::move(diagnostics);
        return r;
    }

    static ParseResult make_error(const ParseError& err,
                                  std::vector<ParseDiagnostic>&& diagnostics = {})
    {
        ParseResult r;
        r.status = Status::Error;
        r.diagnostics = std::move(diagnostics);
        r.error_kind = err.kind();
        r.error_message = err.what();
        r.error_line = err.line();
        r.error_text = err.text();
        return r;
    }
};

} // namespace typesizes
