#pragma once

#include "layout_types.hpp"
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

namespace typesizes {

/// Type name prefixes treated as standard library types
inline constexpr const char* STD_PREFIXES[] = { "std::", "core::", "alloc::" };

/// Built-in type predicates
namespace predicates {
    /// Accept all types
    inline bool accept_all(const TypeRecord&) { return true; }

    /// Reject standard library types
    inline bool exclude_std(const TypeRecord& type) {
        for (const char* prefix : STD_PREFIXES) {
            if (type.name.rfind(prefix, 0) == 0) return false;
        }
        return true;
    }

    /// Only accept types of at least `min_size` bytes
    inline TypeFilter min_size(std::uint64_t min_size) {
        return [min_size](const TypeRecord& type) {
            return type.size >= min_size;
        };
    }

    /// Only accept types within a size range (inclusive)
    inline TypeFilter size_range(std::uint64_t min_size, std::uint64_t max_size) {
        return [min_size, max_size](const TypeRecord& type) {
            return type.size >= min_size && type.size <= max_size;
        };
    }

    /// Only accept types whose name contains `needle`
    inline TypeFilter name_contains(std::string needle) {
        return [needle = std::move(needle)](const TypeRecord& type) {
            return type.name.find(needle) != std::string::npos;
        };
    }

    /// Combine predicates with AND
    inline TypeFilter all_of(std::initializer_list<TypeFilter> preds) {
        std::vector<TypeFilter> pred_vec(preds);
        return [pred_vec](const TypeRecord& type) {
            for (const auto& p : pred_vec) {
                if (!p(type)) return false;
            }
            return true;
        };
    }

    /// Combine predicates with OR
    inline TypeFilter any_of(std::initializer_list<TypeFilter> preds) {
        std::vector<TypeFilter> pred_vec(preds);
        return [pred_vec](const TypeRecord& type) {
            for (const auto& p : pred_vec) {
                if (p(type)) return true;
            }
            return false;
        };
    }
}

/// What to do with a line where a `type:` header was expected
enum class HeaderRecovery {
    SkipLine,       // Skip the line, resume at the next header
    DropRemainder   // Drop everything after the line (legacy behavior)
};

enum class OutputFormat {
    Text,
    Html
};

/// Options controlling the layout parser
struct ParseOptions {
    std::string     wrapper_prefix;         // Prefix marking diagnostic lines
    std::size_t     indent_unit;            // Whitespace width of one nesting level
    bool            strict_indentation;     // Reject indentation that is not a multiple of indent_unit
    HeaderRecovery  header_recovery;        // Handling of malformed type headers
    std::size_t     max_depth;              // Deepest nesting accepted below a header
    bool            debug_mode;             // Debug logging from parsers built with these options

    ParseOptions()
        : wrapper_prefix("print-type-size")
        , indent_unit(4)
        , strict_indentation(false)
        , header_recovery(HeaderRecovery::SkipLine)
        , max_depth(64)
        , debug_mode(false) {}
};

/// Options controlling post-processing and rendering
struct OutputOptions {
    OutputFormat    format;
    bool            sort_by_size;
    bool            sort_descending;
    bool            exclude_std;
    std::uint64_t   min_size;
    std::string     name_filter;
    std::string     html_title;

    OutputOptions()
        : format(OutputFormat::Text)
        , sort_by_size(false)
        , sort_descending(false)
        , exclude_std(false)
        , min_size(0)
        , html_title("Type sizes") {}
};

struct Options {
    ParseOptions    parse;
    OutputOptions   output;
};

/// Build the type filter described by the output options
[[nodiscard]] TypeFilter make_filter(const OutputOptions& opts);

[[nodiscard]] const char* header_recovery_name(HeaderRecovery mode) noexcept;
[[nodiscard]] const char* output_format_name(OutputFormat format) noexcept;

/// Configuration manager for the tool
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    /// Load configuration from a file. A missing file keeps the current
    /// options; an invalid entry fails and leaves them untouched.
    bool load(const std::filesystem::path& path);

    /// Save configuration to a file
    bool save(const std::filesystem::path& path);

    /// Reset to defaults
    void reset();

    /// Get current options (read-only)
    [[nodiscard]] const Options& options() const noexcept {
        return options_;
    }

    /// Get mutable options for modification
    [[nodiscard]] Options& mutable_options() noexcept {
        dirty_ = true;
        return options_;
    }

    /// Check if configuration has unsaved changes
    [[nodiscard]] bool is_dirty() const noexcept {
        return dirty_;
    }

    /// Mark configuration as saved
    void mark_clean() noexcept {
        dirty_ = false;
    }

    // Convenience accessors
    [[nodiscard]] const std::string& wrapper_prefix() const noexcept { return options_.parse.wrapper_prefix; }
    [[nodiscard]] std::size_t indent_unit() const noexcept { return options_.parse.indent_unit; }
    [[nodiscard]] bool strict_indentation() const noexcept { return options_.parse.strict_indentation; }
    [[nodiscard]] HeaderRecovery header_recovery() const noexcept { return options_.parse.header_recovery; }
    [[nodiscard]] std::size_t max_depth() const noexcept { return options_.parse.max_depth; }
    [[nodiscard]] bool debug_mode() const noexcept { return options_.parse.debug_mode; }
    [[nodiscard]] OutputFormat format() const noexcept { return options_.output.format; }
    [[nodiscard]] bool sort_by_size() const noexcept { return options_.output.sort_by_size; }
    [[nodiscard]] bool exclude_std() const noexcept { return options_.output.exclude_std; }

    static constexpr int CONFIG_VERSION = 1;

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    Options options_;
    bool dirty_ = false;
};

} // namespace typesizes
