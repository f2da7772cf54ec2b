/// @file config.cpp
/// @brief Configuration persistence

#include <typesizes/config.hpp>
#include <typesizes/utils.hpp>

#include <charconv>
#include <fstream>
#include <optional>

namespace typesizes {

namespace {

    std::string_view trim(std::string_view s) noexcept {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

} // anonymous namespace

TypeFilter make_filter(const OutputOptions& opts) {
    std::vector<TypeFilter> filters;
    if (opts.exclude_std) {
        filters.emplace_back(predicates::exclude_std);
    }
    if (opts.min_size > 0) {
        filters.push_back(predicates::min_size(opts.min_size));
    }
    if (!opts.name_filter.empty()) {
        filters.push_back(predicates::name_contains(opts.name_filter));
    }

    if (filters.empty()) {
        return predicates::accept_all;
    }
    return [filters](const TypeRecord& type) {
        for (const auto& f : filters) {
            if (!f(type)) return false;
        }
        return true;
    };
}

const char* header_recovery_name(HeaderRecovery mode) noexcept {
    switch (mode) {
        case HeaderRecovery::SkipLine:      return "skip-line";
        case HeaderRecovery::DropRemainder: return "drop-remainder";
        default:                            return "???";
    }
}

const char* output_format_name(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Html: return "html";
        default:                 return "???";
    }
}

bool Config::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        // No saved config, use defaults
        log_debug("No configuration at %s, using defaults", path.string().c_str());
        return true;
    }

    std::ifstream in(path);
    if (!in) {
        log_error("Cannot open configuration file %s", path.string().c_str());
        return false;
    }

    auto read_bool = [](std::string_view v) -> std::optional<bool> {
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
        return std::nullopt;
    };

    auto read_uint = [](std::string_view v) -> std::optional<std::uint64_t> {
        std::uint64_t val = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), val);
        if (ec != std::errc() || ptr != v.data() + v.size()) return std::nullopt;
        return val;
    };

    auto read_recovery = [](std::string_view v) -> std::optional<HeaderRecovery> {
        if (v == "skip-line") return HeaderRecovery::SkipLine;
        if (v == "drop-remainder") return HeaderRecovery::DropRemainder;
        return std::nullopt;
    };

    auto read_format = [](std::string_view v) -> std::optional<OutputFormat> {
        if (v == "text") return OutputFormat::Text;
        if (v == "html") return OutputFormat::Html;
        return std::nullopt;
    };

    // Parse into a copy so a bad entry leaves the current options intact
    Options loaded = options_;
    std::string raw;
    std::size_t line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            log_error("%s:%zu: expected 'key = value'", path.string().c_str(), line_no);
            return false;
        }

        const std::string_view key = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));
        bool ok = true;

        if (key == "version") {
            auto v = read_uint(value);
            if (!v) {
                ok = false;
            } else if (*v > static_cast<std::uint64_t>(CONFIG_VERSION)) {
                log_warning("%s: unsupported configuration version %llu, ignoring file",
                            path.string().c_str(), static_cast<unsigned long long>(*v));
                return true;
            }
        } else if (key == "wrapper_prefix") {
            loaded.parse.wrapper_prefix = std::string(value);
            ok = !value.empty();
        } else if (key == "indent_unit") {
            auto v = read_uint(value);
            ok = v.has_value() && *v > 0;
            if (ok) loaded.parse.indent_unit = static_cast<std::size_t>(*v);
        } else if (key == "strict_indentation") {
            auto v = read_bool(value);
            ok = v.has_value();
            if (ok) loaded.parse.strict_indentation = *v;
        } else if (key == "header_recovery") {
            auto v = read_recovery(value);
            ok = v.has_value();
            if (ok) loaded.parse.header_recovery = *v;
        } else if (key == "max_depth") {
            auto v = read_uint(value);
            ok = v.has_value() && *v > 0;
            if (ok) loaded.parse.max_depth = static_cast<std::size_t>(*v);
        } else if (key == "debug_mode") {
            auto v = read_bool(value);
            ok = v.has_value();
            if (ok) loaded.parse.debug_mode = *v;
        } else if (key == "format") {
            auto v = read_format(value);
            ok = v.has_value();
            if (ok) loaded.output.format = *v;
        } else if (key == "sort_by_size") {
            auto v = read_bool(value);
            ok = v.has_value();
            if (ok) loaded.output.sort_by_size = *v;
        } else if (key == "sort_descending") {
            auto v = read_bool(value);
            ok = v.has_value();
            if (ok) loaded.output.sort_descending = *v;
        } else if (key == "exclude_std") {
            auto v = read_bool(value);
            ok = v.has_value();
            if (ok) loaded.output.exclude_std = *v;
        } else if (key == "min_size") {
            auto v = read_uint(value);
            ok = v.has_value();
            if (ok) loaded.output.min_size = *v;
        } else if (key == "name_filter") {
            loaded.output.name_filter = std::string(value);
        } else if (key == "html_title") {
            loaded.output.html_title = std::string(value);
        } else {
            log_warning("%s:%zu: unknown key '%.*s'", path.string().c_str(), line_no,
                        static_cast<int>(key.size()), key.data());
        }

        if (!ok) {
            log_error("%s:%zu: invalid value '%.*s' for '%.*s'", path.string().c_str(), line_no,
                      static_cast<int>(value.size()), value.data(),
                      static_cast<int>(key.size()), key.data());
            return false;
        }
    }

    options_ = std::move(loaded);
    dirty_ = false;
    log_debug("Loaded configuration from %s", path.string().c_str());
    return true;
}

bool Config::save(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        log_error("Cannot write configuration file %s", path.string().c_str());
        return false;
    }

    auto write_bool = [&](const char* key, bool val) {
        out << key << " = " << (val ? "true" : "false") << '\n';
    };

    auto write_uint = [&](const char* key, std::uint64_t val) {
        out << key << " = " << val << '\n';
    };

    auto write_string = [&](const char* key, const std::string& val) {
        out << key << " = " << val << '\n';
    };

    const ParseOptions& p = options_.parse;
    const OutputOptions& o = options_.output;

    out << "# typesizes configuration\n";
    write_uint("version", CONFIG_VERSION);

    write_string("wrapper_prefix", p.wrapper_prefix);
    write_uint("indent_unit", p.indent_unit);
    write_bool("strict_indentation", p.strict_indentation);
    write_string("header_recovery", header_recovery_name(p.header_recovery));
    write_uint("max_depth", p.max_depth);
    write_bool("debug_mode", p.debug_mode);

    write_string("format", output_format_name(o.format));
    write_bool("sort_by_size", o.sort_by_size);
    write_bool("sort_descending", o.sort_descending);
    write_bool("exclude_std", o.exclude_std);
    write_uint("min_size", o.min_size);
    write_string("name_filter", o.name_filter);
    write_string("html_title", o.html_title);

    out.flush();
    if (!out) {
        log_error("Failed writing configuration file %s", path.string().c_str());
        return false;
    }
    dirty_ = false;
    return true;
}

void Config::reset() {
    options_ = Options();
    dirty_ = true;
}

} // namespace typesizes
