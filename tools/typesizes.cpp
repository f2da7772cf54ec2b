/**
 * @file typesizes.cpp
 * @brief Command-line front end for the type layout parser
 *
 * Reads the output of a `-Zprint-type-sizes` compiler run and prints the
 * reconstructed layouts as an indented tree or an HTML page:
 *
 *   cargo +nightly rustc -- -Zprint-type-sizes | typesizes -s -f html -o sizes.html
 *
 * Exit status: 0 on success, 1 on a fatal parse error, 2 on usage or I/O errors.
 */

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <typesizes/config.hpp>
#include <typesizes/layout_parser.hpp>
#include <typesizes/layout_renderer.hpp>
#include <typesizes/line_source.hpp>
#include <typesizes/utils.hpp>

using namespace typesizes;

namespace {

constexpr int EXIT_PARSE_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    std::printf(
        "Usage: %s [options] [input-file]\n"
        "\n"
        "Show type sizes from `-Zprint-type-sizes` compiler output.\n"
        "Reads stdin when no input file is given.\n"
        "\n"
        "Options:\n"
        "  -f, --format text|html     output format (default: text)\n"
        "  -o, --output FILE          write output to FILE instead of stdout\n"
        "  -s, --sort-size            sort types by size\n"
        "  -r, --reverse              with --sort-size, largest first\n"
        "      --exclude-std          drop std::, core:: and alloc:: types\n"
        "      --min-size N           drop types smaller than N bytes\n"
        "      --filter TEXT          keep only types whose name contains TEXT\n"
        "      --indent N             indentation unit (default: 4)\n"
        "      --strict-indent        reject misaligned indentation\n"
        "      --legacy-recovery      drop remaining input after a bad type header\n"
        "  -c, --config FILE          load options from FILE\n"
        "      --save-config FILE     write the effective options to FILE and exit\n"
        "  -v, --verbose              debug logging to stderr\n"
        "  -h, --help                 show this help\n",
        argv0);
}

struct CliArgs {
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> save_config;
    bool help = false;
};

std::optional<std::uint64_t> parse_count(const char* text) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || text[0] == '-') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(v);
}

/// Apply command-line flags on top of the loaded configuration.
/// Throws std::invalid_argument on bad usage.
CliArgs parse_args(int argc, char** argv, Options& opts) {
    CliArgs args;

    auto value_of = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("missing value for ") + argv[i]);
        }
        return argv[++i];
    };

    auto count_of = [&](int& i) -> std::uint64_t {
        const char* flag = argv[i];
        const char* text = value_of(i);
        auto v = parse_count(text);
        if (!v) {
            throw std::invalid_argument(std::string("invalid number for ") + flag + ": " + text);
        }
        return *v;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-f" || arg == "--format") {
            const std::string fmt = value_of(i);
            if (fmt == "text") {
                opts.output.format = OutputFormat::Text;
            } else if (fmt == "html") {
                opts.output.format = OutputFormat::Html;
            } else {
                throw std::invalid_argument("unknown format: " + fmt);
            }
        } else if (arg == "-o" || arg == "--output") {
            args.output = value_of(i);
        } else if (arg == "-s" || arg == "--sort-size") {
            opts.output.sort_by_size = true;
        } else if (arg == "-r" || arg == "--reverse") {
            opts.output.sort_descending = true;
        } else if (arg == "--exclude-std") {
            opts.output.exclude_std = true;
        } else if (arg == "--min-size") {
            opts.output.min_size = count_of(i);
        } else if (arg == "--filter") {
            opts.output.name_filter = value_of(i);
        } else if (arg == "--indent") {
            const std::uint64_t unit = count_of(i);
            if (unit == 0) {
                throw std::invalid_argument("--indent must be positive");
            }
            opts.parse.indent_unit = static_cast<std::size_t>(unit);
        } else if (arg == "--strict-indent") {
            opts.parse.strict_indentation = true;
        } else if (arg == "--legacy-recovery") {
            opts.parse.header_recovery = HeaderRecovery::DropRemainder;
        } else if (arg == "-c" || arg == "--config") {
            (void)value_of(i);    // Loaded before the other flags
        } else if (arg == "--save-config") {
            args.save_config = value_of(i);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.parse.debug_mode = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw std::invalid_argument("unknown option: " + arg);
        } else if (args.input) {
            throw std::invalid_argument("more than one input file given");
        } else {
            args.input = arg;
        }
    }

    return args;
}

/// Config file named by -c/--config, if any
std::optional<std::string> find_config_arg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Config& cfg = Config::instance();

    if (auto path = find_config_arg(argc, argv)) {
        if (!cfg.load(*path)) {
            std::fprintf(stderr, "error: cannot load configuration from %s\n", path->c_str());
            return EXIT_USAGE;
        }
    }

    CliArgs args;
    try {
        args = parse_args(argc, argv, cfg.mutable_options());
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        std::fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
        return EXIT_USAGE;
    }

    if (args.help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (args.save_config) {
        return cfg.save(*args.save_config) ? EXIT_SUCCESS : EXIT_USAGE;
    }

    const Options& opts = cfg.options();

    std::vector<std::string> lines;
    try {
        if (args.input && *args.input != "-") {
            lines = read_file_lines(*args.input);
        } else {
            lines = read_lines(std::cin);
        }
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return EXIT_USAGE;
    }

    const LayoutParser parser(opts.parse);
    ParseResult result = parser.parse(lines);

    if (result.is_error()) {
        std::fprintf(stderr, "error: line %zu: %s (%s)\n  > %s\n",
                     result.error_line, result.error_message.c_str(),
                     error_kind_string(result.error_kind), result.error_text.c_str());
        return EXIT_PARSE_ERROR;
    }

    log_debug("%s", result.summary().c_str());

    std::vector<TypeRecord> types = std::move(result.types);
    filter_types(types, make_filter(opts.output));
    if (opts.output.sort_by_size) {
        sort_by_size(types, opts.output.sort_descending);
    }

    const LayoutRenderer renderer(opts.output);

    if (args.output) {
        std::ofstream out(*args.output, std::ios::trunc);
        if (!out) {
            std::fprintf(stderr, "error: cannot write %s\n", args.output->c_str());
            return EXIT_USAGE;
        }
        renderer.write(out, types);
        if (!out.flush()) {
            std::fprintf(stderr, "error: failed writing %s\n", args.output->c_str());
            return EXIT_USAGE;
        }
        log_info("%s output saved to: %s", output_format_name(opts.output.format), args.output->c_str());
    } else {
        renderer.write(std::cout, types);
    }

    return EXIT_SUCCESS;
}
