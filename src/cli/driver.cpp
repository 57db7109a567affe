//! # weft-json Driver
//!
//! ## Options
//!
//! | Flag | Configuration |
//! |------|---------------|
//! | `--lenient` | `is_lenient` |
//! | `--allow-comments` | `allow_comments` |
//! | `--allow-trailing-comma` | `allow_trailing_comma` |
//! | `--allow-special-floats` | `allow_special_floating_point_values` |
//! | `--pretty` | `pretty_print` |
//! | `--indent=<n>` | `pretty_print_indent` of `n` spaces (needs `--pretty`) |
//!
//! Logging flags (`--log-level=`, `--log-filter=`, `--log-file=`,
//! `--log-format=`, `-v`, `-q`) are read by `parse_log_options`.
//!
//! ## Return Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Document printed |
//! | 1 | Bad arguments, unreadable input, or malformed JSON |

#include "driver.hpp"

#include "weft/common.hpp"
#include "weft/json/json.hpp"
#include "weft/log/log.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace weft::cli {

namespace {

struct Options {
    json::JsonConfiguration config;
    std::optional<std::string> file;
    bool help = false;
    bool version = false;
};

void print_usage() {
    std::cout << "weft-json " << VERSION << "\n\n";
    std::cout << "Usage: weft-json [options] [file]\n\n";
    std::cout << "Reads JSON from <file> or stdin and prints it normalized.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --lenient               Accept unquoted keys and strings, single quotes\n";
    std::cout << "  --allow-comments        Skip // and /* */ comments\n";
    std::cout << "  --allow-trailing-comma  Accept [1,2,] and {\"a\":1,}\n";
    std::cout << "  --allow-special-floats  Accept and write NaN and Infinity\n";
    std::cout << "  --pretty                One item per line\n";
    std::cout << "  --indent=<n>            Indent pretty output by n spaces\n";
    std::cout << "  --log-level=<level>     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>     Per-module levels, e.g. json=trace,*=warn\n";
    std::cout << "  --log-file=<path>       Also log to a file\n";
    std::cout << "  -v, -vv, -vvv, -q       Raise or lower the log level\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show version\n";
}

auto is_log_option(const std::string& arg) -> bool {
    if (arg.starts_with("--log-") || arg == "-q" || arg == "--quiet" || arg == "--verbose") {
        return true;
    }
    return arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
           arg.find_first_not_of('v', 1) == std::string::npos;
}

/// Returns an error message for a bad argument.
auto parse_options(int argc, char* argv[], Options& options) -> std::optional<std::string> {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--lenient") {
            options.config.is_lenient = true;
        } else if (arg == "--allow-comments") {
            options.config.allow_comments = true;
        } else if (arg == "--allow-trailing-comma") {
            options.config.allow_trailing_comma = true;
        } else if (arg == "--allow-special-floats") {
            options.config.allow_special_floating_point_values = true;
        } else if (arg == "--pretty") {
            options.config.pretty_print = true;
        } else if (arg.starts_with("--indent=")) {
            std::string value = arg.substr(9);
            int width = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), width);
            if (ec != std::errc{} || ptr != value.data() + value.size() || width < 0) {
                return "Invalid indent width: " + value;
            }
            options.config.pretty_print_indent = std::string(static_cast<size_t>(width), ' ');
        } else if (is_log_option(arg)) {
            continue;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option: " + arg;
        } else if (options.file) {
            return "Only one input file can be given";
        } else {
            options.file = arg;
        }
    }
    return std::nullopt;
}

auto read_input(const std::optional<std::string>& file) -> std::string {
    std::stringstream buffer;
    if (!file || *file == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream stream(*file, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Cannot open file: " + *file);
    }
    buffer << stream.rdbuf();
    return buffer.str();
}

auto run(const Options& options) -> int {
    auto format = json::Json::make(options.config);
    if (is_err(format)) {
        std::cerr << "error: " << unwrap_err(format).to_string() << "\n";
        return 1;
    }

    std::string input;
    try {
        input = read_input(options.file);
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    WEFT_LOG_DEBUG("cli", "Read " << input.size() << " bytes from "
                                  << (options.file ? *options.file : "stdin"));

    auto parsed = unwrap(format).parse_to_json_element(input);
    if (is_err(parsed)) {
        const SerialError& error = unwrap_err(parsed);
        std::cerr << (options.file ? *options.file : "<stdin>") << ": " << error.to_string()
                  << "\n";
        return 1;
    }

    auto output = unwrap(format).encode_to_string(json::JsonElementSerializer{}, unwrap(parsed));
    if (is_err(output)) {
        std::cerr << "error: " << unwrap_err(output).to_string() << "\n";
        return 1;
    }
    std::cout << unwrap(output) << "\n";
    return 0;
}

} // namespace

} // namespace weft::cli

int weft_json_main(int argc, char* argv[]) {
    weft::log::Logger::init(weft::log::parse_log_options(argc, argv));

    weft::cli::Options options;
    if (auto problem = weft::cli::parse_options(argc, argv, options)) {
        std::cerr << "error: " << *problem << "\n";
        std::cerr << "Run 'weft-json --help' for usage.\n";
        return 1;
    }
    if (options.help) {
        weft::cli::print_usage();
        return 0;
    }
    if (options.version) {
        std::cout << "weft-json " << weft::VERSION << "\n";
        return 0;
    }
    return weft::cli::run(options);
}
