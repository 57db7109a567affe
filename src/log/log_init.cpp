//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the WEFT_LOG
//! environment variable into a LogConfig.
//!
//! | Argument              | Effect                                   |
//! |-----------------------|------------------------------------------|
//! | `--log-level=<lvl>`   | Global level                             |
//! | `--log-filter=<spec>` | Module filter, e.g. `json=trace,*=warn`  |
//! | `--log-file=<path>`   | Also write to a file                     |
//! | `--log-format=json`   | One JSON object per record               |
//! | `-v`, `-vv`, `-vvv`   | Info, Debug, Trace                       |
//! | `-q`, `--quiet`       | Error                                    |
//!
//! An explicit level or filter on the command line wins over `WEFT_LOG`.
//! Unrecognized level names fall back to Info.

#include "weft/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace weft::log {

namespace {

auto option_value(std::string_view arg, std::string_view name) -> std::optional<std::string_view> {
    if (!arg.starts_with(name)) {
        return std::nullopt;
    }
    return arg.substr(name.size());
}

auto verbosity(std::string_view arg) -> int {
    if (arg == "--verbose") {
        return 1;
    }
    if (arg.size() >= 2 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos) {
        return static_cast<int>(arg.size() - 1);
    }
    return 0;
}

auto level_for_verbosity(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    config.level = LogLevel::Warn;

    std::optional<LogLevel> explicit_level;
    bool has_filter = false;
    int max_verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto value = option_value(arg, "--log-level=")) {
            explicit_level = parse_level(*value).value_or(LogLevel::Info);
        } else if (auto value = option_value(arg, "--log-filter=")) {
            config.filter_spec = std::string(*value);
            has_filter = true;
        } else if (auto value = option_value(arg, "--log-file=")) {
            config.log_file = std::string(*value);
        } else if (auto value = option_value(arg, "--log-format=")) {
            config.format = (*value == "json" || *value == "JSON") ? LogFormat::JSON
                                                                   : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else {
            max_verbosity = std::max(max_verbosity, verbosity(arg));
        }
    }

    if (!explicit_level && max_verbosity > 0) {
        explicit_level = level_for_verbosity(max_verbosity);
    }

    if (explicit_level) {
        config.level = *explicit_level;
        return config;
    }
    if (has_filter) {
        return config;
    }

    const char* env = std::getenv("WEFT_LOG");
    std::string_view value = env ? env : "";
    if (value.empty()) {
        return config;
    }
    // "json=trace,*=warn" or "json,dynamic" is a filter, anything else a level
    if (value.find('=') != std::string_view::npos || value.find(',') != std::string_view::npos) {
        config.filter_spec = std::string(value);
    } else {
        config.level = parse_level(value).value_or(LogLevel::Info);
    }
    return config;
}

} // namespace weft::log
