#include <kmsdash/web/DashboardOptions.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace KD::Dashboard {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

constexpr std::int64_t kMaxInt64 = std::numeric_limits<std::int64_t>::max();

} // namespace

bool IsValidDashboardPort(int port) {
    return port > 0 && port <= 65535;
}

bool IsValidPortString(std::string_view port) {
    int parsed = 0;
    return parse_integer_in_range<int>(port, 1, 65535, parsed);
}

bool IsValidEnvAssignment(std::string_view assignment) {
    auto equals = assignment.find('=');
    return equals != std::string_view::npos && equals > 0;
}

auto DefaultServerArguments(DashboardOptions const& options) -> std::vector<std::string> {
    return {"pykms_Server.py", options.kms_host, options.kms_port, "-V", "INFO"};
}

auto ValidateDashboardOptions(DashboardOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidDashboardPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.kms_host.empty()) {
        return std::string{"--kms-host must not be empty"};
    }
    if (!IsValidPortString(options.kms_port)) {
        return std::string{"--kms-port must be within 1-65535"};
    }
    if (options.log_path.empty()) {
        return std::string{"--log-file must not be empty"};
    }
    if (options.launch_server && options.server_executable.empty()) {
        return std::string{"--server-exec must not be empty unless --no-server is given"};
    }
    for (auto const& assignment : options.server_env) {
        if (!IsValidEnvAssignment(assignment)) {
            return std::string{"--server-env expects KEY=VALUE, got '" + assignment + "'"};
        }
    }
    if (options.startup_grace_ms < 0) {
        return std::string{"--startup-grace-ms must be >= 0"};
    }
    if (options.stop_timeout_ms < 0) {
        return std::string{"--stop-timeout-ms must be >= 0"};
    }
    if (options.page_log_lines < 0) {
        return std::string{"--page-log-lines must be >= 0"};
    }
    if (options.api_log_lines < 0 || options.api_log_lines > kMaxApiLogLines) {
        return std::string{"--api-log-lines must be within 0-"} + std::to_string(kMaxApiLogLines);
    }
    if (options.tail_max_bytes <= 0) {
        return std::string{"--tail-max-bytes must be > 0"};
    }
    if (options.log_poll_interval_ms < 100) {
        return std::string{"--poll-interval-ms must be >= 100"};
    }
    return std::nullopt;
}

bool ApplyDashboardEnvOverrides(DashboardOptions& options) {
    auto apply_non_empty = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    if (!apply_non_empty("KMSDASH_HOST", options.host)) {
        return false;
    }

    if (!apply_env("KMSDASH_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "KMSDASH_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty("KMSDASH_KMS_HOST", options.kms_host)) {
        return false;
    }

    if (!apply_env("KMSDASH_KMS_PORT", [&](std::string_view value) {
            if (!IsValidPortString(value)) {
                std::cerr << "KMSDASH_KMS_PORT must be within 1-65535\n";
                return false;
            }
            options.kms_port = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty("KMSDASH_LOG_PATH", options.log_path)) {
        return false;
    }
    if (!apply_non_empty("KMSDASH_DATABASE", options.database_path)) {
        return false;
    }
    if (!apply_non_empty("KMSDASH_SERVER_EXEC", options.server_executable)) {
        return false;
    }

    // An empty working directory means "inherit the dashboard's".
    if (!apply_env("KMSDASH_SERVER_CWD", [&](std::string_view value) {
            options.server_cwd = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("KMSDASH_STARTUP_GRACE_MS", [&](std::string_view value) {
            std::int64_t parsed = options.startup_grace_ms;
            if (!parse_integer_in_range<std::int64_t>(value, 0, kMaxInt64, parsed)) {
                std::cerr << "KMSDASH_STARTUP_GRACE_MS must be >= 0\n";
                return false;
            }
            options.startup_grace_ms = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("KMSDASH_NO_SERVER", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "KMSDASH_NO_SERVER must be a boolean (1/0/true/false/yes/no/on/off)\n";
                return false;
            }
            options.launch_server = !*parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintDashboardUsage() {
    std::cout << "Usage: kmsdash_serve [options]\n"
              << "  --host <host>             Dashboard bind address (default 0.0.0.0)\n"
              << "  --port <port>             Dashboard bind port (default 5000)\n"
              << "  --kms-host <host>         KMS server bind address (default 0.0.0.0)\n"
              << "  --kms-port <port>         KMS server port (default 1688)\n"
              << "  --log-file <path>         Shared log file (default kms_logs.txt)\n"
              << "  --database <path>         Product database JSON (default kms_database.json)\n"
              << "  --server-exec <program>   KMS server executable (default python3)\n"
              << "  --server-arg <arg>        KMS server argument, repeatable (replaces the defaults)\n"
              << "  --server-cwd <dir>        KMS server working directory (default py-kms)\n"
              << "  --server-env <KEY=VALUE>  Extra KMS server environment entry, repeatable\n"
              << "  --startup-grace-ms <ms>   Delay after launching the server (default 2000)\n"
              << "  --stop-timeout-ms <ms>    SIGTERM to SIGKILL escalation delay (default 5000)\n"
              << "  --page-log-lines <n>      Log lines rendered into the page (default 50)\n"
              << "  --api-log-lines <n>       Log lines returned by /api/logs, at most 100 (default 100)\n"
              << "  --tail-max-bytes <n>      Upper bound on bytes read per tail (default 1048576)\n"
              << "  --poll-interval-ms <ms>   Browser log refresh cadence (default 2000)\n"
              << "  --no-server               Run the dashboard without launching the KMS server\n"
              << "  --help                    Show this help\n";
}

std::optional<DashboardOptions> ParseDashboardArguments(int argc, char** argv) {
    DashboardOptions options{};
    if (!ApplyDashboardEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto require_non_negative = [&](int& index, std::string_view flag, std::int64_t& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, 0, kMaxInt64, parsed)) {
            std::cerr << flag << " must be >= 0\n";
            return false;
        }
        target = parsed;
        return true;
    };

    auto require_non_empty = [&](int& index, std::string_view flag, std::string& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << flag << " must not be empty\n";
            return false;
        }
        target = std::string{*value};
        return true;
    };

    std::vector<std::string> explicit_args;
    bool                     args_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (!require_non_empty(i, "--host", options.host)) {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--kms-host") {
            if (!require_non_empty(i, "--kms-host", options.kms_host)) {
                return std::nullopt;
            }
        } else if (arg == "--kms-port") {
            if (auto value = require_value(i, "--kms-port")) {
                if (!IsValidPortString(*value)) {
                    std::cerr << "--kms-port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.kms_port = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--log-file") {
            if (!require_non_empty(i, "--log-file", options.log_path)) {
                return std::nullopt;
            }
        } else if (arg == "--database") {
            if (!require_non_empty(i, "--database", options.database_path)) {
                return std::nullopt;
            }
        } else if (arg == "--server-exec") {
            if (!require_non_empty(i, "--server-exec", options.server_executable)) {
                return std::nullopt;
            }
        } else if (arg == "--server-arg") {
            if (auto value = require_value(i, "--server-arg")) {
                explicit_args.emplace_back(*value);
                args_given = true;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--server-cwd") {
            if (auto value = require_value(i, "--server-cwd")) {
                options.server_cwd = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--server-env") {
            if (auto value = require_value(i, "--server-env")) {
                if (!IsValidEnvAssignment(*value)) {
                    std::cerr << "--server-env expects KEY=VALUE\n";
                    return std::nullopt;
                }
                options.server_env.emplace_back(*value);
            } else {
                return std::nullopt;
            }
        } else if (arg == "--startup-grace-ms") {
            if (!require_non_negative(i, "--startup-grace-ms", options.startup_grace_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--stop-timeout-ms") {
            if (!require_non_negative(i, "--stop-timeout-ms", options.stop_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--page-log-lines") {
            if (!require_non_negative(i, "--page-log-lines", options.page_log_lines)) {
                return std::nullopt;
            }
        } else if (arg == "--api-log-lines") {
            if (!require_non_negative(i, "--api-log-lines", options.api_log_lines)) {
                return std::nullopt;
            }
        } else if (arg == "--tail-max-bytes") {
            if (!require_non_negative(i, "--tail-max-bytes", options.tail_max_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--poll-interval-ms") {
            if (!require_non_negative(i, "--poll-interval-ms", options.log_poll_interval_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--no-server") {
            options.launch_server = false;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    options.server_args = args_given ? std::move(explicit_args) : DefaultServerArguments(options);

    if (auto error = ValidateDashboardOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace KD::Dashboard
