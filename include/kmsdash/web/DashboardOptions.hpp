#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KD::Dashboard {

// Upper bound on lines a single /api/logs response may carry.
inline constexpr std::int64_t kMaxApiLogLines = 100;

struct DashboardOptions {
    std::string host{"0.0.0.0"};
    int         port{5000};
    std::string kms_host{"0.0.0.0"};
    std::string kms_port{"1688"};
    std::string log_path{"kms_logs.txt"};
    std::string database_path{"kms_database.json"};
    std::string server_executable{"python3"};
    std::vector<std::string> server_args; // empty: DefaultServerArguments()
    std::string server_cwd{"py-kms"};
    std::vector<std::string> server_env;
    std::int64_t startup_grace_ms{2000};
    std::int64_t stop_timeout_ms{5000};
    std::int64_t page_log_lines{50};
    std::int64_t api_log_lines{100};
    std::int64_t tail_max_bytes{1024 * 1024};
    std::int64_t log_poll_interval_ms{2000};
    bool        launch_server{true};
    bool        show_help{false};
};

auto ParseDashboardArguments(int argc, char** argv) -> std::optional<DashboardOptions>;

void PrintDashboardUsage();

bool ApplyDashboardEnvOverrides(DashboardOptions& options);

auto ValidateDashboardOptions(DashboardOptions const& options) -> std::optional<std::string>;

// `pykms_Server.py <kms_host> <kms_port> -V INFO`
auto DefaultServerArguments(DashboardOptions const& options) -> std::vector<std::string>;

bool IsValidDashboardPort(int port);
bool IsValidPortString(std::string_view port);
bool IsValidEnvAssignment(std::string_view assignment);

} // namespace KD::Dashboard
