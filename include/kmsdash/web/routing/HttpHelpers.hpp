#pragma once

#include <kmsdash/catalog/CatalogExtractor.hpp>
#include <kmsdash/config/ServerConfig.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace KD {
class ConfigStore;
class LogSink;
class ProcessHandle;
class ProcessSupervisor;
} // namespace KD

namespace KD::Dashboard {

struct DashboardOptions;

inline constexpr std::size_t kMaxApiPayloadBytes = 1024 * 1024;

struct DashboardLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

// Everything a route handler may touch. Owned by the caller of the server loop.
struct HttpRequestContext {
    DashboardOptions const&  options;
    ConfigStore&             config_store;
    LogSink&                 log_sink;
    ProcessSupervisor&       supervisor;
    ProcessHandle&           child;
    DashboardLogHooks const& log_hooks;
};

void log_info(HttpRequestContext const& ctx, std::string_view message);
void log_error(HttpRequestContext const& ctx, std::string_view message);

void write_json_response(httplib::Response&    res,
                         nlohmann::json const& payload,
                         int                   status,
                         bool                  no_store = true);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_config_validation(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res);
void respond_unsupported_media_type(httplib::Response& res);

// Parses a POST body as a JSON object. On failure the response has already been
// written and the returned value is discarded.
auto read_json_object(httplib::Request const& req, httplib::Response& res) -> nlohmann::json;

// Polls the supervised child and folds its state into the config status.
auto refresh_server_status(HttpRequestContext& ctx) -> ServerConfig;

// Loads the product database and flattens it. Any failure degrades to an empty
// catalog and is reported through the error hook.
auto build_catalog(HttpRequestContext& ctx, ServerConfig const& config) -> ProductCatalog;

// Tail of the shared log, or an empty list when it cannot be read.
auto read_log_tail(HttpRequestContext& ctx, std::size_t max_lines) -> std::vector<std::string>;

auto config_to_json(ServerConfig const& config) -> nlohmann::json;
auto commands_to_json(CommandSet const& commands) -> nlohmann::json;
auto catalog_to_json(ProductCatalog const& catalog) -> nlohmann::json;

} // namespace KD::Dashboard
