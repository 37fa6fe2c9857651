#include <kmsdash/web/routing/ApiController.hpp>

#include <kmsdash/config/ConfigStore.hpp>
#include <kmsdash/core/Error.hpp>
#include <kmsdash/logsink/LogSink.hpp>
#include <kmsdash/web/DashboardOptions.hpp>
#include <kmsdash/web/TimeUtils.hpp>
#include <kmsdash/web/routing/HttpHelpers.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace KD::Dashboard {

namespace {

using json = nlohmann::json;

// Reads an optional string member. Absent or null yields the fallback; any other
// non-string value is rejected.
auto read_string_field(json const& payload, char const* key, std::string_view fallback)
    -> std::optional<std::string> {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::string{fallback};
    }
    if (!it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void append_audit_line(HttpRequestContext& ctx, std::string const& line) {
    auto status = ctx.log_sink.append_line(line);
    if (!status) {
        log_error(ctx, "[kmsdash] Error logging command: " + describeError(status.error()));
    }
}

} // namespace

namespace detail {

void handle_logs_request(HttpRequestContext& ctx, httplib::Request const&, httplib::Response& res) {
    auto lines = read_log_tail(ctx, static_cast<std::size_t>(ctx.options.api_log_lines));
    write_json_response(res, json(lines), 200);
}

void handle_get_config_request(HttpRequestContext& ctx, httplib::Request const&, httplib::Response& res) {
    write_json_response(res, config_to_json(refresh_server_status(ctx)), 200);
}

void handle_post_config_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res) {
    auto payload = read_json_object(req, res);
    if (payload.is_discarded()) {
        return;
    }

    auto ip = read_string_field(payload, "ip", kWildcardBindAddress);
    if (!ip) {
        respond_config_validation(res, "ip must be a string");
        return;
    }
    auto port = read_string_field(payload, "port", kDefaultKmsPort);
    if (!port) {
        respond_config_validation(res, "port must be a string");
        return;
    }

    auto snapshot = ctx.config_store.set(std::move(*ip), std::move(*port));
    write_json_response(res, config_to_json(snapshot), 200);
}

void handle_execute_command_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res) {
    auto payload = read_json_object(req, res);
    if (payload.is_discarded()) {
        return;
    }

    auto command = read_string_field(payload, "command", "");
    if (!command || command->empty()) {
        write_json_response(res, json{{"error", "No command provided"}}, 400);
        return;
    }
    auto product = read_string_field(payload, "product", "").value_or(std::string{});

    // Audit only: the command string is recorded and echoed, never run.
    append_audit_line(ctx,
                      "[" + format_timestamp(std::chrono::system_clock::now()) + "] Executing: " + *command
                          + " for product: " + product);
    std::string result = "Command executed: " + *command;
    append_audit_line(ctx, "[" + format_timestamp(std::chrono::system_clock::now()) + "] Result: " + result);

    write_json_response(res,
                        json{{"success", true},
                             {"command", *command},
                             {"result", result},
                             {"product", product}},
                        200);
}

void handle_products_request(HttpRequestContext& ctx, httplib::Request const&, httplib::Response& res) {
    auto config  = refresh_server_status(ctx);
    auto catalog = build_catalog(ctx, config);
    write_json_response(res, catalog_to_json(catalog), 200);
}

} // namespace detail

auto ApiController::Create(HttpRequestContext& ctx) -> std::unique_ptr<ApiController> {
    return std::unique_ptr<ApiController>(new ApiController(ctx));
}

ApiController::ApiController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

ApiController::~ApiController() = default;

void ApiController::register_routes(httplib::Server& server) {
    server.Get("/api/logs", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_logs_request(ctx_, req, res);
    });
    server.Get("/api/server/config", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_get_config_request(ctx_, req, res);
    });
    server.Post("/api/server/config", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_post_config_request(ctx_, req, res);
    });
    server.Post("/api/execute_command", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_execute_command_request(ctx_, req, res);
    });
    server.Get("/api/products", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_products_request(ctx_, req, res);
    });
}

} // namespace KD::Dashboard
