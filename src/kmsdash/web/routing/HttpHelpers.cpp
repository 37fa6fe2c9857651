#include <kmsdash/web/routing/HttpHelpers.hpp>

#include <kmsdash/catalog/ProductDatabase.hpp>
#include <kmsdash/config/ConfigStore.hpp>
#include <kmsdash/core/Error.hpp>
#include <kmsdash/log/TaggedLogger.hpp>
#include <kmsdash/logsink/LogSink.hpp>
#include <kmsdash/supervisor/ProcessSupervisor.hpp>
#include <kmsdash/web/DashboardOptions.hpp>

#include "httplib.h"

#include <iostream>
#include <string>
#include <utility>

namespace KD::Dashboard {

void log_info(HttpRequestContext const& ctx, std::string_view message) {
    if (ctx.log_hooks.info) {
        ctx.log_hooks.info(message);
        return;
    }
    std::cout << message << '\n';
}

void log_error(HttpRequestContext const& ctx, std::string_view message) {
    if (ctx.log_hooks.error) {
        ctx.log_hooks.error(message);
        return;
    }
    std::cerr << message << '\n';
}

void write_json_response(httplib::Response&    res,
                         nlohmann::json const& payload,
                         int                   status,
                         bool                  no_store) {
    res.status = status;
    // Child log output is not guaranteed to be UTF-8.
    res.set_content(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "bad_request"},
                                       {"message", message}},
                        400);
}

void respond_config_validation(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", errorCodeToString(Error::Code::ConfigValidation)},
                                       {"message", message}},
                        400);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "internal"},
                                       {"message", message}},
                        500);
}

void respond_payload_too_large(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "payload_too_large"},
                                       {"message", "Request body exceeds 1 MiB limit"}},
                        413);
}

void respond_unsupported_media_type(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "unsupported_media_type"},
                                       {"message", "Expected Content-Type: application/json"}},
                        415);
}

auto read_json_object(httplib::Request const& req, httplib::Response& res) -> nlohmann::json {
    auto content_type = req.get_header_value("Content-Type");
    if (content_type.find("application/json") == std::string::npos) {
        respond_unsupported_media_type(res);
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    if (req.body.size() > kMaxApiPayloadBytes) {
        respond_payload_too_large(res);
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    if (req.body.empty()) {
        respond_bad_request(res, "body must not be empty");
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }

    auto payload = nlohmann::json::parse(req.body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        respond_bad_request(res, "body must be a JSON object");
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return payload;
}

auto refresh_server_status(HttpRequestContext& ctx) -> ServerConfig {
    auto previous = ctx.config_store.get();
    switch (ctx.supervisor.poll(ctx.child)) {
    case ProcessState::Running:
        return ctx.config_store.set_status(ServerStatus::Running);
    case ProcessState::Crashed:
        if (previous.status == ServerStatus::Running) {
            std::string message = "[supervisor] KMS server exited unexpectedly";
            if (auto code = ctx.child.exit_code()) {
                message += " with exit code " + std::to_string(*code);
            } else if (auto signal = ctx.child.term_signal()) {
                message += " on signal " + std::to_string(*signal);
            }
            log_error(ctx, message);
        }
        return ctx.config_store.set_status(ServerStatus::Stopped);
    case ProcessState::Stopped:
        return ctx.config_store.set_status(ServerStatus::Stopped);
    case ProcessState::NotStarted:
        break;
    }
    return previous;
}

auto build_catalog(HttpRequestContext& ctx, ServerConfig const& config) -> ProductCatalog {
    auto database = LoadProductDatabase(ctx.options.database_path);
    if (!database) {
        log_error(ctx,
                  "[catalog] No product catalog available from " + ctx.options.database_path + ": "
                      + describeError(database.error()));
        return {};
    }

    CatalogLogHooks hooks{
        .skipped = [&ctx](Error const& error) {
            log_error(ctx, "[catalog] Skipped malformed entry: " + describeError(error));
        }};
    auto catalog = ExtractCatalog(*database, config, CatalogSchema{}, hooks);
    kd_log("catalog holds " + std::to_string(catalog.size()) + " products", "Catalog");
    return catalog;
}

auto read_log_tail(HttpRequestContext& ctx, std::size_t max_lines) -> std::vector<std::string> {
    auto lines = ctx.log_sink.tail(max_lines);
    if (!lines) {
        log_error(ctx, "[kmsdash] Error reading logs: " + describeError(lines.error()));
        return {};
    }
    return std::move(*lines);
}

auto config_to_json(ServerConfig const& config) -> nlohmann::json {
    return nlohmann::json{{"ip", config.bind_address},
                          {"port", config.port},
                          {"status", serverStatusToString(config.status)},
                          {"display_ip", config.display_address}};
}

auto commands_to_json(CommandSet const& commands) -> nlohmann::json {
    return nlohmann::json{{"install_key", commands.install_key},
                          {"set_server", commands.set_server},
                          {"activate", commands.activate},
                          {"check_status", commands.check_status}};
}

auto catalog_to_json(ProductCatalog const& catalog) -> nlohmann::json {
    auto products = nlohmann::json::object();
    for (auto const& entry : catalog) {
        products[entry.display_name] = nlohmann::json{{"gvlk", entry.license_key},
                                                      {"commands", commands_to_json(entry.commands)}};
    }
    return products;
}

} // namespace KD::Dashboard
