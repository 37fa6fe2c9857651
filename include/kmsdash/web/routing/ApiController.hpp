#pragma once

#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace KD::Dashboard {

struct HttpRequestContext;

namespace detail {

void handle_logs_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_get_config_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_post_config_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_execute_command_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_products_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);

} // namespace detail

// JSON endpoints under /api polled and driven by the dashboard page.
class ApiController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<ApiController>;

    void register_routes(httplib::Server& server);

    ~ApiController();

private:
    explicit ApiController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;
};

} // namespace KD::Dashboard
