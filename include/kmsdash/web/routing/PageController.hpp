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

void handle_dashboard_page_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_healthz_request(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);

} // namespace detail

class PageController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<PageController>;

    void register_routes(httplib::Server& server);

    ~PageController();

private:
    explicit PageController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;
};

} // namespace KD::Dashboard
