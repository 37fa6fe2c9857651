#include <kmsdash/web/routing/PageController.hpp>

#include <kmsdash/web/DashboardOptions.hpp>
#include <kmsdash/web/DashboardPage.hpp>
#include <kmsdash/web/routing/HttpHelpers.hpp>

#include "httplib.h"

#include <cstddef>

namespace KD::Dashboard {

namespace detail {

void handle_dashboard_page_request(HttpRequestContext& ctx, httplib::Request const&, httplib::Response& res) {
    PageModel model;
    model.config           = refresh_server_status(ctx);
    model.catalog          = build_catalog(ctx, model.config);
    model.logs             = read_log_tail(ctx, static_cast<std::size_t>(ctx.options.page_log_lines));
    model.poll_interval_ms = ctx.options.log_poll_interval_ms;

    res.status = 200;
    res.set_header("Cache-Control", "no-store");
    res.set_content(BuildDashboardPage(model), "text/html; charset=utf-8");
}

void handle_healthz_request(HttpRequestContext&, httplib::Request const&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain; charset=utf-8");
}

} // namespace detail

auto PageController::Create(HttpRequestContext& ctx) -> std::unique_ptr<PageController> {
    return std::unique_ptr<PageController>(new PageController(ctx));
}

PageController::PageController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

PageController::~PageController() = default;

void PageController::register_routes(httplib::Server& server) {
    server.Get("/", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_dashboard_page_request(ctx_, req, res);
    });
    server.Get("/healthz", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_healthz_request(ctx_, req, res);
    });
}

} // namespace KD::Dashboard
