#pragma once

#include <kmsdash/catalog/CatalogExtractor.hpp>
#include <kmsdash/config/ServerConfig.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace KD::Dashboard {

struct PageModel {
    ServerConfig             config;
    ProductCatalog           catalog;
    std::vector<std::string> logs;
    std::int64_t             poll_interval_ms{2000};
};

[[nodiscard]] std::string EscapeHtml(std::string_view text);

// Rewrites every '<' in serialized JSON as \u003c so no closing tag, in any
// case or spelling, can end the inline script block early.
[[nodiscard]] std::string EscapeScriptPayload(std::string_view text);

// Self-contained page: server status with an update form, the product list with
// per-product commands, and a log panel that polls /api/logs.
[[nodiscard]] std::string BuildDashboardPage(PageModel const& model);

} // namespace KD::Dashboard
