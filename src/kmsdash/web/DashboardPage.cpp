#include <kmsdash/web/DashboardPage.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <string>

namespace KD::Dashboard {

namespace {

constexpr std::string_view kStyle = R"css(
body { font-family: system-ui, sans-serif; margin: 0; background: #f5f6f8; color: #222; }
main { max-width: 960px; margin: 0 auto; padding: 1.5rem; }
.box { background: #fff; border-radius: 6px; padding: 1rem 1.25rem; margin-bottom: 1.25rem; box-shadow: 0 1px 3px rgba(0,0,0,0.1); }
.highlight-ip { background: #ffeb3b; font-weight: bold; padding: 0 0.25rem; }
.status { display: inline-block; padding: 0.1rem 0.5rem; border-radius: 4px; color: #fff; }
.status-running { background: #2e7d32; }
.status-stopped { background: #c62828; }
.status-unknown { background: #757575; }
.product-card { border: 1px solid #ddd; border-radius: 4px; margin: 0.75rem 0; padding: 0.75rem; cursor: pointer; }
.product-card h3 { margin: 0 0 0.5rem 0; }
.commands-section { display: none; margin-top: 0.75rem; }
.product-card.expanded .commands-section { display: block; }
.command-box { background: #f5f5f5; border-radius: 4px; padding: 0.5rem 0.75rem; margin: 0.5rem 0; }
.command-text, .gvlk-key { font-family: monospace; background: #fff; border: 1px solid #ddd; border-radius: 3px; padding: 0.25rem 0.5rem; word-break: break-all; }
.log-container { background: #000; color: #0f0; font-family: monospace; height: 300px; overflow-y: scroll; padding: 0.75rem; white-space: pre-wrap; }
)css";

constexpr std::string_view kScript = R"js(
(function () {
  const settings = JSON.parse(document.getElementById('kmsdash-settings').textContent);
  let refreshTimer = null;

  function renderLogs(lines) {
    const container = document.getElementById('log-container');
    container.textContent = '';
    for (const line of lines) {
      const row = document.createElement('div');
      row.textContent = line;
      container.appendChild(row);
    }
    container.scrollTop = container.scrollHeight;
  }

  window.refreshLogs = function () {
    fetch('/api/logs')
      .then(response => response.json())
      .then(renderLogs)
      .catch(error => console.error('log refresh failed', error));
  };

  window.toggleAutoRefresh = function () {
    const button = document.getElementById('auto-refresh');
    if (refreshTimer !== null) {
      clearInterval(refreshTimer);
      refreshTimer = null;
      button.textContent = 'Auto-Refresh: off';
      return;
    }
    refreshTimer = setInterval(window.refreshLogs, settings.poll_interval_ms);
    button.textContent = 'Auto-Refresh: on';
  };

  window.updateServerConfig = function () {
    const ip = document.getElementById('server-ip').value;
    const port = document.getElementById('server-port').value;
    fetch('/api/server/config', {
      method: 'POST',
      headers: {'Content-Type': 'application/json'},
      body: JSON.stringify({ip: ip, port: port})
    }).then(response => {
      if (response.ok) {
        location.reload();
      } else {
        response.json().then(body => alert(body.message || body.error));
      }
    });
  };

  document.addEventListener('click', event => {
    const copy = event.target.closest('[data-copy]');
    if (copy) {
      event.stopPropagation();
      navigator.clipboard.writeText(copy.dataset.copy);
      return;
    }
    const execute = event.target.closest('[data-command]');
    if (execute) {
      event.stopPropagation();
      fetch('/api/execute_command', {
        method: 'POST',
        headers: {'Content-Type': 'application/json'},
        body: JSON.stringify({command: execute.dataset.command, product: execute.dataset.product})
      }).then(response => response.json())
        .then(body => alert(body.result || body.error))
        .then(window.refreshLogs);
      return;
    }
    const card = event.target.closest('.product-card');
    if (card) {
      const wasExpanded = card.classList.contains('expanded');
      document.querySelectorAll('.product-card.expanded').forEach(other => other.classList.remove('expanded'));
      if (!wasExpanded) {
        card.classList.add('expanded');
      }
    }
  });

  const logs = document.getElementById('log-container');
  logs.scrollTop = logs.scrollHeight;
})();
)js";

void append_command(std::string& body,
                    std::string_view label,
                    std::string const& command,
                    std::string const& escaped_product) {
    auto escaped = EscapeHtml(command);
    body.append("<div class=\"command-box\"><p><strong>");
    body.append(label);
    body.append("</strong></p><div class=\"command-text\">");
    body.append(escaped);
    body.append("</div><button type=\"button\" data-copy=\"");
    body.append(escaped);
    body.append("\">Copy</button> <button type=\"button\" data-command=\"");
    body.append(escaped);
    body.append("\" data-product=\"");
    body.append(escaped_product);
    body.append("\">Execute</button></div>");
}

void append_status(std::string& body, ServerConfig const& config) {
    auto status = std::string{serverStatusToString(config.status)};
    body.append("<section class=\"box\"><h2>Server Status</h2>");
    body.append("<p><strong>IP Address:</strong> <span class=\"highlight-ip\">");
    body.append(EscapeHtml(config.effective_address()));
    body.append("</span></p><p><strong>Port:</strong> ");
    body.append(EscapeHtml(config.port));
    body.append("</p><p><strong>Status:</strong> <span class=\"status status-");
    body.append(status);
    body.append("\">");
    body.append(status);
    body.append("</span></p>");
    body.append("<p><input id=\"server-ip\" type=\"text\" placeholder=\"Server IP\" value=\"");
    body.append(EscapeHtml(config.bind_address));
    body.append("\"> <input id=\"server-port\" type=\"text\" placeholder=\"Port\" value=\"");
    body.append(EscapeHtml(config.port));
    body.append("\"> <button type=\"button\" onclick=\"updateServerConfig()\">Update</button></p></section>");
}

void append_products(std::string& body, ProductCatalog const& catalog) {
    body.append("<section class=\"box\"><h2>KMS Products (");
    body.append(std::to_string(catalog.size()));
    body.append(" available)</h2>");
    if (catalog.empty()) {
        body.append("<p>No product catalog available.</p>");
    } else {
        body.append("<p>Click on a product to view activation commands.</p>");
    }

    static constexpr std::array<std::string_view, 4> kLabels{
        "1. Install GVLK Key:", "2. Set KMS Server:", "3. Activate Windows:", "4. Check Status:"};

    for (auto const& entry : catalog) {
        auto name = EscapeHtml(entry.display_name);
        auto key  = EscapeHtml(entry.license_key);
        body.append("<div class=\"product-card\"><h3>");
        body.append(name);
        body.append("</h3><p><strong>GVLK Key:</strong> <span class=\"gvlk-key\">");
        body.append(key);
        body.append("</span> <button type=\"button\" data-copy=\"");
        body.append(key);
        body.append("\">Copy</button></p><div class=\"commands-section\"><h4>Activation Commands:</h4>");
        append_command(body, kLabels[0], entry.commands.install_key, name);
        append_command(body, kLabels[1], entry.commands.set_server, name);
        append_command(body, kLabels[2], entry.commands.activate, name);
        append_command(body, kLabels[3], entry.commands.check_status, name);
        body.append("</div></div>");
    }
    body.append("</section>");
}

void append_logs(std::string& body, std::vector<std::string> const& logs) {
    body.append("<section class=\"box\"><h2>Live Server Logs</h2><div class=\"log-container\" id=\"log-container\">");
    for (auto const& line : logs) {
        body.append("<div>");
        body.append(EscapeHtml(line));
        body.append("</div>");
    }
    body.append("</div><p><button type=\"button\" onclick=\"refreshLogs()\">Refresh Logs</button> ");
    body.append("<button type=\"button\" id=\"auto-refresh\" onclick=\"toggleAutoRefresh()\">Auto-Refresh: off</button></p></section>");
}

} // namespace

std::string EscapeHtml(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&#39;");
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

std::string EscapeScriptPayload(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        if (ch == '<') {
            escaped.append("\\u003c");
        } else {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

std::string BuildDashboardPage(PageModel const& model) {
    nlohmann::json settings{{"poll_interval_ms", model.poll_interval_ms}};

    std::string body;
    body.reserve(16 * 1024);
    body.append("<!DOCTYPE html>\n<html lang=\"en\"><head><meta charset=\"utf-8\">");
    body.append("<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">");
    body.append("<meta http-equiv=\"Cache-Control\" content=\"no-store\">");
    body.append("<title>KMS Server Dashboard</title><style>");
    body.append(kStyle);
    body.append("</style><script type=\"application/json\" id=\"kmsdash-settings\">");
    body.append(EscapeScriptPayload(settings.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
    body.append("</script></head><body><main><h1>KMS Server Dashboard</h1>");

    append_status(body, model.config);
    append_products(body, model.catalog);
    append_logs(body, model.logs);

    body.append("</main><script>");
    body.append(kScript);
    body.append("</script></body></html>");
    return body;
}

} // namespace KD::Dashboard
