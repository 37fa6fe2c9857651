#include <doctest/doctest.h>

#include "../KmsDashTestHelper.hpp"

#include <kmsdash/config/ConfigStore.hpp>
#include <kmsdash/logsink/LogSink.hpp>
#include <kmsdash/supervisor/ProcessSupervisor.hpp>
#include <kmsdash/web/DashboardOptions.hpp>
#include <kmsdash/web/routing/ApiController.hpp>
#include <kmsdash/web/routing/HttpHelpers.hpp>
#include <kmsdash/web/routing/PageController.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <string_view>
#include <vector>

using namespace KD;
using namespace KD::Dashboard;
using json = nlohmann::json;

namespace {

constexpr std::string_view kDatabase = R"json(
{"KmsItems": [{"SkuItems": [
  {"DisplayName": "Windows 10 Pro", "Gvlk": "W269N-WFGWX-YVC9B-4J6C9-T83GX"},
  {"DisplayName": "<script>alert(1)</script>", "Gvlk": "EVIL"}
]}]}
)json";

struct DashboardFixture {
    DashboardFixture()
        : sink{dir.file("kms_logs.txt")}
        , store{initial_config(), &sink} {
        options.log_path      = dir.file("kms_logs.txt").string();
        options.database_path = dir.file("kms_database.json").string();
        options.launch_server = false;
        hooks.info            = [this](std::string_view message) { infos.emplace_back(message); };
        hooks.error           = [this](std::string_view message) { errors.emplace_back(message); };
    }

    static auto initial_config() -> ServerConfig {
        ServerConfig config;
        config.display_address = "10.0.0.5";
        return config;
    }

    auto context() -> HttpRequestContext {
        return HttpRequestContext{
            .options      = options,
            .config_store = store,
            .log_sink     = sink,
            .supervisor   = supervisor,
            .child        = child,
            .log_hooks    = hooks,
        };
    }

    static auto json_request(std::string body) -> httplib::Request {
        httplib::Request req;
        req.set_header("Content-Type", "application/json");
        req.body = std::move(body);
        return req;
    }

    auto log_lines() -> std::vector<std::string> {
        auto lines = sink.tail(100);
        return lines ? *lines : std::vector<std::string>{};
    }

    TempDir                  dir;
    DashboardOptions         options;
    LogSink                  sink;
    ConfigStore              store;
    ProcessSupervisor        supervisor;
    ProcessHandle            child;
    DashboardLogHooks        hooks;
    std::vector<std::string> infos;
    std::vector<std::string> errors;
};

} // namespace

TEST_SUITE("web.api") {

TEST_CASE_FIXTURE(DashboardFixture, "Execute command with an empty command is rejected without auditing") {
    auto ctx = context();
    auto req = json_request(R"({"command": "", "product": "Windows 10 Pro"})");
    httplib::Response res;

    detail::handle_execute_command_request(ctx, req, res);

    CHECK(res.status == 400);
    CHECK(json::parse(res.body)["error"] == "No command provided");
    CHECK(log_lines().empty());
}

TEST_CASE_FIXTURE(DashboardFixture, "Execute command records and echoes without running anything") {
    auto ctx = context();
    auto req = json_request(R"({"command": "slmgr /ato", "product": "Windows 10 Pro"})");
    httplib::Response res;

    detail::handle_execute_command_request(ctx, req, res);

    REQUIRE(res.status == 200);
    auto body = json::parse(res.body);
    CHECK(body["success"] == true);
    CHECK(body["command"] == "slmgr /ato");
    CHECK(body["result"] == "Command executed: slmgr /ato");
    CHECK(body["product"] == "Windows 10 Pro");
    CHECK(res.get_header_value("Cache-Control") == "no-store");

    auto lines = log_lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].find("] Executing: slmgr /ato for product: Windows 10 Pro") != std::string::npos);
    CHECK(lines[1].find("] Result: Command executed: slmgr /ato") != std::string::npos);
    CHECK(lines[0].front() == '[');
}

TEST_CASE_FIXTURE(DashboardFixture, "Execute command requires a JSON object body") {
    auto ctx = context();

    SUBCASE("Wrong content type") {
        httplib::Request req;
        req.set_header("Content-Type", "text/plain");
        req.body = R"({"command": "slmgr /ato"})";
        httplib::Response res;
        detail::handle_execute_command_request(ctx, req, res);
        CHECK(res.status == 415);
    }
    SUBCASE("Array body") {
        auto              req = json_request("[1, 2]");
        httplib::Response res;
        detail::handle_execute_command_request(ctx, req, res);
        CHECK(res.status == 400);
    }
    SUBCASE("Oversized body") {
        auto              req = json_request(std::string(kMaxApiPayloadBytes + 1, ' '));
        httplib::Response res;
        detail::handle_execute_command_request(ctx, req, res);
        CHECK(res.status == 413);
    }
    CHECK(log_lines().empty());
}

TEST_CASE_FIXTURE(DashboardFixture, "Config update defaults missing fields and audits the change") {
    auto ctx = context();
    auto req = json_request(R"({"ip": "192.168.1.1"})");
    httplib::Response res;

    detail::handle_post_config_request(ctx, req, res);

    REQUIRE(res.status == 200);
    auto body = json::parse(res.body);
    CHECK(body["ip"] == "192.168.1.1");
    CHECK(body["port"] == "1688");
    CHECK(body["display_ip"] == "10.0.0.5");
    CHECK(body["status"] == "unknown");

    CHECK(store.get().bind_address == "192.168.1.1");
    CHECK(log_lines() == std::vector<std::string>{"Server configuration changed to 192.168.1.1:1688"});

    auto empty = json_request("{}");
    httplib::Response reset;
    detail::handle_post_config_request(ctx, empty, reset);
    CHECK(json::parse(reset.body)["ip"] == "0.0.0.0");
}

TEST_CASE_FIXTURE(DashboardFixture, "Config update rejects non-string values") {
    auto ctx = context();
    auto req = json_request(R"({"ip": "1.2.3.4", "port": 1688})");
    httplib::Response res;

    detail::handle_post_config_request(ctx, req, res);

    CHECK(res.status == 400);
    CHECK(json::parse(res.body)["error"] == "config_validation");
    CHECK(store.get().bind_address == "0.0.0.0");
    CHECK(log_lines().empty());
}

TEST_CASE_FIXTURE(DashboardFixture, "Config read reflects the latest write") {
    auto ctx = context();
    store.set("172.16.0.2", "1689");

    httplib::Request  req;
    httplib::Response res;
    detail::handle_get_config_request(ctx, req, res);

    REQUIRE(res.status == 200);
    auto body = json::parse(res.body);
    CHECK(body["ip"] == "172.16.0.2");
    CHECK(body["port"] == "1689");
}

TEST_CASE_FIXTURE(DashboardFixture, "Logs endpoint returns at most the configured tail") {
    for (int i = 0; i < 150; ++i) {
        REQUIRE(sink.append_line("entry " + std::to_string(i)).has_value());
    }
    auto ctx = context();

    httplib::Request  req;
    httplib::Response res;
    detail::handle_logs_request(ctx, req, res);

    REQUIRE(res.status == 200);
    auto body = json::parse(res.body);
    REQUIRE(body.is_array());
    CHECK(body.size() == 100);
    CHECK(body.front() == "entry 50");
    CHECK(body.back() == "entry 149");
}

TEST_CASE_FIXTURE(DashboardFixture, "Logs endpoint on a missing log is an empty array") {
    auto ctx = context();
    httplib::Request  req;
    httplib::Response res;
    detail::handle_logs_request(ctx, req, res);

    CHECK(res.status == 200);
    CHECK(res.body == "[]");
}

TEST_CASE_FIXTURE(DashboardFixture, "Products endpoint follows config changes") {
    write_text_file(dir.file("kms_database.json"), kDatabase);
    auto ctx = context();

    httplib::Request  req;
    httplib::Response res;
    detail::handle_products_request(ctx, req, res);
    REQUIRE(res.status == 200);
    auto body = json::parse(res.body);
    REQUIRE(body.contains("Windows 10 Pro"));
    CHECK(body["Windows 10 Pro"]["gvlk"] == "W269N-WFGWX-YVC9B-4J6C9-T83GX");
    CHECK(body["Windows 10 Pro"]["commands"]["set_server"] == "slmgr /skms 10.0.0.5:1688");

    store.set("192.168.1.1", "1700");
    httplib::Response updated;
    detail::handle_products_request(ctx, req, updated);
    CHECK(json::parse(updated.body)["Windows 10 Pro"]["commands"]["set_server"] == "slmgr /skms 192.168.1.1:1700");
}

TEST_CASE_FIXTURE(DashboardFixture, "Missing product database degrades to an empty catalog") {
    auto ctx = context();
    httplib::Request  req;
    httplib::Response res;
    detail::handle_products_request(ctx, req, res);

    CHECK(res.status == 200);
    CHECK(res.body == "{}");
    REQUIRE(errors.size() == 1);
    CHECK(errors.front().find("[catalog]") == 0);
}

TEST_CASE_FIXTURE(DashboardFixture, "Dashboard page renders catalog and logs with escaping") {
    write_text_file(dir.file("kms_database.json"), kDatabase);
    REQUIRE(sink.append_line("KMS <Server> started").has_value());
    auto ctx = context();

    httplib::Request  req;
    httplib::Response res;
    detail::handle_dashboard_page_request(ctx, req, res);

    REQUIRE(res.status == 200);
    CHECK(res.get_header_value("Content-Type").find("text/html") == 0);
    CHECK(res.body.find("Windows 10 Pro") != std::string::npos);
    CHECK(res.body.find("slmgr /skms 10.0.0.5:1688") != std::string::npos);
    CHECK(res.body.find("KMS &lt;Server&gt; started") != std::string::npos);
    CHECK(res.body.find("<script>alert(1)</script>") == std::string::npos);
    CHECK(res.body.find("&lt;script&gt;alert(1)&lt;/script&gt;") != std::string::npos);
}

TEST_CASE_FIXTURE(DashboardFixture, "Health check answers ok") {
    auto ctx = context();
    httplib::Request  req;
    httplib::Response res;
    detail::handle_healthz_request(ctx, req, res);
    CHECK(res.status == 200);
    CHECK(res.body == "ok");
}

TEST_CASE_FIXTURE(DashboardFixture, "Status follows the supervised child") {
    auto spec = ProcessLaunchSpec{.executable = "/bin/sh", .args = {"-c", "exit 4"}};
    auto started = supervisor.start(spec, sink);
    REQUIRE(started.has_value());
    child = *started;
    store.set_status(ServerStatus::Running);
    auto ctx = context();

    ServerConfig config;
    for (int attempt = 0; attempt < 500; ++attempt) {
        config = refresh_server_status(ctx);
        if (config.status != ServerStatus::Running) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    CHECK(config.status == ServerStatus::Stopped);
    REQUIRE(errors.size() == 1);
    CHECK(errors.front().find("exit code 4") != std::string::npos);
}

} // TEST_SUITE
