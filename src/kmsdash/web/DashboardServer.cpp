#include "httplib.h"

#include <kmsdash/web/DashboardServer.hpp>

#include <kmsdash/config/ConfigStore.hpp>
#include <kmsdash/log/TaggedLogger.hpp>
#include <kmsdash/logsink/LogSink.hpp>
#include <kmsdash/net/DisplayAddress.hpp>
#include <kmsdash/web/routing/ApiController.hpp>
#include <kmsdash/web/routing/PageController.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace KD::Dashboard {

static std::atomic<bool> g_should_stop{false};

namespace {

void emit(std::function<void(std::string_view)> const& hook, std::ostream& fallback, std::string_view message) {
    if (hook) {
        hook(message);
        return;
    }
    fallback << message << '\n';
}

// Sleeps in short slices so a stop request during startup is not delayed.
void wait_for_grace_period(std::chrono::milliseconds grace, std::atomic<bool>& should_stop) {
    auto const deadline = std::chrono::steady_clock::now() + grace;
    while (!should_stop.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(100)));
    }
}

auto dashboard_url(DashboardOptions const& options, ServerConfig const& config) -> std::string {
    std::string host = options.host == kWildcardBindAddress ? config.display_address : options.host;
    return "http://" + host + ":" + std::to_string(options.port);
}

} // namespace

void RequestDashboardStop() {
    g_should_stop.store(true);
}

void ResetDashboardStopFlag() {
    g_should_stop.store(false);
}

auto MakeKmsLaunchSpec(DashboardOptions const& options) -> ProcessLaunchSpec {
    return ProcessLaunchSpec{
        .executable        = options.server_executable,
        .args              = options.server_args.empty() ? DefaultServerArguments(options) : options.server_args,
        .working_directory = options.server_cwd,
        .extra_env         = options.server_env,
    };
}

auto StartKmsServer(DashboardOptions const&  options,
                    ProcessSupervisor&       supervisor,
                    LogSink&                 sink,
                    ConfigStore&             config_store,
                    DashboardLogHooks const& log_hooks) -> ProcessHandle {
    auto spec = MakeKmsLaunchSpec(options);
    emit(log_hooks.info, std::cout, "[supervisor] Starting KMS server: " + describeLaunch(spec));

    auto handle = supervisor.start(spec, sink);
    if (!handle) {
        emit(log_hooks.error,
             std::cerr,
             "[supervisor] Failed to start KMS server: " + describeError(handle.error())
                 + " (continuing without a live server)");
        config_store.set_status(ServerStatus::Unknown);
        return ProcessHandle{};
    }

    emit(log_hooks.info, std::cout, "[supervisor] KMS server started with PID " + std::to_string(handle->pid()));
    config_store.set_status(ServerStatus::Running);
    return std::move(*handle);
}

int RunDashboardServerWithStopFlag(HttpRequestContext&                  ctx,
                                   std::atomic<bool>&                   should_stop,
                                   std::function<void(Expected<void>)> on_listen) {
    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    httplib::Server server;
    server.set_payload_max_length(kMaxApiPayloadBytes);
    server.set_exception_handler([&ctx](httplib::Request const& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (std::exception const& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        log_error(ctx, "[kmsdash] Request " + req.method + " " + req.path + " failed: " + what);
        respond_server_error(res, what);
    });

    auto page_controller = PageController::Create(ctx);
    page_controller->register_routes(server);

    auto api_controller = ApiController::Create(ctx);
    api_controller->register_routes(server);

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen(ctx.options.host.c_str(), ctx.options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(ctx,
                          std::string{"[kmsdash] Failed to bind "} + ctx.options.host + ":"
                              + std::to_string(ctx.options.port));
            }
        }
    });

    log_info(ctx,
             std::string{"[kmsdash] Listening on http://"} + ctx.options.host + ":"
                 + std::to_string(ctx.options.port));

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::InvalidError, "failed to bind dashboard listener"}));
        } else if (should_stop.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::InvalidError, "dashboard stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunDashboard(DashboardOptions const& options, DashboardLogHooks const& log_hooks) {
    LogSink sink{options.log_path, static_cast<std::size_t>(options.tail_max_bytes)};

    ServerConfig initial;
    initial.bind_address    = options.kms_host;
    initial.port            = options.kms_port;
    initial.status          = ServerStatus::Unknown;
    initial.display_address = DiscoverDisplayAddress();

    ConfigStore config_store{initial, &sink};
    config_store.set_audit_failure_hook([&log_hooks](std::string_view message) {
        emit(log_hooks.error, std::cerr, std::string{"[kmsdash] Error logging command: "} + std::string{message});
    });

    ProcessSupervisor supervisor{ProcessSupervisorOptions{
        .stop_timeout       = std::chrono::milliseconds(options.stop_timeout_ms),
        .stop_poll_interval = std::chrono::milliseconds(50),
    }};

    ProcessHandle child;
    if (options.launch_server) {
        child = StartKmsServer(options, supervisor, sink, config_store, log_hooks);
        if (child.state() == ProcessState::Running) {
            wait_for_grace_period(std::chrono::milliseconds(options.startup_grace_ms), g_should_stop);
        }
    } else {
        emit(log_hooks.info, std::cout, "[supervisor] KMS server launch disabled (--no-server)");
    }

    auto snapshot = config_store.get();
    emit(log_hooks.info, std::cout, "[kmsdash] Dashboard available at " + dashboard_url(options, snapshot));
    emit(log_hooks.info, std::cout, "[kmsdash] KMS server address " + MakeServerAddress(snapshot));
    emit(log_hooks.info, std::cout, "[kmsdash] Log file " + sink.path().string());

    HttpRequestContext ctx{
        .options      = options,
        .config_store = config_store,
        .log_sink     = sink,
        .supervisor   = supervisor,
        .child        = child,
        .log_hooks    = log_hooks,
    };

    int exit_code = RunDashboardServerWithStopFlag(ctx, g_should_stop);

    if (supervisor.poll(child) == ProcessState::Running) {
        emit(log_hooks.info, std::cout, "[supervisor] Stopping KMS server (PID " + std::to_string(child.pid()) + ")");
        auto stopped = supervisor.stop(child);
        if (!stopped) {
            emit(log_hooks.error, std::cerr, "[supervisor] Failed to stop KMS server: " + describeError(stopped.error()));
            exit_code = EXIT_FAILURE;
        } else {
            config_store.set_status(ServerStatus::Stopped);
            kd_log("child stopped", "Supervisor");
        }
    }

    return exit_code;
}

} // namespace KD::Dashboard
