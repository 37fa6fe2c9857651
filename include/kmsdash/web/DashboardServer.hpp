#pragma once

#include <kmsdash/core/Error.hpp>
#include <kmsdash/supervisor/ProcessSupervisor.hpp>
#include <kmsdash/web/DashboardOptions.hpp>
#include <kmsdash/web/routing/HttpHelpers.hpp>

#include <atomic>
#include <functional>

namespace KD {
class ConfigStore;
class LogSink;
} // namespace KD

namespace KD::Dashboard {

auto MakeKmsLaunchSpec(DashboardOptions const& options) -> ProcessLaunchSpec;

// Launches the KMS server and records the outcome in the config status. A spawn
// failure is reported and leaves the dashboard in degraded mode with a handle
// that was never started.
auto StartKmsServer(DashboardOptions const&  options,
                    ProcessSupervisor&       supervisor,
                    LogSink&                 sink,
                    ConfigStore&             config_store,
                    DashboardLogHooks const& log_hooks = {}) -> ProcessHandle;

// Serves the dashboard routes until should_stop is raised or binding fails.
int RunDashboardServerWithStopFlag(HttpRequestContext&                  ctx,
                                   std::atomic<bool>&                   should_stop,
                                   std::function<void(Expected<void>)> on_listen = {});

// Full lifecycle: log sink, config, child process, HTTP server, then teardown of
// the server followed by the child.
int RunDashboard(DashboardOptions const& options, DashboardLogHooks const& log_hooks = {});

void RequestDashboardStop();
void ResetDashboardStopFlag();

} // namespace KD::Dashboard
