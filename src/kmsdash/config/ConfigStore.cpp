#include <kmsdash/config/ConfigStore.hpp>

#include <kmsdash/log/TaggedLogger.hpp>
#include <kmsdash/logsink/LogSink.hpp>

#include <utility>

namespace KD {

ConfigStore::ConfigStore(ServerConfig initial, LogSink* audit_sink)
    : config_{std::move(initial)}
    , audit_sink_{audit_sink} {}

auto ConfigStore::get() const -> ServerConfig {
    std::lock_guard const lock{mutex_};
    return config_;
}

auto ConfigStore::set(std::string bind_address, std::string port) -> ServerConfig {
    std::lock_guard const lock{mutex_};
    ServerConfig next    = config_;
    next.bind_address    = std::move(bind_address);
    next.port            = std::move(port);
    config_              = next;

    kd_log("server config updated to " + next.bind_address + ":" + next.port, "ConfigStore");
    if (audit_sink_ != nullptr) {
        auto status = audit_sink_->append_line("Server configuration changed to " + next.bind_address
                                               + ":" + next.port);
        if (!status && audit_failure_) {
            audit_failure_(describeError(status.error()));
        }
    }
    return next;
}

auto ConfigStore::set_status(ServerStatus status) -> ServerConfig {
    std::lock_guard const lock{mutex_};
    config_.status = status;
    return config_;
}

void ConfigStore::set_audit_failure_hook(AuditFailureHook hook) {
    std::lock_guard const lock{mutex_};
    audit_failure_ = std::move(hook);
}

} // namespace KD
