#pragma once

#include <kmsdash/config/ServerConfig.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace KD {

class LogSink;

// Process-wide server configuration. Every accessor works on copies; updates
// replace the snapshot under a single lock, so readers never observe a half
// applied change.
class ConfigStore {
public:
    using AuditFailureHook = std::function<void(std::string_view)>;

    explicit ConfigStore(ServerConfig initial, LogSink* audit_sink = nullptr);

    ConfigStore(ConfigStore const&)                    = delete;
    auto operator=(ConfigStore const&) -> ConfigStore& = delete;

    [[nodiscard]] auto get() const -> ServerConfig;

    // Overwrites address and port, keeps status and display address, and
    // appends an audit line while still holding the lock.
    auto set(std::string bind_address, std::string port) -> ServerConfig;

    auto set_status(ServerStatus status) -> ServerConfig;

    void set_audit_failure_hook(AuditFailureHook hook);

private:
    mutable std::mutex mutex_;
    ServerConfig       config_;
    LogSink*           audit_sink_{nullptr};
    AuditFailureHook   audit_failure_;
};

} // namespace KD
