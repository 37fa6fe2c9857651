#pragma once

#include <string>
#include <string_view>

namespace KD {

enum class ServerStatus {
    Running,
    Stopped,
    Unknown,
};

[[nodiscard]] auto serverStatusToString(ServerStatus status) -> std::string_view;

inline constexpr std::string_view kWildcardBindAddress = "0.0.0.0";
inline constexpr std::string_view kDefaultKmsPort      = "1688";

// Snapshot of the supervised server's address and status. Values handed out by
// ConfigStore are copies; mutating one never affects the store.
struct ServerConfig {
    std::string  bind_address{kWildcardBindAddress};
    std::string  port{kDefaultKmsPort};
    ServerStatus status{ServerStatus::Unknown};
    std::string  display_address{"127.0.0.1"};

    // Address a client should dial: the display address when bound to the wildcard.
    [[nodiscard]] auto effective_address() const -> std::string const&;
};

} // namespace KD
