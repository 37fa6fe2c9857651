#include <kmsdash/config/ServerConfig.hpp>

namespace KD {

auto serverStatusToString(ServerStatus status) -> std::string_view {
    switch (status) {
    case ServerStatus::Running:
        return "running";
    case ServerStatus::Stopped:
        return "stopped";
    case ServerStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

auto ServerConfig::effective_address() const -> std::string const& {
    if (bind_address == kWildcardBindAddress) {
        return display_address;
    }
    return bind_address;
}

} // namespace KD
