#pragma once

#include <kmsdash/config/ServerConfig.hpp>

#include <string>
#include <string_view>

namespace KD {

struct CommandSet {
    std::string install_key;
    std::string set_server;
    std::string activate;
    std::string check_status;

    auto operator==(CommandSet const&) const -> bool = default;
};

// "<address>:<port>" where address is the display address for wildcard binds.
[[nodiscard]] auto MakeServerAddress(ServerConfig const& config) -> std::string;

// Client-side activation commands for one product key. Pure function of its inputs.
[[nodiscard]] auto GenerateCommands(std::string_view    display_name,
                                    std::string_view    license_key,
                                    ServerConfig const& config) -> CommandSet;

} // namespace KD
