#include <kmsdash/catalog/CommandGenerator.hpp>

namespace KD {

auto MakeServerAddress(ServerConfig const& config) -> std::string {
    auto const& address = config.effective_address();
    std::string result;
    result.reserve(address.size() + 1 + config.port.size());
    result.append(address);
    result.push_back(':');
    result.append(config.port);
    return result;
}

auto GenerateCommands(std::string_view /*display_name*/,
                      std::string_view    license_key,
                      ServerConfig const& config) -> CommandSet {
    CommandSet commands{};
    commands.install_key.append("slmgr /ipk ").append(license_key);
    commands.set_server.append("slmgr /skms ").append(MakeServerAddress(config));
    commands.activate     = "slmgr /ato";
    commands.check_status = "slmgr /xpr";
    return commands;
}

} // namespace KD
