#include <doctest/doctest.h>

#include <kmsdash/catalog/CommandGenerator.hpp>

using namespace KD;

TEST_SUITE("catalog.commands") {

TEST_CASE("Wildcard bind uses the display address") {
    ServerConfig config;
    config.bind_address    = "0.0.0.0";
    config.display_address = "10.0.0.5";
    config.port            = "1688";

    auto commands = GenerateCommands("Windows 10 Pro", "W269N-WFGWX-YVC9B-4J6C9-T83GX", config);

    CHECK(commands.install_key == "slmgr /ipk W269N-WFGWX-YVC9B-4J6C9-T83GX");
    CHECK(commands.set_server == "slmgr /skms 10.0.0.5:1688");
    CHECK(commands.activate == "slmgr /ato");
    CHECK(commands.check_status == "slmgr /xpr");
}

TEST_CASE("Explicit bind address is used verbatim") {
    ServerConfig config;
    config.bind_address    = "192.168.1.1";
    config.display_address = "10.0.0.5";
    config.port            = "1688";

    CHECK(GenerateCommands("Office", "KEY", config).set_server == "slmgr /skms 192.168.1.1:1688");
    CHECK(MakeServerAddress(config) == "192.168.1.1:1688");
}

TEST_CASE("Generation is a pure function of key and address") {
    ServerConfig config;
    config.bind_address = "172.16.0.9";
    config.port         = "11688";

    auto first  = GenerateCommands("A", "KEY", config);
    auto second = GenerateCommands("B", "KEY", config);
    CHECK(first == second);

    config.port = "1688";
    CHECK(GenerateCommands("A", "KEY", config).set_server == "slmgr /skms 172.16.0.9:1688");
}

} // TEST_SUITE
