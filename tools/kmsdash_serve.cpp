#include <csignal>
#include <cstdlib>

#include <kmsdash/web/DashboardServer.hpp>

namespace {
void handle_signal(int) {
    KD::Dashboard::RequestDashboardStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = KD::Dashboard::ParseDashboardArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        KD::Dashboard::PrintDashboardUsage();
        return EXIT_SUCCESS;
    }

    KD::Dashboard::ResetDashboardStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return KD::Dashboard::RunDashboard(options);
}
