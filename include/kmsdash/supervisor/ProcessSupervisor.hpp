#pragma once

#include <kmsdash/core/Error.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace KD {

class LogSink;

enum class ProcessState {
    NotStarted,
    Running,
    Stopped,
    Crashed,
};

[[nodiscard]] auto processStateToString(ProcessState state) -> std::string_view;

struct ProcessLaunchSpec {
    std::string              executable;
    std::vector<std::string> args;
    std::string              working_directory;
    std::vector<std::string> extra_env; // KEY=VALUE, overrides inherited entries
};

[[nodiscard]] auto describeLaunch(ProcessLaunchSpec const& spec) -> std::string;

// Shared view of one supervised child. Copies refer to the same process.
class ProcessHandle {
public:
    ProcessHandle();

    [[nodiscard]] auto pid() const -> pid_t;
    [[nodiscard]] auto state() const -> ProcessState;
    [[nodiscard]] auto exit_code() const -> std::optional<int>;
    [[nodiscard]] auto term_signal() const -> std::optional<int>;

private:
    friend class ProcessSupervisor;

    struct Record {
        mutable std::mutex mutex;
        pid_t              pid{-1};
        ProcessState       state{ProcessState::NotStarted};
        bool               stop_requested{false};
        std::optional<int> exit_code;
        std::optional<int> term_signal;
    };

    std::shared_ptr<Record> record_;
};

struct ProcessSupervisorOptions {
    std::chrono::milliseconds stop_timeout{5000};
    std::chrono::milliseconds stop_poll_interval{50};
};

// Launches a long-running child with stdout and stderr appended to a LogSink.
// start() returns once exec has succeeded; it does not wait for the child to
// become ready. Exits are observed through poll(), never restarted.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(ProcessSupervisorOptions options = {});

    // Truncates the sink, then spawns the child. SpawnFailed when the sink
    // cannot be opened, fork fails, or exec fails.
    [[nodiscard]] auto start(ProcessLaunchSpec const& spec, LogSink& sink) -> Expected<ProcessHandle>;

    // Non-blocking reap. Any exit not requested through stop() is Crashed.
    auto poll(ProcessHandle& handle) -> ProcessState;

    // SIGTERM to the child's process group, SIGKILL after stop_timeout.
    auto stop(ProcessHandle& handle) -> Expected<void>;

private:
    static void record_exit(ProcessHandle::Record& record, int status);

    ProcessSupervisorOptions options_;
};

} // namespace KD
