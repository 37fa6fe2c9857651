#include <kmsdash/supervisor/ProcessSupervisor.hpp>

#include <kmsdash/log/TaggedLogger.hpp>
#include <kmsdash/logsink/LogSink.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace KD {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd = -1)
        : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(FdGuard const&)                    = delete;
    auto operator=(FdGuard const&) -> FdGuard& = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

auto spawn_error(std::string message, int err = 0) -> Error {
    if (err != 0) {
        message.append(": ");
        message.append(std::strerror(err));
    }
    return Error{Error::Code::SpawnFailed, std::move(message)};
}

auto build_environment(std::vector<std::string> const& extra) -> Expected<std::vector<std::string>> {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }
    for (auto const& assignment : extra) {
        auto equals = assignment.find('=');
        if (equals == std::string::npos || equals == 0) {
            return std::unexpected(spawn_error("invalid environment entry '" + assignment + "'"));
        }
        auto prefix   = assignment.substr(0, equals + 1);
        bool replaced = false;
        for (auto& existing : env) {
            if (existing.starts_with(prefix)) {
                existing = assignment;
                replaced = true;
            }
        }
        if (!replaced) {
            env.push_back(assignment);
        }
    }
    return env;
}

auto to_pointers(std::vector<std::string>& values) -> std::vector<char*> {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Child side of fork: only async-signal-safe calls until exec.
[[noreturn]] void exec_child(int output_fd,
                             int stdin_fd,
                             int status_fd,
                             char const* working_directory,
                             char* const* argv,
                             char* const* envp) {
    ::setpgid(0, 0);
    ::dup2(stdin_fd, STDIN_FILENO);
    ::dup2(output_fd, STDOUT_FILENO);
    ::dup2(output_fd, STDERR_FILENO);
    if (working_directory != nullptr && ::chdir(working_directory) != 0) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }
    ::execvpe(argv[0], argv, envp);
    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

auto processStateToString(ProcessState state) -> std::string_view {
    switch (state) {
    case ProcessState::NotStarted:
        return "not_started";
    case ProcessState::Running:
        return "running";
    case ProcessState::Stopped:
        return "stopped";
    case ProcessState::Crashed:
        return "crashed";
    }
    return "not_started";
}

auto describeLaunch(ProcessLaunchSpec const& spec) -> std::string {
    std::ostringstream out;
    out << spec.executable;
    for (auto const& arg : spec.args) {
        out << ' ' << arg;
    }
    if (!spec.working_directory.empty()) {
        out << " (cwd " << spec.working_directory << ')';
    }
    return out.str();
}

ProcessHandle::ProcessHandle()
    : record_(std::make_shared<Record>()) {}

auto ProcessHandle::pid() const -> pid_t {
    std::lock_guard const lock{record_->mutex};
    return record_->pid;
}

auto ProcessHandle::state() const -> ProcessState {
    std::lock_guard const lock{record_->mutex};
    return record_->state;
}

auto ProcessHandle::exit_code() const -> std::optional<int> {
    std::lock_guard const lock{record_->mutex};
    return record_->exit_code;
}

auto ProcessHandle::term_signal() const -> std::optional<int> {
    std::lock_guard const lock{record_->mutex};
    return record_->term_signal;
}

ProcessSupervisor::ProcessSupervisor(ProcessSupervisorOptions options)
    : options_(options) {}

void ProcessSupervisor::record_exit(ProcessHandle::Record& record, int status) {
    if (WIFEXITED(status)) {
        record.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        record.term_signal = WTERMSIG(status);
    }
    record.state = record.stop_requested ? ProcessState::Stopped : ProcessState::Crashed;
}

auto ProcessSupervisor::start(ProcessLaunchSpec const& spec, LogSink& sink) -> Expected<ProcessHandle> {
    if (spec.executable.empty()) {
        return std::unexpected(spawn_error("no executable configured"));
    }

    auto env = build_environment(spec.extra_env);
    if (!env) {
        return std::unexpected(env.error());
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.executable);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    auto argv = to_pointers(argv_storage);
    auto envp = to_pointers(*env);
    char const* working_directory = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();

    auto output_fd = sink.open_child_descriptor(true);
    if (!output_fd) {
        return std::unexpected(spawn_error(describeError(output_fd.error())));
    }
    FdGuard output{*output_fd};

    FdGuard devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (devnull.get() < 0) {
        return std::unexpected(spawn_error("cannot open /dev/null", errno));
    }

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        return std::unexpected(spawn_error("cannot create status pipe", errno));
    }
    FdGuard status_read{status_pipe[0]};
    FdGuard status_write{status_pipe[1]};

    pid_t child = ::fork();
    if (child < 0) {
        return std::unexpected(spawn_error("fork failed", errno));
    }
    if (child == 0) {
        exec_child(output.get(), devnull.get(), status_write.get(), working_directory, argv.data(), envp.data());
    }

    ::setpgid(child, child);
    status_write.reset();

    // EOF on the CLOEXEC pipe means exec succeeded; an errno value means it did not.
    int     child_errno = 0;
    ssize_t received    = 0;
    do {
        received = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (received < 0 && errno == EINTR);

    if (received == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        return std::unexpected(spawn_error("cannot launch '" + describeLaunch(spec) + "'", child_errno));
    }

    ProcessHandle handle;
    {
        std::lock_guard const lock{handle.record_->mutex};
        handle.record_->pid   = child;
        handle.record_->state = ProcessState::Running;
    }
    kd_log("spawned pid " + std::to_string(child), "Supervisor");
    return handle;
}

auto ProcessSupervisor::poll(ProcessHandle& handle) -> ProcessState {
    auto&                 record = *handle.record_;
    std::lock_guard const lock{record.mutex};
    if (record.state != ProcessState::Running) {
        return record.state;
    }
    int   status = 0;
    pid_t reaped = ::waitpid(record.pid, &status, WNOHANG);
    if (reaped == record.pid) {
        record_exit(record, status);
    } else if (reaped < 0 && errno == ECHILD) {
        // Reaped elsewhere; the exit status is lost.
        record.state = record.stop_requested ? ProcessState::Stopped : ProcessState::Crashed;
    }
    return record.state;
}

auto ProcessSupervisor::stop(ProcessHandle& handle) -> Expected<void> {
    auto&                 record = *handle.record_;
    std::lock_guard const lock{record.mutex};
    if (record.state == ProcessState::NotStarted) {
        return std::unexpected(Error{Error::Code::InvalidState, "process was never started"});
    }
    if (record.state != ProcessState::Running) {
        return {};
    }

    record.stop_requested = true;
    if (::kill(-record.pid, SIGTERM) != 0 && ::kill(record.pid, SIGTERM) != 0 && errno != ESRCH) {
        return std::unexpected(Error{Error::Code::InvalidState,
                                     "cannot signal pid " + std::to_string(record.pid) + ": "
                                         + std::strerror(errno)});
    }

    auto const deadline = std::chrono::steady_clock::now() + options_.stop_timeout;
    int        status   = 0;
    while (true) {
        pid_t reaped = ::waitpid(record.pid, &status, WNOHANG);
        if (reaped == record.pid) {
            record_exit(record, status);
            return {};
        }
        if (reaped < 0 && errno != EINTR) {
            record.state = ProcessState::Stopped;
            return {};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(options_.stop_poll_interval);
    }

    kd_log("pid " + std::to_string(record.pid) + " ignored SIGTERM, killing", "Supervisor");
    ::kill(-record.pid, SIGKILL);
    ::kill(record.pid, SIGKILL);
    while (::waitpid(record.pid, &status, 0) < 0) {
        if (errno != EINTR) {
            record.state = ProcessState::Stopped;
            return {};
        }
    }
    record_exit(record, status);
    return {};
}

} // namespace KD
