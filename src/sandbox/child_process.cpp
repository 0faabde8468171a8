#include "sandbox/child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace warden::sandbox {

using core::errors::ErrorCategory;
using core::errors::SandboxError;

namespace {

constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";
constexpr const char* kTruncatedMarker = "(truncated)";
constexpr int kPollIntervalMs = 50;

enum ExecStage : int {
    kStageChdir = 1,
    kStageExec = 2
};

// Written by the child to the status pipe when it cannot reach execve.
struct ExecFailure {
    int stage;
    int error;
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(const int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(const int fd = -1) {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct PipePair {
    UniqueFd read_end;
    UniqueFd write_end;
};

// O_CLOEXEC keeps concurrent spawns from inheriting each other's pipes.
bool make_pipe(PipePair& pipe_pair) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    pipe_pair.read_end.reset(fds[0]);
    pipe_pair.write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// A write to a child that closed its stdin must surface as EPIPE, not kill us.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(::signal(SIGPIPE, SIG_IGN)); });
}

struct StreamCapture {
    UniqueFd fd;
    std::string* target = nullptr;
    bool* truncated = nullptr;
    bool capture = true;
    std::size_t limit = 0;
};

void append_limited(std::string& dst, const char* src, const std::size_t n,
                    const std::size_t limit, bool& truncated) {
    if (limit == 0) {
        dst.append(src, n);
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) {
        truncated = true;
    }
}

void drain_stream(StreamCapture& stream) {
    if (!stream.fd.valid()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(stream.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            if (stream.capture) {
                append_limited(*stream.target, buffer, static_cast<std::size_t>(n),
                               stream.limit, *stream.truncated);
            }
            continue;
        }
        if (n == 0) {
            stream.fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        stream.fd.reset();
        return;
    }
}

struct StdinFeed {
    UniqueFd fd;
    const std::string* data = nullptr;
    std::size_t offset = 0;
};

void feed_stdin(StdinFeed& feed) {
    if (!feed.fd.valid()) {
        return;
    }
    while (feed.offset < feed.data->size()) {
        const ssize_t n = write(feed.fd.get(), feed.data->data() + feed.offset,
                                feed.data->size() - feed.offset);
        if (n > 0) {
            feed.offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child stopped reading.
        feed.fd.reset();
        return;
    }
    // All of it written: close so the child sees EOF.
    feed.fd.reset();
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& items) {
    std::vector<char*> pointers;
    pointers.reserve(items.size() + 1);
    for (auto& item : items) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void report_exec_failure(const int fd, const int stage, const int error) {
    const ExecFailure failure{stage, error};
    static_cast<void>(write(fd, &failure, sizeof(failure)));
}

bool is_executable_file(const std::filesystem::path& candidate) {
    std::error_code ec;
    return std::filesystem::is_regular_file(candidate, ec) && !ec &&
           access(candidate.c_str(), X_OK) == 0;
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

}  // namespace

core::errors::Result<std::filesystem::path> find_executable(
    const std::string& program, const std::string& search_path,
    const std::optional<std::filesystem::path>& working_directory) {
    std::error_code ec;
    if (program.find('/') != std::string::npos) {
        std::filesystem::path candidate = program;
        if (candidate.is_relative() && working_directory.has_value()) {
            candidate = working_directory.value() / candidate;
        }
        candidate = std::filesystem::absolute(candidate, ec);
        if (!ec && is_executable_file(candidate)) {
            return candidate;
        }
        if (!ec && std::filesystem::exists(candidate, ec)) {
            return SandboxError{ErrorCategory::Execution,
                                "Program is not an executable file: " + program,
                                "not_executable"};
        }
        return SandboxError{ErrorCategory::Execution,
                            "Executable not found: " + program,
                            "executable_not_found"};
    }

    std::istringstream entries(search_path);
    std::string entry;
    while (std::getline(entries, entry, ':')) {
        std::filesystem::path directory = entry.empty() ? "." : entry;
        if (directory.is_relative() && working_directory.has_value()) {
            directory = working_directory.value() / directory;
        }
        const auto candidate = std::filesystem::absolute(directory / program, ec);
        if (!ec && is_executable_file(candidate)) {
            return candidate;
        }
    }
    return SandboxError{ErrorCategory::Execution,
                        "Executable not found: " + program,
                        "executable_not_found", "PATH=" + search_path};
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string pair = *entry;
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return env;
}

core::errors::Result<ProcessCapture> run_child_process(const ProcessSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return SandboxError{ErrorCategory::Input, "Command cannot be empty.",
                            "empty_command"};
    }
    if (spec.timeout.count() <= 0) {
        return SandboxError{ErrorCategory::Input, "Timeout must be positive.",
                            "invalid_timeout"};
    }

    const auto path_it = spec.environment.find("PATH");
    auto executable = find_executable(
        spec.argv.front(),
        path_it == spec.environment.end() ? kDefaultSearchPath : path_it->second,
        spec.working_directory);
    if (core::errors::is_error(executable)) {
        return core::errors::get_error(executable);
    }

    ignore_sigpipe();

    PipePair stdin_pipe;
    PipePair stdout_pipe;
    PipePair stderr_pipe;
    PipePair status_pipe;
    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) ||
        !make_pipe(status_pipe)) {
        return SandboxError{ErrorCategory::Internal, "Failed to create process pipes.",
                            "pipe_creation_failed", std::strerror(errno)};
    }

    // Everything the child touches is built before fork: after it, only
    // async-signal-safe calls are allowed.
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv = to_pointer_array(args);
    std::vector<std::string> env_entries;
    env_entries.reserve(spec.environment.size());
    for (const auto& [key, value] : spec.environment) {
        env_entries.push_back(key + "=" + value);
    }
    std::vector<char*> envp = to_pointer_array(env_entries);
    const std::string program = core::errors::get_value(executable).string();
    const std::string cwd =
        spec.working_directory.has_value() ? spec.working_directory->string() : "";

    struct sigaction default_action;
    std::memset(&default_action, 0, sizeof(default_action));
    default_action.sa_handler = SIG_DFL;
    sigemptyset(&default_action.sa_mask);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return SandboxError{ErrorCategory::Internal, "Failed to fork process.",
                            "fork_failed", std::strerror(errno)};
    }

    if (pid == 0) {
        // Own process group so the watchdog can take down every descendant.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(sigaction(SIGPIPE, &default_action, nullptr));
        static_cast<void>(sigprocmask(SIG_SETMASK, &empty_mask, nullptr));
        static_cast<void>(dup2(stdin_pipe.read_end.get(), STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe.write_end.get(), STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe.write_end.get(), STDERR_FILENO));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            report_exec_failure(status_pipe.write_end.get(), kStageChdir, errno);
            _exit(126);
        }
        execve(program.c_str(), argv.data(), envp.data());
        report_exec_failure(status_pipe.write_end.get(), kStageExec, errno);
        _exit(127);
    }

    // Mirror the child's setpgid so killpg works even if we win the race.
    static_cast<void>(setpgid(pid, pid));
    stdin_pipe.read_end.reset();
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    status_pipe.write_end.reset();

    // EOF on the status pipe means execve succeeded (the pipe is O_CLOEXEC).
    ExecFailure failure{0, 0};
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe.read_end.get(), &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    status_pipe.read_end.reset();
    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int ignored_status = 0;
        while (waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR) {
        }
        if (failure.stage == kStageChdir) {
            return SandboxError{ErrorCategory::Execution,
                                "Unable to enter working directory: " + cwd,
                                "invalid_working_directory", std::strerror(failure.error)};
        }
        return SandboxError{ErrorCategory::Execution,
                            "Failed to start '" + spec.argv.front() + "'",
                            failure.error == ENOENT ? "executable_not_found" : "spawn_failed",
                            std::strerror(failure.error)};
    }

    ProcessCapture capture;
    StreamCapture out;
    out.fd = std::move(stdout_pipe.read_end);
    out.target = &capture.stdout_text;
    out.truncated = &capture.stdout_truncated;
    out.capture = spec.capture_output;
    out.limit = spec.max_output_bytes;
    StreamCapture err;
    err.fd = std::move(stderr_pipe.read_end);
    err.target = &capture.stderr_text;
    err.truncated = &capture.stderr_truncated;
    err.capture = spec.capture_output;
    err.limit = spec.max_output_bytes;
    set_nonblocking(out.fd.get());
    set_nonblocking(err.fd.get());

    StdinFeed feed;
    if (spec.stdin_data.has_value() && !spec.stdin_data->empty()) {
        feed.fd = std::move(stdin_pipe.write_end);
        feed.data = &spec.stdin_data.value();
        set_nonblocking(feed.fd.get());
    } else {
        // No input: the child sees EOF straight away.
        stdin_pipe.write_end.reset();
    }

    bool child_exited = false;
    int status = 0;
    auto reap = [&](const int options) {
        if (child_exited) {
            return true;
        }
        pid_t waited = 0;
        do {
            waited = waitpid(pid, &status, options);
        } while (waited < 0 && errno == EINTR);
        if (waited == pid) {
            child_exited = true;
            capture.duration = elapsed_since(started);
        } else if (waited < 0) {
            // Reaped elsewhere (e.g. SIGCHLD ignored by the host); status is unknown.
            child_exited = true;
            status = -1;
            capture.duration = elapsed_since(started);
        }
        return child_exited;
    };

    const auto deadline = started + spec.timeout;
    while (!child_exited || out.fd.valid() || err.fd.valid()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (out.fd.valid()) {
            fds[nfds].fd = out.fd.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err.fd.valid()) {
            fds[nfds].fd = err.fd.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (feed.fd.valid()) {
            fds[nfds].fd = feed.fd.get();
            fds[nfds].events = POLLOUT;
            ++nfds;
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        const int wait_ms = static_cast<int>(std::min<long long>(remaining, kPollIntervalMs));
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, wait_ms));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 10)));
        }

        feed_stdin(feed);
        drain_stream(out);
        drain_stream(err);
        reap(WNOHANG);
    }

    if (!child_exited) {
        capture.timed_out = true;
        capture.duration = elapsed_since(started);
        LOG_WARN("ChildProcess: pid " + std::to_string(pid) + " exceeded " +
                 std::to_string(spec.timeout.count()) + "ms, terminating");
        if (spec.on_timeout) {
            spec.on_timeout();
        }

        static_cast<void>(killpg(pid, SIGTERM));
        const auto grace_deadline = std::chrono::steady_clock::now() + spec.kill_grace;
        while (std::chrono::steady_clock::now() < grace_deadline) {
            if (reap(WNOHANG)) {
                break;
            }
            drain_stream(out);
            drain_stream(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!child_exited) {
            LOG_WARN("ChildProcess: pid " + std::to_string(pid) +
                     " ignored SIGTERM, sending SIGKILL");
        }
        static_cast<void>(killpg(pid, SIGKILL));
        reap(0);
    } else if (out.fd.valid() || err.fd.valid()) {
        LOG_WARN("ChildProcess: pid " + std::to_string(pid) +
                 " exited but descendants kept its output open; killing the group");
    }

    // Nothing from the group may outlive this call.
    static_cast<void>(killpg(pid, SIGKILL));
    drain_stream(out);
    drain_stream(err);
    out.fd.reset();
    err.fd.reset();
    feed.fd.reset();

    if (capture.stdout_truncated) {
        capture.stdout_text += kTruncatedMarker;
    }
    if (capture.stderr_truncated) {
        capture.stderr_text += kTruncatedMarker;
    }

    capture.exit_code = status == -1 ? -1 : decode_status(status);
    return capture;
}

}  // namespace warden::sandbox
