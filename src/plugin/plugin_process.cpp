#include <kiln/plugin/plugin_process.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace kiln::plugin {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Builds the child's environment in the parent: after fork() only
// async-signal-safe calls are allowed.
std::vector<std::string> buildEnvironment(
    const std::unordered_map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (overrides.find(std::string(key)) == overrides.end()) {
            out.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

} // namespace

class PluginProcess::Impl {
public:
    explicit Impl(PluginProcessConfig config) : config_(std::move(config)) {}
    ~Impl();

    Result<void> spawn_process();
    void terminate(std::chrono::milliseconds grace);
    bool wait_for_exit(std::chrono::milliseconds timeout);
    bool is_alive() const noexcept;

    void signal_group(int sig) const;
    void start_io_threads();
    void stop_io_threads();
    void pump_loop(int fd, const PluginProcessConfig::LineCallback& cb, bool isStdout);
    bool try_reap();

    PluginProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Running};
    std::chrono::steady_clock::time_point start_time_;
    std::optional<int> exit_code_;
    mutable std::mutex reap_mutex_;

    std::atomic<bool> stop_io_{false};
    std::thread stdout_thread_;
    std::thread stderr_thread_;

    pid_t process_id_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
};

PluginProcess::Impl::~Impl() {
    if (is_alive()) {
        spdlog::debug("PluginProcess: terminating pid {} on destruction", process_id_);
        terminate(std::chrono::seconds{2});
    }
    stop_io_threads();
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);
}

Result<void> PluginProcess::Impl::spawn_process() {
    // A plugin dying mid-write must not take the host down with SIGPIPE.
    ::signal(SIGPIPE, SIG_IGN);

    const auto exe = config_.executable.string();
    if (::access(exe.c_str(), X_OK) != 0) {
        return Error{ErrorCode::PluginNotFound,
                     "plugin executable '" + exe + "' is not executable: " + std::strerror(errno)};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0 || ::pipe2(stderr_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            closeFd(*fd);
        }
        return Error{ErrorCode::IOError, std::string("failed to create pipes: ") + strerror(err)};
    }
    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    std::vector<std::string> argStorage;
    argStorage.push_back(exe);
    argStorage.insert(argStorage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& a : argStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    auto envStorage = buildEnvironment(config_.env);
    std::vector<char*> envp;
    for (auto& e : envStorage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                        &exec_pipe[0], &exec_pipe[1], &dev_null}) {
            closeFd(*fd);
        }
        return Error{ErrorCode::IOError, std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        // Restore default dispositions the host may have changed.
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());

        int err = errno;
        (void)!::write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    process_id_ = pid;
    start_time_ = std::chrono::steady_clock::now();
    closeFd(stdout_pipe[1]);
    closeFd(stderr_pipe[1]);
    closeFd(exec_pipe[1]);
    closeFd(dev_null);
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    // EOF on the exec pipe means execve() succeeded and closed it.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (n > 0) {
        (void)wait_for_exit(std::chrono::seconds{1});
        state_.store(ProcessState::Terminated, std::memory_order_release);
        closeFd(stdout_fd_);
        closeFd(stderr_fd_);
        return Error{ErrorCode::PluginNotFound,
                     "failed to execute '" + exe + "': " + std::strerror(child_errno)};
    }

    start_io_threads();
    spdlog::info("PluginProcess: spawned {} (pid={})", exe, process_id_);
    return Result<void>();
}

void PluginProcess::Impl::signal_group(int sig) const {
    if (::kill(-process_id_, sig) < 0) {
        ::kill(process_id_, sig);
    }
}

void PluginProcess::Impl::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) {
        return;
    }
    if (process_id_ <= 0) {
        spdlog::warn("PluginProcess: invalid process id {} during termination", process_id_);
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::debug("PluginProcess: terminating {} (pid={})", config_.executable.string(),
                  process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    signal_group(SIGTERM);
    if (wait_for_exit(grace)) {
        return;
    }

    spdlog::warn("PluginProcess: forcefully killing pid {}", process_id_);
    signal_group(SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{5})) {
        spdlog::error("PluginProcess: pid {} did not exit after SIGKILL", process_id_);
    }
}

bool PluginProcess::Impl::try_reap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exit_code_) {
        return true;
    }
    int status = 0;
    pid_t result = ::waitpid(process_id_, &status, WNOHANG);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return false;
        }
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; the status is lost.
        exit_code_ = -1;
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return true;
    }
    return false;
}

bool PluginProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (try_reap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

bool PluginProcess::Impl::is_alive() const noexcept {
    if (state_.load(std::memory_order_acquire) == ProcessState::Terminated) {
        return false;
    }
    return !const_cast<Impl*>(this)->try_reap();
}

void PluginProcess::Impl::start_io_threads() {
    stdout_thread_ = std::thread([this] { pump_loop(stdout_fd_, config_.stdout_line, true); });
    stderr_thread_ = std::thread([this] { pump_loop(stderr_fd_, config_.stderr_line, false); });
}

void PluginProcess::Impl::stop_io_threads() {
    stop_io_.store(true);
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

// Polls with a short timeout so the pump also stops when a grandchild keeps
// the pipe open after the plugin itself is gone.
void PluginProcess::Impl::pump_loop(int fd, const PluginProcessConfig::LineCallback& cb,
                                    bool isStdout) {
    std::array<char, 4096> buffer;
    std::string pending;
    while (!stop_io_.load()) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 100);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            break;
        }
        if (rc == 0) {
            continue;
        }
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer.data(), static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pending.erase(0, pos + 1);
            if (cb) {
                cb(line);
            }
        }
    }
    if (!pending.empty() && cb) {
        cb(pending);
    }
    if (isStdout && config_.stdout_closed) {
        config_.stdout_closed();
    } else if (!isStdout && config_.stderr_closed) {
        config_.stderr_closed();
    }
}

// ============================================================================
// PluginProcess Public Interface (forwards to Impl)
// ============================================================================

Result<std::unique_ptr<PluginProcess>> PluginProcess::spawn(PluginProcessConfig config) {
    spdlog::debug("PluginProcess: spawning {}", config.executable.string());
    auto impl = std::make_unique<Impl>(std::move(config));
    if (auto r = impl->spawn_process(); !r) {
        return r.error();
    }
    return std::unique_ptr<PluginProcess>(new PluginProcess(std::move(impl)));
}

PluginProcess::PluginProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

PluginProcess::~PluginProcess() = default;

ProcessState PluginProcess::state() const noexcept {
    return impl_->state_.load(std::memory_order_acquire);
}

bool PluginProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

void PluginProcess::terminate(std::chrono::milliseconds grace) {
    impl_->terminate(grace);
}

int64_t PluginProcess::pid() const noexcept {
    return static_cast<int64_t>(impl_->process_id_);
}

std::chrono::milliseconds PluginProcess::uptime() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 impl_->start_time_);
}

bool PluginProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> PluginProcess::exit_code() const noexcept {
    std::lock_guard<std::mutex> lock(impl_->reap_mutex_);
    return impl_->exit_code_;
}

} // namespace kiln::plugin
