#pragma once

#include <kiln/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln::plugin {

/**
 * @brief Lifecycle state of a plugin subprocess
 */
enum class ProcessState : uint8_t {
    Running,      ///< Spawned and not yet reaped
    ShuttingDown, ///< Termination requested
    Terminated    ///< Reaped; exit code known
};

/**
 * @brief Configuration for spawning a plugin subprocess
 *
 * Example:
 * @code
 * PluginProcessConfig config{.executable = "/opt/kiln/plugins/kiln-builder-qemu"};
 * config.with_env("KILN_PLUGIN_MAGIC_COOKIE", cookie)
 *       .on_stdout([](std::string_view line) { ... });
 * @endcode
 */
struct PluginProcessConfig {
    std::filesystem::path executable;                 ///< Absolute path, not searched on PATH
    std::vector<std::string> args;                    ///< Arguments after argv[0]
    std::unordered_map<std::string, std::string> env; ///< Added to the inherited environment
    std::optional<std::filesystem::path> workdir;     ///< Working directory (optional)

    using LineCallback = std::function<void(std::string_view)>;
    LineCallback stdout_line; ///< Called on the stdout pump thread, one call per line
    LineCallback stderr_line; ///< Called on the stderr pump thread, one call per line
    std::function<void()> stdout_closed; ///< Called once stdout reaches EOF
    std::function<void()> stderr_closed; ///< Called once stderr reaches EOF

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }

    auto& on_stdout(LineCallback cb) {
        stdout_line = std::move(cb);
        return *this;
    }

    auto& on_stderr(LineCallback cb) {
        stderr_line = std::move(cb);
        return *this;
    }
};

/**
 * @brief Owner of one plugin subprocess
 *
 * The child runs in its own process group so an interactive Ctrl-C reaches
 * the host only; the host decides when plugins stop. stdout and stderr are
 * pumped line by line into the configured callbacks.
 *
 * **Thread Safety:** all public methods are thread-safe.
 */
class PluginProcess {
public:
    /**
     * @brief Spawn the subprocess
     *
     * Fails with PluginNotFound if the executable is missing, not executable,
     * or exec() itself fails in the child.
     */
    static Result<std::unique_ptr<PluginProcess>> spawn(PluginProcessConfig config);

    /**
     * @brief Destructor terminates a still running process
     */
    ~PluginProcess();

    PluginProcess(const PluginProcess&) = delete;
    PluginProcess& operator=(const PluginProcess&) = delete;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief Stop the process
     *
     * Sends SIGTERM to the process group, waits up to `grace`, then SIGKILL.
     * Returns once the process has been reaped or the bounded wait after
     * SIGKILL expired.
     */
    void terminate(std::chrono::milliseconds grace);

    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;

    /**
     * @brief Wait for the process to exit
     * @return true if the process exited within timeout
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Exit code once reaped; 128 + signal for a signalled process
     */
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    class Impl;
    explicit PluginProcess(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln::plugin
