#pragma once

#include <kiln/components/cache.h>
#include <kiln/components/environment.h>
#include <kiln/core/cancellation.h>
#include <kiln/plugin/client_set.h>
#include <kiln/registry/registry.h>
#include <kiln/ui/ui.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kiln {

/**
 * @brief Composition root of one kiln run
 *
 * Owns the registry, the UI sink, the cache and the set of plugin clients
 * started during the run. Components loaded through it, by cli() or by a
 * command, are tracked so cleanup() can stop every plugin subprocess on any
 * exit path.
 */
class Environment : public components::IEnvironment {
public:
    Environment(std::shared_ptr<registry::Registry> registry, std::shared_ptr<ui::IUi> ui,
                std::shared_ptr<components::ICache> cache);
    ~Environment() override;

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    /**
     * @brief Run the command named by the first non-flag argument
     *
     * Returns the command's exit code. A missing or unknown command prints
     * usage and returns 1 without starting any plugin. Cancelling `cancel`
     * stops every plugin of the run; cleanup() runs before returning.
     */
    int cli(const std::vector<std::string>& args, CancellationToken cancel = {});

    // Kills every plugin client of the run. Idempotent and thread-safe.
    void cleanup();

    std::string usage() const;

    std::shared_ptr<ui::IUi> ui() override { return ui_; }
    components::ICache& cache() override { return *cache_; }

    Result<std::shared_ptr<components::IBuilder>> builder(const std::string& name) override;
    Result<std::shared_ptr<components::IProvisioner>> provisioner(const std::string& name) override;
    Result<std::shared_ptr<components::IPostProcessor>>
    postProcessor(const std::string& name) override;
    Result<std::shared_ptr<components::IHook>> hook(const std::string& name) override;
    Result<std::shared_ptr<components::ICommand>> command(const std::string& name);

    CancellationToken cancellation() const override;

    plugin::ClientSet& clients() noexcept { return clients_; }
    const registry::Registry& registry() const noexcept { return *registry_; }

private:
    void reportError(const Error& error);

    std::shared_ptr<registry::Registry> registry_;
    std::shared_ptr<ui::IUi> ui_;
    std::shared_ptr<components::ICache> cache_;
    plugin::ClientSet clients_;

    mutable std::mutex mutex_;
    CancellationToken cancellation_;
};

// Removes every "--machine-readable" and legacy "-machine-readable" argument,
// wherever it appears, and reports whether any was present.
bool extractMachineReadable(std::vector<std::string>& args);

} // namespace kiln
