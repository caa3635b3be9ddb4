#pragma once

#include <kiln/core/types.h>
#include <kiln/plugin/plugin_client.h>

#include <memory>
#include <mutex>
#include <vector>

namespace kiln::plugin {

/**
 * Every plugin client started during one run.
 *
 * Clients are added before they are started. killAll() stops accepting new
 * clients, kills every tracked client in parallel, and forgets a client only
 * once its subprocess is gone. It is safe to call from an interrupt path while
 * normal completion also calls it; the later caller waits for the first.
 */
class ClientSet {
public:
    ClientSet() = default;
    ~ClientSet();

    ClientSet(const ClientSet&) = delete;
    ClientSet& operator=(const ClientSet&) = delete;

    // OperationCancelled once killAll() has run.
    Result<void> add(std::shared_ptr<PluginClient> client);

    void killAll();

    bool closed() const;
    size_t size() const;
    // Tracked clients whose subprocess has not exited.
    size_t liveCount() const;

private:
    mutable std::mutex mutex_;
    std::mutex killMutex_;
    std::vector<std::shared_ptr<PluginClient>> clients_;
    bool closed_{false};
};

} // namespace kiln::plugin
