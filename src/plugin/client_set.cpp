#include <kiln/plugin/client_set.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <thread>

namespace kiln::plugin {

ClientSet::~ClientSet() {
    killAll();
}

Result<void> ClientSet::add(std::shared_ptr<PluginClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return Error{ErrorCode::OperationCancelled,
                     "not launching plugin " + client->name() + ": run is shutting down"};
    }
    clients_.push_back(std::move(client));
    return Result<void>();
}

void ClientSet::killAll() {
    std::lock_guard<std::mutex> killLock(killMutex_);

    std::vector<std::shared_ptr<PluginClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        clients = clients_;
    }
    if (clients.empty()) {
        return;
    }
    spdlog::debug("cleaning up {} plugin client(s)", clients.size());

    // kill() is bounded by the grace period; run them side by side so the
    // total wait does not grow with the number of plugins.
    std::vector<std::thread> killers;
    killers.reserve(clients.size());
    for (const auto& client : clients) {
        try {
            killers.emplace_back([client] { client->kill(); });
        } catch (const std::system_error& e) {
            spdlog::warn("killing plugin {} inline: {}", client->name(), e.what());
            client->kill();
        }
    }
    for (auto& t : killers) {
        t.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    clients_.erase(std::remove_if(clients_.begin(), clients_.end(),
                                  [](const auto& c) {
                                      if (!c->exited()) {
                                          spdlog::warn("plugin {} did not exit", c->name());
                                          return false;
                                      }
                                      return true;
                                  }),
                   clients_.end());
}

bool ClientSet::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ClientSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

size_t ClientSet::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(clients_.begin(), clients_.end(),
                                             [](const auto& c) { return !c->exited(); }));
}

} // namespace kiln::plugin
