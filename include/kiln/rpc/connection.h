#pragma once

#include <kiln/core/types.h>
#include <kiln/rpc/transport.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kiln::rpc {

class Connection;

// Object id of the component a plugin serves.
inline constexpr uint64_t kRootObjectId = 0;

/**
 * Local object reachable by the peer through the connection's object table.
 */
class IServedObject {
public:
    virtual ~IServedObject() = default;

    // Capability prefix of the methods this object answers ("Ui", "Builder").
    virtual const char* capability() const = 0;

    // `method` is the part after the capability prefix.
    virtual Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                          Connection& connection) = 0;
};

/**
 * Bidirectional JSON-RPC 2.0 endpoint over one stream transport.
 *
 * Client role: call() sends a request and blocks until the response with the
 * same id arrives; any number of calls may be in flight. Server role: each
 * inbound request is dispatched to the object table on its own thread, so a
 * callback is serviced while a call() on the same connection is still blocked.
 *
 * When the transport closes, every pending and later call fails with
 * CommunicationFailed. The optional disconnect describer adds context such as
 * the peer's exit status to that error.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using DisconnectDescriber = std::function<std::string()>;

    static std::shared_ptr<Connection> create(std::unique_ptr<StreamTransport> transport,
                                              std::string name);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Starts the reader thread. Register the root object before calling.
    void start();

    Result<nlohmann::json> call(uint64_t objectId, const std::string& method,
                                nlohmann::json args = nlohmann::json::object());

    void registerRoot(std::shared_ptr<IServedObject> object);
    uint64_t registerObject(std::shared_ptr<IServedObject> object);
    void unregisterObject(uint64_t objectId);
    size_t objectCount() const;

    void setDisconnectDescriber(DisconnectDescriber describer);

    void close();
    bool isOpen() const noexcept { return !closed_.load(); }

    // Blocks until the transport has closed.
    void waitClosed();

    size_t pendingCalls() const;
    const std::string& name() const noexcept { return name_; }

private:
    struct PendingCall {
        std::string method;
        std::promise<Result<nlohmann::json>> promise;
    };

    Connection(std::unique_ptr<StreamTransport> transport, std::string name);

    void readLoop();
    void handleFrame(const std::string& line);
    void handleRequest(const nlohmann::json& request);
    void completeCall(uint64_t id, Result<nlohmann::json> result);
    void failPending(ErrorCode code, const std::string& reason);
    void markClosed(const std::string& reason);
    void joinReader();
    Error closedError(const std::string& method) const;

    std::unique_ptr<StreamTransport> transport_;
    std::string name_;
    std::thread reader_;
    std::mutex joinMutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable closedCv_;
    std::map<uint64_t, std::shared_ptr<PendingCall>> pending_;
    std::map<uint64_t, std::shared_ptr<IServedObject>> objects_;
    uint64_t nextCallId_{1};
    uint64_t nextObjectId_{1};
    std::string closeReason_;
    DisconnectDescriber describer_;
};

/**
 * Objects registered for the duration of one outbound call.
 *
 * Callback arguments (a UI, a hook) are only reachable by the peer while the
 * call that references them is running.
 */
class CallScope {
    struct State;

public:
    explicit CallScope(Connection& connection);
    ~CallScope();

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

    uint64_t add(std::shared_ptr<IServedObject> object);

    // Registers into the scope from a request handler that may still be running
    // when the scope ends; add() then fails with InvalidState.
    class Handle {
    public:
        Result<uint64_t> add(std::shared_ptr<IServedObject> object) const;

    private:
        friend class CallScope;
        explicit Handle(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    Handle handle() const { return Handle{state_}; }

private:
    std::shared_ptr<State> state_;
};

// JSON-RPC error object carrying the ErrorCode name and causes in `data`.
nlohmann::json errorToJson(const Error& error);
Error errorFromJson(const nlohmann::json& error);

} // namespace kiln::rpc
