// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2025 Trevon Sides

#include <kiln/rpc/connection.h>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace kiln::rpc {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kApplicationError = -32000;

nlohmann::json buildRequest(uint64_t id, uint64_t objectId, const std::string& method,
                            nlohmann::json args) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", {{"object", objectId}, {"args", std::move(args)}}}};
}

nlohmann::json buildResponse(const nlohmann::json& id, const Result<nlohmann::json>& result) {
    nlohmann::json response{{"jsonrpc", "2.0"}, {"id", id}};
    if (result) {
        response["result"] = result.value();
    } else {
        response["error"] = errorToJson(result.error());
    }
    return response;
}

// Strings that are not valid UTF-8 (console input, command output) are sent
// with U+FFFD substituted instead of failing the frame.
std::string encodeFrame(const nlohmann::json& frame) {
    return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

nlohmann::json errorToJson(const Error& error) {
    nlohmann::json causes = nlohmann::json::array();
    for (const auto& cause : error.causes) {
        causes.push_back(errorToJson(cause));
    }
    int code = error.code == ErrorCode::NotSupported ? kMethodNotFound : kApplicationError;
    return {{"code", code},
            {"message", error.message},
            {"data", {{"code", errorCodeName(error.code)}, {"causes", std::move(causes)}}}};
}

Error errorFromJson(const nlohmann::json& error) {
    if (!error.is_object()) {
        return Error{ErrorCode::CommunicationProtocol, "malformed error object"};
    }
    Error out;
    out.code = ErrorCode::Unknown;
    out.message = error.value("message", std::string{});
    auto data = error.find("data");
    if (data != error.end() && data->is_object()) {
        auto codeName = data->find("code");
        if (codeName != data->end() && codeName->is_string()) {
            out.code = errorCodeFromName(codeName->get<std::string>());
        }
        auto causes = data->find("causes");
        if (causes != data->end() && causes->is_array()) {
            for (const auto& c : *causes) {
                out.causes.push_back(errorFromJson(c));
            }
        }
    } else if (error.value("code", 0) == kMethodNotFound) {
        out.code = ErrorCode::NotSupported;
    }
    return out;
}

// ============================================================================
// Connection
// ============================================================================

std::shared_ptr<Connection> Connection::create(std::unique_ptr<StreamTransport> transport,
                                               std::string name) {
    return std::shared_ptr<Connection>(new Connection(std::move(transport), std::move(name)));
}

Connection::Connection(std::unique_ptr<StreamTransport> transport, std::string name)
    : transport_(std::move(transport)), name_(std::move(name)) {}

Connection::~Connection() {
    close();
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (reader_.joinable()) {
        reader_.detach();
    }
}

void Connection::joinReader() {
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
}

void Connection::start() {
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (started_.exchange(true)) {
        return;
    }
    reader_ = std::thread([this] { readLoop(); });
}

void Connection::setDisconnectDescriber(DisconnectDescriber describer) {
    std::lock_guard<std::mutex> lock(mutex_);
    describer_ = std::move(describer);
}

void Connection::registerRoot(std::shared_ptr<IServedObject> object) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[kRootObjectId] = std::move(object);
}

uint64_t Connection::registerObject(std::shared_ptr<IServedObject> object) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextObjectId_++;
    objects_[id] = std::move(object);
    return id;
}

void Connection::unregisterObject(uint64_t objectId) {
    std::shared_ptr<IServedObject> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(objectId);
        if (it == objects_.end()) {
            return;
        }
        released = std::move(it->second);
        objects_.erase(it);
    }
    // Destroyed outside the lock; a lease object releases its key here.
}

size_t Connection::objectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

size_t Connection::pendingCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

Error Connection::closedError(const std::string& method) const {
    return Error{ErrorCode::CommunicationFailed,
                 method + ": connection to " + name_ + " closed" +
                     (closeReason_.empty() ? "" : " (" + closeReason_ + ")")};
}

Result<nlohmann::json> Connection::call(uint64_t objectId, const std::string& method,
                                        nlohmann::json args) {
    auto pending = std::make_shared<PendingCall>();
    pending->method = method;
    auto future = pending->promise.get_future();

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load()) {
            return closedError(method);
        }
        id = nextCallId_++;
        pending_[id] = pending;
    }

    auto frame = encodeFrame(buildRequest(id, objectId, method, std::move(args)));
    spdlog::trace("{} -> {}", name_, frame);
    if (auto written = transport_->writeLine(frame); !written) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.erase(id) > 0) {
            return Error{ErrorCode::CommunicationFailed,
                         method + ": " + written.error().message};
        }
        // The reader already failed this call while closing.
    }
    return future.get();
}

void Connection::completeCall(uint64_t id, Result<nlohmann::json> result) {
    std::shared_ptr<PendingCall> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            spdlog::warn("{}: response for unknown call id {}", name_, id);
            return;
        }
        pending = std::move(it->second);
        pending_.erase(it);
    }
    pending->promise.set_value(std::move(result));
}

void Connection::failPending(ErrorCode code, const std::string& reason) {
    std::map<uint64_t, std::shared_ptr<PendingCall>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }
    for (auto& [id, call] : failed) {
        call->promise.set_value(Error{code, call->method + ": " + reason});
    }
}

void Connection::readLoop() {
    std::string reason = "connection closed";
    while (true) {
        auto line = transport_->readLine();
        if (!line) {
            reason = line.error().message;
            break;
        }
        if (line.value().empty()) {
            continue;
        }
        handleFrame(line.value());
    }
    markClosed(reason);
}

void Connection::markClosed(const std::string& reason) {
    DisconnectDescriber describer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        describer = describer_;
    }
    std::string full = reason;
    if (describer) {
        auto detail = describer();
        if (!detail.empty()) {
            full += ": " + detail;
        }
    }
    spdlog::debug("{}: {}", name_, full);

    std::map<uint64_t, std::shared_ptr<IServedObject>> objects;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closeReason_ = full;
        closed_.store(true);
        objects.swap(objects_);
    }
    transport_->close();
    failPending(ErrorCode::CommunicationFailed, "connection to " + name_ + " closed (" + full + ")");
    closedCv_.notify_all();
}

void Connection::handleFrame(const std::string& line) {
    spdlog::trace("{} <- {}", name_, line);
    nlohmann::json frame;
    try {
        frame = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("{}: malformed frame: {}", name_, e.what());
        failPending(ErrorCode::CommunicationProtocol, "malformed frame from " + name_);
        auto reply = nlohmann::json{{"jsonrpc", "2.0"},
                                    {"id", nullptr},
                                    {"error", {{"code", kParseError}, {"message", e.what()}}}};
        (void)transport_->writeLine(encodeFrame(reply));
        return;
    }

    if (!frame.is_object()) {
        failPending(ErrorCode::CommunicationProtocol, "malformed frame from " + name_);
        return;
    }

    if (frame.contains("method")) {
        // Own thread per request: the handler may call back into the peer.
        std::thread([self = shared_from_this(), request = std::move(frame)] {
            self->handleRequest(request);
        }).detach();
        return;
    }

    auto idIt = frame.find("id");
    if (idIt == frame.end() || !idIt->is_number_unsigned()) {
        // The waiting call cannot be identified, so every pending call fails.
        spdlog::error("{}: response without a usable id: {}", name_, line);
        failPending(ErrorCode::CommunicationProtocol,
                    "response without a usable id from " + name_);
        return;
    }
    auto id = idIt->get<uint64_t>();
    if (auto err = frame.find("error"); err != frame.end() && !err->is_null()) {
        completeCall(id, errorFromJson(*err));
    } else if (auto res = frame.find("result"); res != frame.end()) {
        completeCall(id, *res);
    } else {
        completeCall(id, Error{ErrorCode::CommunicationProtocol,
                               "response from " + name_ + " has neither result nor error"});
    }
}

void Connection::handleRequest(const nlohmann::json& request) {
    auto id = request.value("id", nlohmann::json());
    Result<nlohmann::json> result = Error{ErrorCode::InternalError, "request not handled"};

    try {
        const auto method = request.at("method").get<std::string>();
        const auto& params = request.at("params");
        const auto objectId = params.at("object").get<uint64_t>();
        const auto args = params.value("args", nlohmann::json::object());

        std::shared_ptr<IServedObject> object;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = objects_.find(objectId);
            if (it != objects_.end()) {
                object = it->second;
            }
        }

        auto dot = method.find('.');
        if (!object) {
            result = Error{ErrorCode::NotFound, method + ": no object with id " +
                                                    std::to_string(objectId)};
        } else if (dot == std::string::npos || method.substr(0, dot) != object->capability()) {
            result = Error{ErrorCode::NotSupported,
                           "method " + method + " not supported by " + object->capability()};
        } else {
            result = object->invoke(method.substr(dot + 1), args, *this);
        }
    } catch (const nlohmann::json::exception& e) {
        result = Error{ErrorCode::CommunicationProtocol, std::string("malformed request: ") + e.what()};
    } catch (const std::exception& e) {
        spdlog::error("{}: request handler failed: {}", name_, e.what());
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (id.is_null()) {
        return;
    }
    auto response = buildResponse(id, result);
    if (!result && result.error().code == ErrorCode::CommunicationProtocol) {
        response["error"]["code"] = kInvalidRequest;
    }
    if (auto written = transport_->writeLine(encodeFrame(response)); !written) {
        spdlog::debug("{}: dropping response: {}", name_, written.error().message);
    }
}

void Connection::close() {
    if (!closed_.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closeReason_.empty()) {
                closeReason_ = "closed locally";
            }
        }
        transport_->close();
    }
    if (!started_.load()) {
        // No reader to observe the shutdown.
        bool expected = false;
        if (closed_.compare_exchange_strong(expected, true)) {
            failPending(ErrorCode::CommunicationFailed, "connection to " + name_ + " closed");
            closedCv_.notify_all();
        }
        return;
    }
    joinReader();
}

void Connection::waitClosed() {
    std::unique_lock<std::mutex> lock(mutex_);
    closedCv_.wait(lock, [this] { return closed_.load(); });
}

// ============================================================================
// CallScope
// ============================================================================

struct CallScope::State {
    explicit State(Connection& c) : connection(c) {}

    Connection& connection;
    std::mutex mutex;
    bool open{true};
    std::vector<uint64_t> ids;
};

CallScope::CallScope(Connection& connection) : state_(std::make_shared<State>(connection)) {}

CallScope::~CallScope() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->open = false;
        ids.swap(state_->ids);
    }
    for (auto id : ids) {
        state_->connection.unregisterObject(id);
    }
}

uint64_t CallScope::add(std::shared_ptr<IServedObject> object) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto id = state_->connection.registerObject(std::move(object));
    state_->ids.push_back(id);
    return id;
}

Result<uint64_t> CallScope::Handle::add(std::shared_ptr<IServedObject> object) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->open) {
        return Error{ErrorCode::InvalidState, "the call that owns this object has returned"};
    }
    auto id = state_->connection.registerObject(std::move(object));
    state_->ids.push_back(id);
    return id;
}

} // namespace kiln::rpc
