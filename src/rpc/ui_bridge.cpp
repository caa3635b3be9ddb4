#include <kiln/rpc/proxies.h>
#include <kiln/rpc/servers.h>

#include <spdlog/spdlog.h>

namespace kiln::rpc {

// UI notifications have no return value. A failed relay is logged; the
// component's own call that follows reports the broken connection.
void UiProxy::notify(const std::string& method, nlohmann::json args) const {
    if (auto r = invoke(method, std::move(args)); !r) {
        spdlog::debug("ui relay {} failed: {}", method, r.error().message);
    }
}

Result<std::string> UiProxy::ask(const std::string& query) {
    auto r = invoke("Ui.Ask", {{"query", query}});
    if (!r) {
        return r.error();
    }
    if (!r.value().is_string()) {
        return Error{ErrorCode::CommunicationProtocol, "Ui.Ask: expected a string answer"};
    }
    return r.value().get<std::string>();
}

void UiProxy::say(const std::string& message) {
    notify("Ui.Say", {{"message", message}});
}

void UiProxy::message(const std::string& message) {
    notify("Ui.Message", {{"message", message}});
}

void UiProxy::error(const std::string& message) {
    notify("Ui.Error", {{"message", message}});
}

void UiProxy::machine(const std::string& type, const std::vector<std::string>& data) {
    notify("Ui.Machine", {{"type", type}, {"data", data}});
}

Result<nlohmann::json> UiServer::invoke(const std::string& method, const nlohmann::json& args,
                                        Connection&) {
    if (method == "Ask") {
        auto answer = ui_->ask(args.at("query").get<std::string>());
        if (!answer) {
            return answer.error();
        }
        return nlohmann::json(answer.value());
    }
    if (method == "Say") {
        ui_->say(args.at("message").get<std::string>());
    } else if (method == "Message") {
        ui_->message(args.at("message").get<std::string>());
    } else if (method == "Error") {
        ui_->error(args.at("message").get<std::string>());
    } else if (method == "Machine") {
        ui_->machine(args.at("type").get<std::string>(),
                     args.value("data", std::vector<std::string>{}));
    } else {
        return Error{ErrorCode::NotSupported, "unknown method Ui." + method};
    }
    return nlohmann::json(nullptr);
}

} // namespace kiln::rpc
