#include <kiln/build/hooks.h>

#include <spdlog/spdlog.h>

namespace kiln::build {

Result<void> DispatchHook::run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) {
    auto it = hooks_.find(name);
    if (it == hooks_.end()) {
        spdlog::debug("no hooks registered for '{}'", name);
        return Result<void>();
    }
    for (const auto& hook : it->second) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return Error{ErrorCode::OperationCancelled, "hook '" + name + "' cancelled"};
            }
            running_ = hook;
        }
        auto result = hook->run(name, ui, data);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.reset();
        }
        if (!result) {
            return result;
        }
    }
    return Result<void>();
}

void DispatchHook::cancel() {
    std::shared_ptr<components::IHook> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        running = running_;
    }
    if (running) {
        running->cancel();
    }
}

Result<void> ProvisionHook::run(const std::string& name, ui::IUi& ui, const nlohmann::json&) {
    for (const auto& entry : provisioners_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return Error{ErrorCode::OperationCancelled, "provisioning cancelled"};
            }
            running_ = entry.provisioner;
        }
        ui.say("Provisioning with " + entry.type + "...");
        spdlog::debug("{}: running provisioner {}", name, entry.type);
        auto result = entry.provisioner->provision(ui);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.reset();
        }
        if (!result) {
            return Error{result.error().code,
                         "error running provisioner " + entry.type + ": " + result.error().message,
                         result.error().causes};
        }
    }
    return Result<void>();
}

void ProvisionHook::cancel() {
    std::shared_ptr<components::IProvisioner> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        running = running_;
    }
    if (running) {
        running->cancel();
    }
}

} // namespace kiln::build
