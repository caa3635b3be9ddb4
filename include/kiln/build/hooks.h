#pragma once

#include <kiln/components/hook.h>
#include <kiln/components/provisioner.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kiln::build {

/**
 * Runs every hook registered under the name it is invoked with, in order.
 */
class DispatchHook : public components::IHook {
public:
    using HookMap = std::map<std::string, std::vector<std::shared_ptr<components::IHook>>>;

    explicit DispatchHook(HookMap hooks) : hooks_(std::move(hooks)) {}

    Result<void> run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) override;
    void cancel() override;

private:
    HookMap hooks_;
    std::mutex mutex_;
    std::shared_ptr<components::IHook> running_;
    bool cancelled_{false};
};

/**
 * Hook a builder triggers once its machine is reachable; runs the build's
 * provisioners one after another.
 */
class ProvisionHook : public components::IHook {
public:
    struct Entry {
        std::string type;
        std::shared_ptr<components::IProvisioner> provisioner;
    };

    explicit ProvisionHook(std::vector<Entry> provisioners)
        : provisioners_(std::move(provisioners)) {}

    Result<void> run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) override;
    void cancel() override;

private:
    std::vector<Entry> provisioners_;
    std::mutex mutex_;
    std::shared_ptr<components::IProvisioner> running_;
    bool cancelled_{false};
};

} // namespace kiln::build
