#include <kiln/builtin/components.h>
#include <kiln/config/config_bundle.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace kiln::builtin {

namespace fs = std::filesystem;

Result<std::vector<std::string>> FileBuilder::prepare(const std::vector<ConfigBundle>& configs) {
    const auto merged = config::mergeBundles(configs);
    config::ConfigDecoder decoder(merged);
    target_ = decoder.requireString("target");
    content_ = decoder.optionalString("content");
    source_ = decoder.optionalString("source");
    decoder.rejectUnknownKeys({"target", "content", "source"});

    const bool hasContent = decoder.has("content");
    const bool hasSource = decoder.has("source");
    if (hasContent == hasSource) {
        decoder.fail("exactly one of 'content' or 'source' must be specified");
    }
    if (hasSource && !source_.empty()) {
        std::error_code ec;
        if (!fs::is_regular_file(source_, ec)) {
            decoder.fail("source file '" + source_.string() + "' does not exist");
        }
    }
    if (auto r = decoder.finish(); !r) {
        return r.error();
    }
    std::vector<std::string> warnings;
    if (hasContent && content_.empty()) {
        warnings.push_back("'content' is empty; the target will be an empty file");
    }
    return warnings;
}

Result<void> FileBuilder::copyThroughCache(ui::IUi& ui, components::ICache& cache) {
    std::error_code ec;
    const auto absolute = fs::absolute(source_, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "cannot resolve " + source_.string() + ": " + ec.message()};
    }

    auto lease = cache.acquire("file:" + absolute.string());
    if (!lease) {
        return lease.error();
    }
    const auto cached = lease.value()->path();
    if (!fs::exists(cached, ec)) {
        ui.say("Caching " + absolute.string());
        fs::copy_file(absolute, cached, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fs::remove(cached, ec);
            return Error{ErrorCode::IOError, "failed to cache " + absolute.string() + ": " +
                                                 ec.message()};
        }
    } else {
        ui.message("Using cached copy of " + absolute.string());
    }
    fs::copy_file(cached, target_, fs::copy_options::overwrite_existing, ec);
    lease.value()->release();
    if (ec) {
        return Error{ErrorCode::IOError,
                     "failed to write " + target_.string() + ": " + ec.message()};
    }
    return Result<void>();
}

Result<std::shared_ptr<components::IArtifact>>
FileBuilder::run(ui::IUi& ui, components::IHook& hook, components::ICache& cache) {
    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "build cancelled"};
    }
    if (target_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "cannot create " + target_.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    if (!source_.empty()) {
        if (auto r = copyThroughCache(ui, cache); !r) {
            return r.error();
        }
    } else {
        ui.say("Writing " + target_.string());
        std::ofstream out(target_, std::ios::binary | std::ios::trunc);
        out << content_;
        out.close();
        if (!out) {
            return Error{ErrorCode::IOError, "failed to write " + target_.string()};
        }
    }

    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "build cancelled"};
    }
    nlohmann::json data{{"path", target_.string()}};
    if (auto r = hook.run(components::kHookProvision, ui, data); !r) {
        return r.error();
    }
    return std::shared_ptr<components::IArtifact>(std::make_shared<components::BasicArtifact>(
        kFileBuilderId, target_.string(), std::vector<std::string>{target_.string()},
        "Stored file: " + target_.string()));
}

void FileBuilder::cancel() {
    spdlog::debug("file builder cancelled");
    cancelled_ = true;
}

} // namespace kiln::builtin
