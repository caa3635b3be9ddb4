#include <kiln/components/artifact.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace kiln::components {

Result<void> BasicArtifact::destroy() {
    std::vector<std::string> failed;
    for (const auto& file : files_) {
        std::error_code ec;
        std::filesystem::remove_all(file, ec);
        if (ec) {
            spdlog::warn("failed to remove artifact file {}: {}", file, ec.message());
            failed.push_back(file);
        }
    }
    if (!failed.empty()) {
        std::string joined;
        for (const auto& f : failed) {
            joined += joined.empty() ? f : ", " + f;
        }
        return Error{ErrorCode::IOError, "failed to remove artifact files: " + joined};
    }
    return Result<void>();
}

} // namespace kiln::components
