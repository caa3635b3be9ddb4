#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace kiln::test_support {

// Owns a fresh directory under the system temp dir, removed on destruction.
class TempDirScope {
public:
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;

    TempDirScope(TempDirScope&& other) noexcept : root_(std::exchange(other.root_, {})) {}
    TempDirScope& operator=(TempDirScope&& other) noexcept {
        if (this != &other) {
            removeAll();
            root_ = std::exchange(other.root_, {});
        }
        return *this;
    }

    ~TempDirScope() { removeAll(); }

    const std::filesystem::path& path() const { return root_; }

    // mkdtemp picks the unique suffix; an empty path means creation failed.
    static TempDirScope unique_under(const std::string& base_name) {
        auto pattern = (std::filesystem::temp_directory_path() / ("kiln-" + base_name + "-XXXXXX"))
                           .string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            return TempDirScope({});
        }
        return TempDirScope(std::filesystem::path(buffer.data()));
    }

    // Writes `content` to `relative`, creating parent directories.
    std::filesystem::path write(const std::filesystem::path& relative,
                                std::string_view content) const {
        auto target = root_ / relative;
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

private:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}

    void removeAll() {
        if (root_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        root_.clear();
    }

    std::filesystem::path root_;
};

} // namespace kiln::test_support
