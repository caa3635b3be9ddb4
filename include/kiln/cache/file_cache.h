#pragma once

#include <kiln/components/cache.h>

#include <filesystem>
#include <memory>
#include <string>

namespace kiln::cache {

// Overrides the cache directory.
inline constexpr const char* kEnvCacheDir = "KILN_CACHE_DIR";
inline constexpr const char* kDefaultCacheDir = "kiln_cache";

/**
 * @brief Directory-backed artifact cache
 *
 * A key maps to `<dir>/<sha256(key)><ext>`. acquire() serializes holders of
 * one key inside this process and, through flock() on a sidecar lock file,
 * across processes sharing the directory.
 */
class FileCache : public components::ICache {
public:
    explicit FileCache(std::filesystem::path directory);
    ~FileCache() override;

    Result<std::unique_ptr<components::CacheLease>> acquire(const std::string& key) override;

    Result<std::filesystem::path> pathFor(const std::string& key) const;
    const std::filesystem::path& directory() const noexcept { return directory_; }

    // KILN_CACHE_DIR or ./kiln_cache, made absolute and created.
    static Result<std::filesystem::path> resolveDirectory();

    struct LockTable;

private:
    std::filesystem::path directory_;
    std::shared_ptr<LockTable> locks_;
};

} // namespace kiln::cache
