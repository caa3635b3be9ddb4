#include <kiln/cache/file_cache.h>
#include <kiln/crypto/sha256.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <set>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace kiln::cache {

namespace fs = std::filesystem;

struct FileCache::LockTable {
    std::mutex mutex;
    std::condition_variable cv;
    std::set<std::string> held;

    void lock(const std::string& key) {
        std::unique_lock<std::mutex> guard(mutex);
        cv.wait(guard, [&] { return held.count(key) == 0; });
        held.insert(key);
    }

    void unlock(const std::string& key) {
        {
            std::lock_guard<std::mutex> guard(mutex);
            held.erase(key);
        }
        cv.notify_all();
    }
};

namespace {

// Short alphanumeric suffixes (".iso", ".box") survive hashing so tools that
// sniff extensions still work on cached files.
std::string keyExtension(const std::string& key) {
    auto dot = key.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= key.size()) {
        return {};
    }
    auto slash = key.find_last_of('/');
    if (slash != std::string::npos && slash > dot) {
        return {};
    }
    auto ext = key.substr(dot);
    if (ext.size() > 6) {
        return {};
    }
    for (size_t i = 1; i < ext.size(); ++i) {
        if (!std::isalnum(static_cast<unsigned char>(ext[i]))) {
            return {};
        }
    }
    return ext;
}

class FileCacheLease : public components::CacheLease {
public:
    FileCacheLease(std::string key, fs::path path, int lockFd,
                   std::shared_ptr<FileCache::LockTable> locks)
        : key_(std::move(key)), path_(std::move(path)), lockFd_(lockFd), locks_(std::move(locks)) {}

    ~FileCacheLease() override { release(); }

    const std::string& key() const override { return key_; }
    fs::path path() const override { return path_; }

    void release() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!held_) {
            return;
        }
        held_ = false;
        if (lockFd_ >= 0) {
            ::flock(lockFd_, LOCK_UN);
            ::close(lockFd_);
            lockFd_ = -1;
        }
        locks_->unlock(key_);
        spdlog::debug("cache: released {}", key_);
    }

    bool held() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_;
    }

private:
    std::string key_;
    fs::path path_;
    int lockFd_;
    std::shared_ptr<FileCache::LockTable> locks_;
    mutable std::mutex mutex_;
    bool held_{true};
};

} // namespace

FileCache::FileCache(fs::path directory)
    : directory_(std::move(directory)), locks_(std::make_shared<LockTable>()) {}

FileCache::~FileCache() = default;

Result<fs::path> FileCache::resolveDirectory() {
    fs::path dir = kDefaultCacheDir;
    if (const char* env = std::getenv(kEnvCacheDir); env && *env) {
        dir = env;
    }
    std::error_code ec;
    auto absolute = fs::absolute(dir, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "cannot resolve cache directory " + dir.string() + ": " + ec.message()};
    }
    fs::create_directories(absolute, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "cannot create cache directory " + absolute.string() + ": " + ec.message()};
    }
    return absolute;
}

Result<fs::path> FileCache::pathFor(const std::string& key) const {
    auto digest = crypto::sha256Hex(key);
    if (!digest) {
        return digest.error();
    }
    return directory_ / (digest.value() + keyExtension(key));
}

Result<std::unique_ptr<components::CacheLease>> FileCache::acquire(const std::string& key) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "cache key must not be empty"};
    }
    auto path = pathFor(key);
    if (!path) {
        return path.error();
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "cannot create cache directory " + directory_.string() +
                                             ": " + ec.message()};
    }

    locks_->lock(key);

    const auto lockPath = path.value().string() + ".lock";
    int fd = ::open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        locks_->unlock(key);
        return Error{ErrorCode::IOError,
                     "cannot open cache lock " + lockPath + ": " + std::strerror(err)};
    }
    int rc;
    do {
        rc = ::flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        int err = errno;
        ::close(fd);
        locks_->unlock(key);
        return Error{ErrorCode::IOError,
                     "cannot lock cache entry " + lockPath + ": " + std::strerror(err)};
    }

    spdlog::debug("cache: acquired {} -> {}", key, path.value().string());
    return std::unique_ptr<components::CacheLease>(
        std::make_unique<FileCacheLease>(key, path.value(), fd, locks_));
}

} // namespace kiln::cache
