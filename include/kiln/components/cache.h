#pragma once

#include <kiln/core/types.h>

#include <filesystem>
#include <memory>
#include <string>

namespace kiln::components {

/**
 * Exclusive hold on one cache key.
 *
 * Released exactly once: release() is idempotent and the destructor releases
 * a lease that is still held.
 */
class CacheLease {
public:
    virtual ~CacheLease() = default;

    virtual const std::string& key() const = 0;
    virtual std::filesystem::path path() const = 0;
    virtual void release() = 0;
    virtual bool held() const = 0;
};

/**
 * Key-scoped cache of downloaded build dependencies.
 */
class ICache {
public:
    virtual ~ICache() = default;

    // Blocks until no other lease for `key` is held.
    virtual Result<std::unique_ptr<CacheLease>> acquire(const std::string& key) = 0;
};

} // namespace kiln::components
