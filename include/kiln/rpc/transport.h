#pragma once

#include <kiln/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace kiln::rpc {

// Network types announced in the handshake line.
inline constexpr const char* kNetworkUnix = "unix";
inline constexpr const char* kNetworkTcp = "tcp";

bool isSupportedNetwork(std::string_view network);

/**
 * Connected, newline-framed byte stream.
 *
 * writeLine() may be called from several threads; only one thread reads.
 * close() unblocks a pending readLine() on another thread.
 */
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    virtual Result<void> writeLine(std::string_view line) = 0;

    // Returns the next line without its terminator. EOF is reported as
    // CommunicationFailed.
    virtual Result<std::string> readLine() = 0;

    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

/**
 * Dials `address` on `network` ("unix" path or "tcp" host:port).
 */
Result<std::unique_ptr<StreamTransport>> dial(const std::string& network,
                                              const std::string& address,
                                              std::chrono::milliseconds timeout);

struct ListenOptions {
    std::string network{kNetworkUnix};
    uint16_t minPort{10000};
    uint16_t maxPort{25000};
};

/**
 * Listening socket on an ephemeral local address.
 *
 * Unix sockets live in a private temporary directory removed on destruction;
 * TCP listeners bind the first free loopback port in [minPort, maxPort].
 */
class Listener {
public:
    static Result<std::unique_ptr<Listener>> open(const ListenOptions& options);

    ~Listener();
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    const std::string& network() const noexcept;
    const std::string& address() const noexcept;

    Result<std::unique_ptr<StreamTransport>> accept();
    void close();

private:
    struct Impl;
    explicit Listener(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln::rpc
