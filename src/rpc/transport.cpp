#include <kiln/rpc/transport.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <charconv>
#include <cstdlib>
#include <istream>
#include <mutex>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

namespace kiln::rpc {

namespace {

using UnixProtocol = boost::asio::local::stream_protocol;
using TcpProtocol = boost::asio::ip::tcp;

template <typename Protocol> class AsioStreamTransport final : public StreamTransport {
public:
    AsioStreamTransport(std::shared_ptr<boost::asio::io_context> io,
                        typename Protocol::socket socket, std::string description)
        : io_(std::move(io)), socket_(std::move(socket)), description_(std::move(description)) {}

    ~AsioStreamTransport() override {
        close();
        boost::system::error_code ec;
        socket_.close(ec);
    }

    Result<void> writeLine(std::string_view line) override {
        std::string frame;
        frame.reserve(line.size() + 1);
        frame.append(line);
        frame.push_back('\n');

        std::lock_guard<std::mutex> lock(writeMutex_);
        if (closed_.load()) {
            return Error{ErrorCode::CommunicationFailed, "connection closed"};
        }
        boost::system::error_code ec;
        boost::asio::write(socket_, boost::asio::buffer(frame), ec);
        if (ec) {
            return Error{ErrorCode::CommunicationFailed, "write failed: " + ec.message()};
        }
        return Result<void>();
    }

    Result<std::string> readLine() override {
        boost::system::error_code ec;
        boost::asio::read_until(socket_, buffer_, '\n', ec);
        if (ec) {
            if (ec == boost::asio::error::eof || closed_.load()) {
                return Error{ErrorCode::CommunicationFailed, "connection closed"};
            }
            return Error{ErrorCode::CommunicationFailed, "read failed: " + ec.message()};
        }
        std::istream in(&buffer_);
        std::string line;
        std::getline(in, line);
        return line;
    }

    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        // shutdown() on the raw descriptor wakes a reader blocked on another thread.
        ::shutdown(socket_.native_handle(), SHUT_RDWR);
    }

    std::string describe() const override { return description_; }

private:
    std::shared_ptr<boost::asio::io_context> io_;
    typename Protocol::socket socket_;
    boost::asio::streambuf buffer_;
    std::mutex writeMutex_;
    std::atomic<bool> closed_{false};
    std::string description_;
};

Result<TcpProtocol::endpoint> parseTcpAddress(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        return Error{ErrorCode::InvalidArgument, "invalid tcp address: " + address};
    }
    uint16_t port = 0;
    auto portText = std::string_view(address).substr(colon + 1);
    auto [ptr, errc] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (errc != std::errc{} || ptr != portText.data() + portText.size()) {
        return Error{ErrorCode::InvalidArgument, "invalid tcp port in address: " + address};
    }
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address.substr(0, colon), ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument, "invalid tcp host in address: " + address};
    }
    return TcpProtocol::endpoint(ip, port);
}

template <typename Protocol>
Result<std::unique_ptr<StreamTransport>>
connectWithRetry(const typename Protocol::endpoint& endpoint, const std::string& description,
                 std::chrono::milliseconds timeout) {
    auto io = std::make_shared<boost::asio::io_context>();
    auto deadline = std::chrono::steady_clock::now() + timeout;
    boost::system::error_code ec;
    while (true) {
        typename Protocol::socket socket(*io);
        socket.connect(endpoint, ec);
        if (!ec) {
            return std::unique_ptr<StreamTransport>(
                std::make_unique<AsioStreamTransport<Protocol>>(io, std::move(socket),
                                                                description));
        }
        // The listener is up before the address is announced, so only a
        // momentarily full backlog is worth another attempt.
        bool retryable = ec == boost::asio::error::try_again ||
                         ec == boost::asio::error::connection_refused;
        if (!retryable || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    return Error{ErrorCode::PluginConnect,
                 "failed to connect to " + description + ": " + ec.message()};
}

} // namespace

bool isSupportedNetwork(std::string_view network) {
    return network == kNetworkUnix || network == kNetworkTcp;
}

Result<std::unique_ptr<StreamTransport>> dial(const std::string& network,
                                              const std::string& address,
                                              std::chrono::milliseconds timeout) {
    spdlog::debug("dialing {} address {}", network, address);
    if (network == kNetworkUnix) {
        return connectWithRetry<UnixProtocol>(UnixProtocol::endpoint(address), "unix:" + address,
                                              timeout);
    }
    if (network == kNetworkTcp) {
        auto endpoint = parseTcpAddress(address);
        if (!endpoint) {
            return Error{ErrorCode::PluginConnect, endpoint.error().message};
        }
        return connectWithRetry<TcpProtocol>(endpoint.value(), "tcp:" + address, timeout);
    }
    return Error{ErrorCode::PluginConnect, "unsupported network type: " + network};
}

// ============================================================================
// Listener
// ============================================================================

struct Listener::Impl {
    std::shared_ptr<boost::asio::io_context> io = std::make_shared<boost::asio::io_context>();
    std::unique_ptr<UnixProtocol::acceptor> unixAcceptor;
    std::unique_ptr<TcpProtocol::acceptor> tcpAcceptor;
    std::string network;
    std::string address;
    std::filesystem::path tempDir;
    std::mutex mutex;

    void closeAcceptors() {
        std::lock_guard<std::mutex> lock(mutex);
        boost::system::error_code ec;
        if (unixAcceptor && unixAcceptor->is_open()) {
            ::shutdown(unixAcceptor->native_handle(), SHUT_RDWR);
            unixAcceptor->close(ec);
        }
        if (tcpAcceptor && tcpAcceptor->is_open()) {
            ::shutdown(tcpAcceptor->native_handle(), SHUT_RDWR);
            tcpAcceptor->close(ec);
        }
        if (!tempDir.empty()) {
            std::error_code fec;
            std::filesystem::remove_all(tempDir, fec);
            tempDir.clear();
        }
    }
};

Listener::Listener(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Listener::~Listener() {
    close();
}

const std::string& Listener::network() const noexcept {
    return impl_->network;
}

const std::string& Listener::address() const noexcept {
    return impl_->address;
}

Result<std::unique_ptr<Listener>> Listener::open(const ListenOptions& options) {
    auto impl = std::make_unique<Impl>();
    impl->network = options.network;
    boost::system::error_code ec;

    if (options.network == kNetworkUnix) {
        auto pattern = (std::filesystem::temp_directory_path() / "kiln-plugin-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            return Error{ErrorCode::IOError, "failed to create socket directory"};
        }
        impl->tempDir = pattern;
        impl->address = (impl->tempDir / "plugin.sock").string();

        impl->unixAcceptor = std::make_unique<UnixProtocol::acceptor>(*impl->io);
        UnixProtocol::endpoint endpoint(impl->address);
        impl->unixAcceptor->open(endpoint.protocol(), ec);
        if (!ec) impl->unixAcceptor->bind(endpoint, ec);
        if (!ec) impl->unixAcceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            impl->closeAcceptors();
            return Error{ErrorCode::IOError,
                         "failed to listen on " + impl->address + ": " + ec.message()};
        }
        return std::unique_ptr<Listener>(new Listener(std::move(impl)));
    }

    if (options.network == kNetworkTcp) {
        if (options.minPort == 0 || options.minPort > options.maxPort) {
            return Error{ErrorCode::InvalidArgument, "invalid plugin port range"};
        }
        auto loopback = boost::asio::ip::make_address("127.0.0.1");
        for (uint32_t port = options.minPort; port <= options.maxPort; ++port) {
            auto acceptor = std::make_unique<TcpProtocol::acceptor>(*impl->io);
            TcpProtocol::endpoint endpoint(loopback, static_cast<uint16_t>(port));
            acceptor->open(endpoint.protocol(), ec);
            if (!ec) acceptor->bind(endpoint, ec);
            if (!ec) acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
            if (ec) {
                boost::system::error_code ignored;
                acceptor->close(ignored);
                continue;
            }
            impl->tcpAcceptor = std::move(acceptor);
            impl->address = "127.0.0.1:" + std::to_string(port);
            return std::unique_ptr<Listener>(new Listener(std::move(impl)));
        }
        return Error{ErrorCode::IOError, "no free port in range " +
                                             std::to_string(options.minPort) + "-" +
                                             std::to_string(options.maxPort)};
    }

    return Error{ErrorCode::InvalidArgument, "unsupported network type: " + options.network};
}

Result<std::unique_ptr<StreamTransport>> Listener::accept() {
    boost::system::error_code ec;
    if (impl_->unixAcceptor) {
        UnixProtocol::socket socket(*impl_->io);
        impl_->unixAcceptor->accept(socket, ec);
        if (!ec) {
            return std::unique_ptr<StreamTransport>(
                std::make_unique<AsioStreamTransport<UnixProtocol>>(impl_->io, std::move(socket),
                                                                    "unix:" + impl_->address));
        }
    } else if (impl_->tcpAcceptor) {
        TcpProtocol::socket socket(*impl_->io);
        impl_->tcpAcceptor->accept(socket, ec);
        if (!ec) {
            return std::unique_ptr<StreamTransport>(
                std::make_unique<AsioStreamTransport<TcpProtocol>>(impl_->io, std::move(socket),
                                                                   "tcp:" + impl_->address));
        }
    } else {
        return Error{ErrorCode::InvalidState, "listener is closed"};
    }
    return Error{ErrorCode::IOError, "accept failed: " + ec.message()};
}

void Listener::close() {
    if (impl_) {
        impl_->closeAcceptors();
    }
}

} // namespace kiln::rpc
