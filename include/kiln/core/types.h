#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kiln {

// Error types
enum class ErrorCode {
    Success = 0,
    ConfigError,
    ValidationError,
    ComponentNotFound,
    // Plugin launch failures (spawn and handshake)
    PluginNotFound,
    PluginTimeout,
    PluginProtocol,
    PluginConnect,
    // Post-handshake transport failures
    CommunicationFailed,
    CommunicationProtocol,
    BuildFailed,
    InvalidArgument,
    InvalidState,
    OperationCancelled,
    IOError,
    Timeout,
    NotFound,
    NotSupported,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::ComponentNotFound: return "Component not found";
        case ErrorCode::PluginNotFound: return "Plugin executable not found";
        case ErrorCode::PluginTimeout: return "Timed out waiting for plugin handshake";
        case ErrorCode::PluginProtocol: return "Plugin handshake protocol error";
        case ErrorCode::PluginConnect: return "Failed to connect to plugin";
        case ErrorCode::CommunicationFailed: return "Plugin communication failed";
        case ErrorCode::CommunicationProtocol: return "Malformed plugin response";
        case ErrorCode::BuildFailed: return "Build failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifier used on the wire; errorCodeFromName() is its inverse.
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::ComponentNotFound: return "ComponentNotFound";
        case ErrorCode::PluginNotFound: return "PluginNotFound";
        case ErrorCode::PluginTimeout: return "PluginTimeout";
        case ErrorCode::PluginProtocol: return "PluginProtocol";
        case ErrorCode::PluginConnect: return "PluginConnect";
        case ErrorCode::CommunicationFailed: return "CommunicationFailed";
        case ErrorCode::CommunicationProtocol: return "CommunicationProtocol";
        case ErrorCode::BuildFailed: return "BuildFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::OperationCancelled: return "OperationCancelled";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

ErrorCode errorCodeFromName(std::string_view name);

constexpr bool isLaunchError(ErrorCode code) {
    return code == ErrorCode::PluginNotFound || code == ErrorCode::PluginTimeout ||
           code == ErrorCode::PluginProtocol || code == ErrorCode::PluginConnect;
}

constexpr bool isCommunicationError(ErrorCode code) {
    return code == ErrorCode::CommunicationFailed || code == ErrorCode::CommunicationProtocol;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    // Sub-errors folded into this one (aggregated configuration problems).
    std::vector<Error> causes;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
    Error(ErrorCode c, std::string msg, std::vector<Error> subErrors)
        : code(c), message(std::move(msg)), causes(std::move(subErrors)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

/**
 * @brief Accumulates independent problems so they can be reported together
 *
 * Validation and configuration checks keep going after the first problem and
 * fold everything into one Error at the end.
 */
class ErrorList {
public:
    void add(Error error) { errors_.push_back(std::move(error)); }
    void add(ErrorCode code, std::string message) { errors_.emplace_back(code, std::move(message)); }

    // Merges the causes of an aggregated error, or the error itself.
    void merge(const Error& error);

    bool empty() const noexcept { return errors_.empty(); }
    size_t size() const noexcept { return errors_.size(); }
    const std::vector<Error>& errors() const noexcept { return errors_; }

    // Success when empty, otherwise one Error of the given code listing every cause.
    Result<void> toResult(ErrorCode code) const;

private:
    std::vector<Error> errors_;
};

// Human readable rendering of an error including its causes.
std::string formatError(const Error& error);

} // namespace kiln

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<kiln::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(kiln::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", kiln::errorToString(error));
    }
};
