#include <kiln/core/types.h>

#include <array>

namespace kiln {

ErrorCode errorCodeFromName(std::string_view name) {
    static constexpr std::array kAll = {
        ErrorCode::Success,
        ErrorCode::ConfigError,
        ErrorCode::ValidationError,
        ErrorCode::ComponentNotFound,
        ErrorCode::PluginNotFound,
        ErrorCode::PluginTimeout,
        ErrorCode::PluginProtocol,
        ErrorCode::PluginConnect,
        ErrorCode::CommunicationFailed,
        ErrorCode::CommunicationProtocol,
        ErrorCode::BuildFailed,
        ErrorCode::InvalidArgument,
        ErrorCode::InvalidState,
        ErrorCode::OperationCancelled,
        ErrorCode::IOError,
        ErrorCode::Timeout,
        ErrorCode::NotFound,
        ErrorCode::NotSupported,
        ErrorCode::InternalError,
        ErrorCode::Unknown,
    };
    for (auto code : kAll) {
        if (name == errorCodeName(code)) {
            return code;
        }
    }
    return ErrorCode::Unknown;
}

void ErrorList::merge(const Error& error) {
    if (error.causes.empty()) {
        errors_.push_back(error);
        return;
    }
    for (const auto& cause : error.causes) {
        errors_.push_back(cause);
    }
}

Result<void> ErrorList::toResult(ErrorCode code) const {
    if (errors_.empty()) {
        return Result<void>();
    }
    std::string message = std::to_string(errors_.size()) +
                          (errors_.size() == 1 ? " error occurred:" : " errors occurred:");
    for (const auto& e : errors_) {
        message += "\n* " + e.message;
    }
    return Error{code, std::move(message), errors_};
}

std::string formatError(const Error& error) {
    if (error.message.empty()) {
        return errorToString(error.code);
    }
    return error.message;
}

} // namespace kiln
