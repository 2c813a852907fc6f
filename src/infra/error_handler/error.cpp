#include "error.hpp"
#include <fmt/core.h>

namespace bxfer::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::NotFound:         return "NotFound";
        case ErrorCode::InvalidPath:      return "InvalidPath";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::CorruptState:     return "CorruptState";
        case ErrorCode::TransferFailure:  return "TransferFailure";
        case ErrorCode::MergeFailure:     return "MergeFailure";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::Io:               return "Io";
        case ErrorCode::NetworkTimeout:   return "NetworkTimeout";
        case ErrorCode::Cancelled:        return "Cancelled";
        case ErrorCode::Unknown:          break;
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::NotFound:
        case ErrorCode::InvalidPath:
        case ErrorCode::PermissionDenied:
        case ErrorCode::CorruptState:
            return true;
        default:
            return false;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() || err.code == ErrorCode::MergeFailure
        ? spdlog::level::err
        : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace bxfer::infra
