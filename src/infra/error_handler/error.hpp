#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace bxfer::infra {

enum class ErrorCode {
    // Fatal for the job (planning cannot continue)
    NotFound,
    InvalidPath,
    PermissionDenied,
    CorruptState,

    // Recoverable (chunk is retried or the step is repeated on the next run)
    TransferFailure,
    MergeFailure,
    ChecksumMismatch,
    Io,
    NetworkTimeout,

    // Not an error for the job, state stays resumable
    Cancelled,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::TransferFailure ||
               code == ErrorCode::NetworkTimeout ||
               code == ErrorCode::Io;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Logs the error at err (fatal or merge failure) or warn and hands it back
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace bxfer::infra
