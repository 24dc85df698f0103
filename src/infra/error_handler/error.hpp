#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace tickbar::infra {

enum class ErrorCode {
    // Ошибки вызывающей стороны (нарушение предусловий)
    InvalidHandle,
    HandleClosed,

    // Исчерпание ресурсов: create возвращает нулевой handle
    CapacityExhausted,
    AllocationFailed,
    ThreadSpawnFailed,

    // Окружение
    ConfigInvalid,
    WriteFailed,
    Interrupted,

    Unknown,
};

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
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Нарушение контракта вызывающей стороной, а не сбой среды
    [[nodiscard]] auto is_precondition() const -> bool {
        return code == ErrorCode::InvalidHandle ||
               code == ErrorCode::HandleClosed;
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

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

} // namespace tickbar::infra
