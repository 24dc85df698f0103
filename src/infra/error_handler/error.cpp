#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace tickbar::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::CapacityExhausted:
        case ErrorCode::AllocationFailed:
        case ErrorCode::ThreadSpawnFailed:
        case ErrorCode::ConfigInvalid:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::ConfigInvalid:  return 2;
        case ErrorCode::WriteFailed:    return 74;  // EX_IOERR
        case ErrorCode::Interrupted:    return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidHandle:      return "invalid handle";
        case ErrorCode::HandleClosed:       return "handle closed";
        case ErrorCode::CapacityExhausted:  return "capacity exhausted";
        case ErrorCode::AllocationFailed:   return "allocation failed";
        case ErrorCode::ThreadSpawnFailed:  return "thread spawn failed";
        case ErrorCode::ConfigInvalid:      return "invalid config";
        case ErrorCode::WriteFailed:        return "write failed";
        case ErrorCode::Interrupted:        return "interrupted";
        case ErrorCode::Unknown:            break;
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace tickbar::infra
