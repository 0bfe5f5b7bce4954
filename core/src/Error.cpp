/**
 * @file Error.cpp
 * @brief Error code names and Error::describe().
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "zyppy/core/Error.hpp"

namespace zyppy::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                 return "NONE";
        case ErrorCode::kQueueFull:            return "QUEUE_FULL";
        case ErrorCode::kQueueClosed:          return "QUEUE_CLOSED";
        case ErrorCode::kInterrupted:          return "INTERRUPTED";
        case ErrorCode::kCancelled:            return "CANCELLED";
        case ErrorCode::kInvalidEncoding:      return "INVALID_ENCODING";
        case ErrorCode::kIntrospectionFailure: return "INTROSPECTION_FAILURE";
        case ErrorCode::kEngineFatal:          return "ENGINE_FATAL";
        case ErrorCode::kWorkerStopped:        return "WORKER_STOPPED";
        case ErrorCode::kInvalidArgument:      return "INVALID_ARGUMENT";
        case ErrorCode::kInvalidState:         return "INVALID_STATE";
        case ErrorCode::kTimeout:              return "TIMEOUT";
        case ErrorCode::kIoError:              return "IO_ERROR";
        case ErrorCode::kInternalError:        return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

std::string Error::describe() const
{
    std::string out{errorCodeName(_code)};
    if (!_message.empty())
    {
        out += ": ";
        out += _message;
    }
    return out;
}

} // namespace zyppy::core
