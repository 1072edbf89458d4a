#pragma once

#include <QString>

namespace ge {

// Error codes carried in the "error" envelope of the growth service.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 3,
    Conflict           = 4,
    AlreadyRunning     = 5,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 8,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::Conflict:           return QStringLiteral("CONFLICT");
    case IpcErrorCode::AlreadyRunning:     return QStringLiteral("ALREADY_RUNNING");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace ge
