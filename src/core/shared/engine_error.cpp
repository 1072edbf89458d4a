#include "core/shared/engine_error.h"

namespace ge {

QString engineErrorCodeToString(EngineErrorCode code)
{
    switch (code) {
    case EngineErrorCode::DuplicateEvent:      return QStringLiteral("DUPLICATE_EVENT");
    case EngineErrorCode::DuplicateConversion: return QStringLiteral("DUPLICATE_CONVERSION");
    case EngineErrorCode::DuplicatePeriod:     return QStringLiteral("DUPLICATE_PERIOD");
    case EngineErrorCode::InvalidThreshold:    return QStringLiteral("INVALID_THRESHOLD");
    case EngineErrorCode::TransientStoreError: return QStringLiteral("TRANSIENT_STORE_ERROR");
    case EngineErrorCode::InvariantViolation:  return QStringLiteral("INVARIANT_VIOLATION");
    case EngineErrorCode::NotFound:            return QStringLiteral("NOT_FOUND");
    case EngineErrorCode::InvalidArgument:     return QStringLiteral("INVALID_ARGUMENT");
    }
    return QStringLiteral("UNKNOWN");
}

bool isRetryable(EngineErrorCode code)
{
    return code == EngineErrorCode::TransientStoreError;
}

} // namespace ge
