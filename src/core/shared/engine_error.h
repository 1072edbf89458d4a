#pragma once

#include <QString>

namespace ge {

// Failure taxonomy shared by every engine operation.
// Duplicate* codes are "already applied" signals: callers turn them into
// non-error results instead of surfacing them to users.
enum class EngineErrorCode {
    DuplicateEvent,
    DuplicateConversion,
    DuplicatePeriod,
    InvalidThreshold,
    TransientStoreError,
    InvariantViolation,
    NotFound,
    InvalidArgument,
};

QString engineErrorCodeToString(EngineErrorCode code);

// Only transient store failures may be retried with the same inputs.
bool isRetryable(EngineErrorCode code);

struct EngineError {
    EngineErrorCode code = EngineErrorCode::InvariantViolation;
    QString message;
};

// Fill an optional out-parameter. No-op when the caller passed nullptr.
inline void setError(EngineError* error, EngineErrorCode code, const QString& message)
{
    if (error) {
        error->code = code;
        error->message = message;
    }
}

} // namespace ge
