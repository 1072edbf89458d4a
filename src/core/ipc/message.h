#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace ge {

// Wire framing of the growth service: a 4-byte big-endian payload length
// followed by one compact UTF-8 JSON object.
class IpcMessage {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 4 * 1024 * 1024;

    // Returns an empty array when the payload exceeds kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    enum class DecodeStatus {
        Incomplete,  // wait for more bytes
        Complete,
        Malformed,   // oversized frame or non-object payload; drop the peer
    };

    struct DecodeResult {
        DecodeStatus status = DecodeStatus::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);

    // error: {code, codeString, message[, retryable]}
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message,
                                 bool retryable = false);

    // Notifications carry no id.
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& message);
};

} // namespace ge
