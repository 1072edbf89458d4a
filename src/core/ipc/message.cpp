#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>
#include <cstring>

namespace ge {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(geIpc, "Refusing to encode %d byte message (max %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(&len), kHeaderSize);
    frame.append(payload);
    return frame;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;
    if (buffer.size() < kHeaderSize) {
        return result;
    }

    quint32 rawLen = 0;
    std::memcpy(&rawLen, buffer.constData(), kHeaderSize);
    const quint32 payloadLen = qFromBigEndian(rawLen);
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(geIpc, "Frame length %u exceeds max %d", payloadLen, kMaxMessageSize);
        result.status = DecodeStatus::Malformed;
        return result;
    }

    const int frameLen = kHeaderSize + static_cast<int>(payloadLen);
    if (buffer.size() < frameLen) {
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kHeaderSize, static_cast<int>(payloadLen)), &parseError);
    result.bytesConsumed = frameLen;

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(geIpc, "Dropping malformed frame: %s",
                 parseError.error != QJsonParseError::NoError
                     ? qPrintable(parseError.errorString())
                     : "payload is not a JSON object");
        result.status = DecodeStatus::Malformed;
        return result;
    }

    result.status = DecodeStatus::Complete;
    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message,
                                  bool retryable)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;
    if (retryable) {
        error[QStringLiteral("retryable")] = true;
    }

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& message)
{
    const qint64 id = message.value(QStringLiteral("id")).toInteger();
    return id > 0 ? static_cast<uint64_t>(id) : 0;
}

} // namespace ge
