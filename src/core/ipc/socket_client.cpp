#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"
#include <QElapsedTimer>

#include <algorithm>

namespace ge {

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(new QLocalSocket(this))
{
    connect(m_socket, &QLocalSocket::disconnected, this, &SocketClient::disconnected);
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    if (socketPath.trimmed().isEmpty() || timeoutMs <= 0) {
        const QString err = QStringLiteral("Invalid connect arguments");
        LOG_ERROR(geIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    m_socket->abort();
    m_readBuffer.clear();
    m_responses.clear();

    m_socket->connectToServer(socketPath);
    if (!m_socket->waitForConnected(timeoutMs)) {
        const QString err = m_socket->errorString();
        LOG_DEBUG(geIpc, "Cannot connect to %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_DEBUG(geIpc, "Connected to %s", qPrintable(socketPath));
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    m_readBuffer.clear();
    m_responses.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        LOG_WARN(geIpc, "Cannot send %s: not connected", qPrintable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray frame = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (frame.isEmpty()) {
        return std::nullopt;
    }
    m_socket->write(frame);
    m_socket->flush();

    QElapsedTimer timer;
    timer.start();
    while (!m_responses.contains(id)) {
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0 || m_socket->state() != QLocalSocket::ConnectedState) {
            break;
        }
        if (m_socket->bytesAvailable() == 0) {
            m_socket->waitForReadyRead(static_cast<int>(std::min<qint64>(remaining, 50)));
        }
        drainSocket();
    }

    if (!m_responses.contains(id)) {
        LOG_WARN(geIpc, "Request %s id=%llu timed out after %d ms", qPrintable(method),
                 static_cast<unsigned long long>(id), timeoutMs);
        return std::nullopt;
    }
    return m_responses.take(id);
}

void SocketClient::setNotificationHandler(NotificationHandler handler)
{
    m_notificationHandler = std::move(handler);
}

void SocketClient::pollNotifications(int waitMs)
{
    if (waitMs > 0 && m_socket->bytesAvailable() == 0) {
        m_socket->waitForReadyRead(waitMs);
    }
    drainSocket();
}

void SocketClient::drainSocket()
{
    m_readBuffer.append(m_socket->readAll());

    while (true) {
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(m_readBuffer);
        if (decoded.status == IpcMessage::DecodeStatus::Incomplete) {
            return;
        }
        if (decoded.status == IpcMessage::DecodeStatus::Malformed) {
            LOG_ERROR(geIpc, "Malformed frame from server, disconnecting");
            m_readBuffer.clear();
            m_socket->abort();
            return;
        }
        m_readBuffer.remove(0, decoded.bytesConsumed);

        const QJsonObject& msg = decoded.json;
        const QString type = msg.value(QStringLiteral("type")).toString();
        if (type == QLatin1String("response") || type == QLatin1String("error")) {
            m_responses.insert(IpcMessage::requestId(msg), msg);
        } else if (type == QLatin1String("notification")) {
            if (m_notificationHandler) {
                m_notificationHandler(msg.value(QStringLiteral("method")).toString(),
                                      msg.value(QStringLiteral("params")).toObject());
            }
        } else {
            LOG_WARN(geIpc, "Unexpected message type '%s'", qPrintable(type));
        }
    }
}

} // namespace ge
