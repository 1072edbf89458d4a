#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <optional>

namespace ge {

// Blocking client for the growth service socket. Usable from a thread
// without an event loop: every wait goes through QLocalSocket::waitFor*.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // Returns the response or error envelope; nullopt on timeout or when
    // not connected.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 10000);

    using NotificationHandler = std::function<void(const QString& method, const QJsonObject& params)>;
    void setNotificationHandler(NotificationHandler handler);

    // Read whatever has arrived, dispatching notifications.
    void pollNotifications(int waitMs = 0);

signals:
    void disconnected();
    void errorOccurred(const QString& error);

private:
    void drainSocket();

    QLocalSocket* m_socket = nullptr;
    QByteArray m_readBuffer;
    uint64_t m_nextRequestId = 1;
    QHash<quint64, QJsonObject> m_responses;
    NotificationHandler m_notificationHandler;
};

} // namespace ge
