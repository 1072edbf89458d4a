#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace ge {

// Local-socket front end. Decodes framed requests from every client,
// hands them to the request handler on the event loop thread and writes
// the returned envelope back to the same client.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Per-client cap on buffered, not yet decoded bytes.
    static constexpr int kMaxReadBufferSize = 2 * IpcMessage::kMaxMessageSize;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // A stale socket file left by a dead process is removed; a socket
    // with a live peer is refused.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_clients.size()); }

    void setRequestHandler(RequestHandler handler);

    // Best effort: clients that cannot take the write are skipped.
    void broadcast(const QJsonObject& notification);

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    void processBuffer(QLocalSocket* client);
    void dropClient(QLocalSocket* client, const char* reason);
    bool detachClient(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace ge
