#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace ge {

namespace {

bool socketHasLivePeer(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    const bool connected = peer.waitForConnected(150);
    if (connected) {
        peer.disconnectFromServer();
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(geIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(geIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasLivePeer(socketPath)) {
        const QString err = QStringLiteral("Another growth service owns %1").arg(socketPath);
        LOG_ERROR(geIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(geIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(geIpc, "Failed to listen on %s after stale cleanup: %s",
                  qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(geIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Forget the clients before disconnecting so the disconnected() slot
    // finds nothing to detach.
    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(geIpc, "Closed %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray frame = IpcMessage::encode(notification);
    if (frame.isEmpty()) {
        return;
    }

    int delivered = 0;
    for (QLocalSocket* client : m_clients) {
        if (client->state() != QLocalSocket::ConnectedState) {
            continue;
        }
        if (client->write(frame) == frame.size()) {
            ++delivered;
        }
    }
    LOG_DEBUG(geIpc, "Broadcast %s to %d/%d client(s)",
              qPrintable(notification.value(QStringLiteral("method")).toString()),
              delivered, clientCount());
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());
        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);
        LOG_DEBUG(geIpc, "Client connected (%d total)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxReadBufferSize) {
        dropClient(client, "read buffer overflow");
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && detachClient(client)) {
        LOG_DEBUG(geIpc, "Client disconnected (%d left)", clientCount());
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::dropClient(QLocalSocket* client, const char* reason)
{
    LOG_WARN(geIpc, "Dropping client: %s", reason);
    const bool wasTracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (wasTracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removed = m_clients.removeOne(client);
    return m_readBuffers.remove(client) > 0 || removed;
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(buffer);
        if (decoded.status == IpcMessage::DecodeStatus::Incomplete) {
            return;
        }
        if (decoded.status == IpcMessage::DecodeStatus::Malformed) {
            dropClient(client, "malformed frame");
            return;
        }
        buffer.remove(0, decoded.bytesConsumed);

        const QJsonObject& incoming = decoded.json;
        const QString type = incoming.value(QStringLiteral("type")).toString();
        const QString method = incoming.value(QStringLiteral("method")).toString();

        if (type == QLatin1String("notification")) {
            LOG_DEBUG(geIpc, "Ignoring client notification %s", qPrintable(method));
            continue;
        }
        if (type != QLatin1String("request")) {
            LOG_WARN(geIpc, "Unknown message type '%s'", qPrintable(type));
            continue;
        }

        const uint64_t id = IpcMessage::requestId(incoming);
        LOG_DEBUG(geIpc, "Request %s id=%llu", qPrintable(method),
                  static_cast<unsigned long long>(id));

        const QJsonObject response = m_handler
            ? m_handler(incoming)
            : IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                    QStringLiteral("No request handler registered"));

        // The handler may have shut the server down.
        if (!m_clients.contains(client)) {
            return;
        }
        const QByteArray frame = IpcMessage::encode(response);
        if (!frame.isEmpty()) {
            client->write(frame);
            client->flush();
        }
    }
}

} // namespace ge
