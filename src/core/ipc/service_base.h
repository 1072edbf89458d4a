#pragma once

#include "core/ipc/socket_server.h"
#include <QElapsedTimer>
#include <QString>

namespace ge {

// Base of a local-socket service process: owns the SocketServer, resolves
// runtime paths from GROWTHENGINE_* environment variables and answers the
// built-in ping/shutdown methods. Subclasses add methods by overriding
// handleRequest() and falling back to this implementation.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listen on socketPath(serviceName) and write the pid file.
    bool start();
    // start() and enter the event loop; returns the process exit code.
    int run();
    void stop();

    const QString& serviceName() const { return m_serviceName; }

    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();
    static QString pidDirectory();
    static QString pidPath(const QString& serviceName);
    static QString dataDirectory();

    // Dispatch one decoded request envelope. Public so the request surface
    // can be exercised without a socket.
    virtual QJsonObject handleRequest(const QJsonObject& request);

signals:
    void shutdownRequested();

protected:
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    void sendNotification(const QString& method, const QJsonObject& params = {});

    QString m_serviceName;
    SocketServer* m_server = nullptr;

private:
    QElapsedTimer m_uptime;
    bool m_wrotePidFile = false;
};

} // namespace ge
