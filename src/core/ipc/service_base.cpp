#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QStandardPaths>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace ge {

namespace {

QString envPath(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(new SocketServer(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
    m_uptime.start();
}

ServiceBase::~ServiceBase()
{
    stop();
}

bool ServiceBase::start()
{
    const QString path = socketPath(m_serviceName);
    const QDir socketDir = QFileInfo(path).dir();
    if (!socketDir.exists() && !socketDir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(geIpc, "Cannot create socket directory %s", qPrintable(socketDir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(geIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }

    const QString pidFile = pidPath(m_serviceName);
    QDir().mkpath(QFileInfo(pidFile).absolutePath());
    QFile pid(pidFile);
    if (pid.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        pid.write(QByteArray::number(static_cast<qint64>(getpid())));
        m_wrotePidFile = true;
    } else {
        LOG_WARN(geIpc, "Cannot write pid file %s: %s",
                 qPrintable(pidFile), qPrintable(pid.errorString()));
    }

    LOG_INFO(geIpc, "Service '%s' listening on %s", qPrintable(m_serviceName), qPrintable(path));
    return true;
}

int ServiceBase::run()
{
    if (!start()) {
        return 1;
    }

    // Readiness line for process supervisors.
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    const int rc = QCoreApplication::exec();
    stop();
    return rc;
}

void ServiceBase::stop()
{
    m_server->close();
    if (m_wrotePidFile) {
        QFile::remove(pidPath(m_serviceName));
        m_wrotePidFile = false;
    }
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString dir = envPath("GROWTHENGINE_RUNTIME_DIR");
    if (!dir.isEmpty()) {
        return dir;
    }
    return QStringLiteral("/tmp/growthengine-%1").arg(static_cast<qulonglong>(getuid()));
}

QString ServiceBase::socketDirectory()
{
    const QString dir = envPath("GROWTHENGINE_SOCKET_DIR");
    return dir.isEmpty() ? runtimeDirectory() : dir;
}

QString ServiceBase::pidDirectory()
{
    const QString dir = envPath("GROWTHENGINE_PID_DIR");
    return dir.isEmpty() ? runtimeDirectory() : dir;
}

QString ServiceBase::pidPath(const QString& serviceName)
{
    return QDir::cleanPath(pidDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".pid"));
}

QString ServiceBase::dataDirectory()
{
    const QString dir = envPath("GROWTHENGINE_DATA_DIR");
    if (!dir.isEmpty()) {
        return dir;
    }
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/growthengine");
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(geIpc, "Unknown method '%s' for service '%s'",
             qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::Unsupported,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("service")] = m_serviceName;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("uptimeMs")] = m_uptime.elapsed();
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(geIpc, "Shutdown requested for '%s'", qPrintable(m_serviceName));
    emit shutdownRequested();

    // Quit after the response has been written.
    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }

    QJsonObject result;
    result[QStringLiteral("shuttingDown")] = true;
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace ge
