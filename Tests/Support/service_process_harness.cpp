#include "service_process_harness.h"

#include "ipc_test_utils.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>

#include <algorithm>

namespace ge::test {

namespace {

const QString kServiceBinary = QStringLiteral("growthengine-service");

} // namespace

ServiceProcessHarness::ServiceProcessHarness()
    : m_runtimeDir(QStringLiteral("/tmp/ge-svch-XXXXXX"))
{
    // Socket paths are length limited, so the socket sits directly in the
    // short runtime directory.
    m_socketPath = QDir(m_runtimeDir.path()).filePath(QStringLiteral("growth.sock"));
}

ServiceProcessHarness::~ServiceProcessHarness()
{
    stop();
}

QProcessEnvironment ServiceProcessHarness::buildEnvironment(const ServiceLaunchConfig& config) const
{
    const QDir runtime(m_runtimeDir.path());
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("GROWTHENGINE_RUNTIME_DIR"), runtime.path());
    env.insert(QStringLiteral("GROWTHENGINE_SOCKET_DIR"), runtime.path());
    env.insert(QStringLiteral("GROWTHENGINE_PID_DIR"), runtime.path());
    env.insert(QStringLiteral("GROWTHENGINE_DATA_DIR"),
               config.dataDir.isEmpty() ? runtime.filePath(QStringLiteral("data")) : config.dataDir);
    env.insert(QStringLiteral("GROWTHENGINE_CONFIG"),
               config.configPath.isEmpty() ? runtime.filePath(QStringLiteral("config.json"))
                                           : config.configPath);
    for (const QString& key : config.extraEnv.keys()) {
        env.insert(key, config.extraEnv.value(key));
    }
    return env;
}

bool ServiceProcessHarness::waitForReadyLine(int timeoutMs)
{
    if (m_process.processChannelMode() == QProcess::ForwardedChannels) {
        // stdout is not captured; the ping loop decides readiness.
        return true;
    }

    QElapsedTimer timer;
    timer.start();
    QByteArray output;
    while (timer.elapsed() < timeoutMs && m_process.state() != QProcess::NotRunning) {
        m_process.waitForReadyRead(50);
        output += m_process.readAllStandardOutput();
        if (output.contains("ready\n")) {
            return true;
        }
    }
    return false;
}

bool ServiceProcessHarness::start(const ServiceLaunchConfig& config)
{
    if (m_started) {
        return true;
    }
    if (!m_runtimeDir.isValid()) {
        qWarning() << "Cannot create runtime directory for" << kServiceBinary;
        return false;
    }
    m_requestTimeoutMs = std::max(500, config.requestDefaultTimeoutMs);

    const QString binaryPath = resolveServiceBinary(kServiceBinary);
    if (binaryPath.isEmpty()) {
        qWarning() << "Service binary not found:" << kServiceBinary;
        return false;
    }
    QFile::remove(m_socketPath);

    m_process.setProcessEnvironment(buildEnvironment(config));
    m_process.setProgram(binaryPath);
    m_process.setProcessChannelMode(
        config.forwardChannels ? QProcess::ForwardedChannels : QProcess::SeparateChannels);
    m_process.start();
    if (!m_process.waitForStarted(config.startTimeoutMs)) {
        stop();
        return false;
    }

    if (!waitForReadyLine(std::max(1000, config.readyTimeoutMs))) {
        qWarning() << "Growth service exited or stayed silent before ready:"
                   << m_process.readAllStandardError();
        stop();
        return false;
    }
    if (!waitForServiceReady(m_client, m_socketPath, config.readyTimeoutMs,
                             std::min(m_requestTimeoutMs, 2000))) {
        qWarning() << "Growth service did not answer ping on" << m_socketPath;
        stop();
        return false;
    }

    m_started = true;
    return true;
}

void ServiceProcessHarness::stop()
{
    if (m_client.isConnected()) {
        m_client.sendRequest(QStringLiteral("shutdown"), {}, 1000);
    }
    m_client.disconnect();

    if (m_process.state() != QProcess::NotRunning && !m_process.waitForFinished(5000)) {
        m_process.terminate();
        if (!m_process.waitForFinished(3000)) {
            m_process.kill();
            m_process.waitForFinished(2000);
        }
    }

    QFile::remove(m_socketPath);
    m_started = false;
}

bool ServiceProcessHarness::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

QJsonObject ServiceProcessHarness::request(const QString& method,
                                           const QJsonObject& params,
                                           int timeoutMs)
{
    return requestOrFailWithDiagnostics(m_client, method, params,
                                        timeoutMs > 0 ? timeoutMs : m_requestTimeoutMs,
                                        m_socketPath);
}

} // namespace ge::test
