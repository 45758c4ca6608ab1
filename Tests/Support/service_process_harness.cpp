#include "service_process_harness.h"

#include "ipc_test_utils.h"
#include "core/shared/settings_manager.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QTest>

#include <algorithm>

namespace pc::test {

namespace {

constexpr int kPollMs = 25;
constexpr int kPingTimeoutMs = 1000;

} // namespace

ServiceProcessHarness::ServiceProcessHarness(QString serviceName, QString binaryName)
    : m_serviceName(std::move(serviceName))
    , m_binaryName(std::move(binaryName))
    , m_runtimeDir(QStringLiteral("/tmp/pc-svc-XXXXXX"))
{
}

ServiceProcessHarness::~ServiceProcessHarness()
{
    stop();
}

bool ServiceProcessHarness::start(const ServiceLaunchConfig& config)
{
    if (m_started) {
        return true;
    }
    if (!m_runtimeDir.isValid()) {
        qWarning() << "Cannot create runtime directory for" << m_serviceName;
        return false;
    }
    m_requestTimeoutMs = std::max(500, config.requestTimeoutMs);

    const QString binary = resolveServiceBinary(m_binaryName);
    if (binary.isEmpty()) {
        qWarning() << "Service binary not found:" << m_binaryName;
        return false;
    }

    const QDir runtime(m_runtimeDir.path());
    m_socketPath = runtime.filePath(m_serviceName + QStringLiteral(".sock"));

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("PDFCHAT_RUNTIME_DIR"), runtime.path());
    env.insert(QStringLiteral("PDFCHAT_SOCKET_DIR"), runtime.path());
    if (config.settings) {
        const QString settingsFile = runtime.filePath(QStringLiteral("settings.json"));
        if (!SettingsManager::saveTo(*config.settings, settingsFile)) {
            qWarning() << "Cannot write service settings to" << settingsFile;
            return false;
        }
        env.insert(QStringLiteral("PDFCHAT_SETTINGS"), settingsFile);
    } else {
        // Keep the service off the developer's real settings file.
        env.insert(QStringLiteral("PDFCHAT_SETTINGS"), runtime.filePath(QStringLiteral("none.json")));
    }
    for (auto it = config.env.constBegin(); it != config.env.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }

    m_process.setProcessEnvironment(env);
    m_process.setProcessChannelMode(config.forwardChannels ? QProcess::ForwardedChannels
                                                           : QProcess::SeparateChannels);
    m_process.start(binary, QStringList());
    if (!m_process.waitForStarted(config.startTimeoutMs)) {
        qWarning() << "Service failed to launch:" << m_process.errorString();
        stop();
        return false;
    }

    if (!waitUntilReady(config.readyTimeoutMs)) {
        qWarning() << "Service did not answer ping in time:" << m_serviceName;
        stop();
        return false;
    }

    m_started = true;
    return true;
}

bool ServiceProcessHarness::waitUntilReady(int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (m_process.state() == QProcess::NotRunning) {
            return false;
        }
        if (QFileInfo::exists(m_socketPath)
            && (m_client.isConnected() || m_client.connectToServer(m_socketPath, 200))) {
            const std::optional<QJsonObject> pong =
                m_client.sendRequest(QStringLiteral("ping"), {}, kPingTimeoutMs);
            if (pong && resultPayload(*pong).value(QStringLiteral("pong")).toBool()) {
                return true;
            }
            m_client.disconnect();
        }
        QTest::qWait(kPollMs);
    }
    return false;
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
    m_started = false;
}

bool ServiceProcessHarness::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

int ServiceProcessHarness::timeoutFor(const QString& method) const
{
    // Inline uploads carry base64 payloads.
    if (method == QLatin1String("upload")) {
        return std::max(m_requestTimeoutMs, 15000);
    }
    return m_requestTimeoutMs;
}

QJsonObject ServiceProcessHarness::request(const QString& method, const QJsonObject& params,
                                           int timeoutMs)
{
    const int effectiveMs = timeoutMs > 0 ? timeoutMs : timeoutFor(method);
    if (std::optional<QJsonObject> reply = m_client.sendRequest(method, params, effectiveMs)) {
        return *reply;
    }
    const QJsonObject failure = noReplyError(method, effectiveMs, m_socketPath,
                                             m_client.isConnected());
    qWarning().noquote() << "IPC request got no reply:"
                         << errorPayload(failure).value(QStringLiteral("message")).toString();
    return failure;
}

QJsonObject ServiceProcessHarness::waitForNotification(
    const QString& method, const std::function<bool(const QJsonObject&)>& accept, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    for (;;) {
        const int left = timeoutMs - static_cast<int>(timer.elapsed());
        if (left <= 0) {
            return {};
        }
        const std::optional<QJsonObject> params = m_client.waitForNotification(method, left);
        if (!params) {
            return {};
        }
        if (!accept || accept(*params)) {
            return *params;
        }
    }
}

} // namespace pc::test
