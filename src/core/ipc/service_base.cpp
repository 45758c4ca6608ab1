#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

#include <unistd.h>

#include <algorithm>
#include <cstdio>

namespace pc {

namespace {

QString pathFromEnv(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_uptime.start();
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });

    registerMethod(QStringLiteral("ping"), [this](uint64_t id, const QJsonObject&) {
        return handlePing(id);
    });
    registerMethod(QStringLiteral("shutdown"), [this](uint64_t id, const QJsonObject&) {
        return handleShutdown(id);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);
    const QString directory = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(directory)) {
        LOG_ERROR(pcIpc, "Cannot create socket directory %s", qUtf8Printable(directory));
        return 1;
    }
    if (!m_server->listen(path)) {
        LOG_ERROR(pcIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }

    LOG_INFO(pcIpc, "Service '%s' ready on %s (%d methods)", qUtf8Printable(m_serviceName),
             qUtf8Printable(path), static_cast<int>(m_methods.size()));

    // Launchers wait for this line before connecting.
    std::fputs("ready\n", stdout);
    std::fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(socketDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString fromEnv = pathFromEnv("PDFCHAT_RUNTIME_DIR");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QStringLiteral("/tmp/pdfchat-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    const QString fromEnv = pathFromEnv("PDFCHAT_SOCKET_DIR");
    return fromEnv.isEmpty() ? runtimeDirectory() : fromEnv;
}

void ServiceBase::registerMethod(const QString& method, MethodHandler handler)
{
    m_methods.insert(method, std::move(handler));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const uint64_t id = IpcMessage::idOf(request);
    const QString method = request.value(QStringLiteral("method")).toString();

    const auto it = m_methods.constFind(method);
    if (it == m_methods.constEnd()) {
        LOG_WARN(pcIpc, "Unknown method '%s' for service '%s'",
                 qUtf8Printable(method), qUtf8Printable(m_serviceName));
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(method));
    }
    return it.value()(id, request.value(QStringLiteral("params")).toObject());
}

QJsonObject ServiceBase::handlePing(uint64_t id)
{
    QStringList methods = m_methods.keys();
    std::sort(methods.begin(), methods.end());

    QJsonObject result = statusFields();
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("service")] = m_serviceName;
    result[QStringLiteral("pid")] = static_cast<qint64>(QCoreApplication::applicationPid());
    result[QStringLiteral("uptime_ms")] = m_uptime.elapsed();
    result[QStringLiteral("requests_handled")] = static_cast<qint64>(m_server->requestsHandled());
    result[QStringLiteral("clients")] = m_server->clientCount();
    result[QStringLiteral("methods")] = QJsonArray::fromStringList(methods);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject ServiceBase::handleShutdown(uint64_t id)
{
    LOG_INFO(pcIpc, "Shutdown requested for service '%s'", qUtf8Printable(m_serviceName));

    // Quit once the reply has been written.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;
    return IpcMessage::makeResponse(id, result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace pc
