#pragma once

#include "core/ipc/socket_server.h"
#include <QElapsedTimer>
#include <QHash>
#include <QString>
#include <functional>
#include <memory>

namespace pc {

// Hosts a SocketServer on <socketDirectory>/<serviceName>.sock and routes
// requests by method name. "ping" and "shutdown" are always registered.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens, prints "ready" on stdout and enters the event loop.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    // $PDFCHAT_SOCKET_DIR, else $PDFCHAT_RUNTIME_DIR, else /tmp/pdfchat-<uid>.
    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

protected:
    using MethodHandler = std::function<QJsonObject(uint64_t id, const QJsonObject& params)>;

    void registerMethod(const QString& method, MethodHandler handler);

    // Extra fields merged into the ping result.
    virtual QJsonObject statusFields() const { return {}; }

    void sendNotification(const QString& method, const QJsonObject& params = {});

private:
    QJsonObject handleRequest(const QJsonObject& request);
    QJsonObject handlePing(uint64_t id);
    QJsonObject handleShutdown(uint64_t id);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
    QHash<QString, MethodHandler> m_methods;
    QElapsedTimer m_uptime;
};

} // namespace pc
