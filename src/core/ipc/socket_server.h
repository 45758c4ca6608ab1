#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace pc {

// Local-socket front end for a service. Decodes frames per client, hands
// each request to the handler on the event-loop thread and writes the reply
// back to the same client. Notifications go to every connected client.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Replaces a stale socket file left by a dead process; refuses to take
    // over a path another live service still answers on.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;

    int clientCount() const { return static_cast<int>(m_clients.size()); }
    quint64 requestsHandled() const { return m_requestsHandled; }

    void setRequestHandler(RequestHandler handler);
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
    struct ClientState {
        QByteArray pending;
        quint64 requests = 0;
    };

    // One full frame plus its prefix.
    static constexpr int kMaxPendingBytes = IpcMessage::kMaxMessageSize + IpcMessage::kPrefixSize;

    void drainFrames(QLocalSocket* client);
    QJsonObject dispatch(const QJsonObject& request);
    void send(QLocalSocket* client, const QJsonObject& message);
    void dropClient(QLocalSocket* client, const char* reason);
    bool forget(QLocalSocket* client);
    bool failListen(const QString& error);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, ClientState> m_clients;
    RequestHandler m_handler;
    quint64 m_requestsHandled = 0;
};

} // namespace pc
