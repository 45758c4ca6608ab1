#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace pc {

namespace {

constexpr int kProbeTimeoutMs = 150;

// True when something is still accepting connections on the path.
bool pathHasLiveListener(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    if (!probe.waitForConnected(kProbeTimeoutMs)) {
        return false;
    }
    probe.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    if (m_server->listen(socketPath)) {
        LOG_INFO(pcIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        return failListen(QStringLiteral("Cannot listen on %1: %2")
                              .arg(socketPath, m_server->errorString()));
    }
    if (pathHasLiveListener(socketPath)) {
        return failListen(QStringLiteral("Another service is already listening on %1")
                              .arg(socketPath));
    }

    LOG_WARN(pcIpc, "Removing stale socket %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        return failListen(QStringLiteral("Cannot listen on %1 after removing stale socket: %2")
                              .arg(socketPath, m_server->errorString()));
    }

    LOG_INFO(pcIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

bool SocketServer::failListen(const QString& error)
{
    LOG_ERROR(pcIpc, "%s", qUtf8Printable(error));
    emit errorOccurred(error);
    return false;
}

void SocketServer::close()
{
    // Detach every client before disconnecting so the disconnected() slot
    // finds nothing left to clean up.
    const QList<QLocalSocket*> clients = m_clients.keys();
    m_clients.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        client->abort();
        client->deleteLater();
    }

    if (m_server->isListening()) {
        LOG_INFO(pcIpc, "Closing %s after %llu request(s)",
                 qUtf8Printable(m_server->fullServerName()),
                 static_cast<unsigned long long>(m_requestsHandled));
        m_server->close();
    }
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
        LOG_WARN(pcIpc, "Dropping notification that failed to encode");
        return;
    }
    for (auto it = m_clients.constBegin(); it != m_clients.constEnd(); ++it) {
        it.key()->write(frame);
        it.key()->flush();
    }
    LOG_DEBUG(pcIpc, "Notification %s sent to %d client(s)",
              qUtf8Printable(notification.value(QStringLiteral("method")).toString()),
              clientCount());
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.insert(client, ClientState{});
        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onClientDisconnected);
        LOG_INFO(pcIpc, "Client connected (%d total)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    auto it = client ? m_clients.find(client) : m_clients.end();
    if (it == m_clients.end()) {
        return;
    }

    it->pending.append(client->readAll());
    if (it->pending.size() > kMaxPendingBytes) {
        dropClient(client, "read buffer overflow");
        return;
    }
    drainFrames(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && forget(client)) {
        LOG_INFO(pcIpc, "Client disconnected (%d left)", clientCount());
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::forget(QLocalSocket* client)
{
    return m_clients.remove(client) > 0;
}

void SocketServer::dropClient(QLocalSocket* client, const char* reason)
{
    LOG_ERROR(pcIpc, "Disconnecting client: %s", reason);
    if (!forget(client)) {
        return;
    }
    client->disconnect(this);
    client->abort();
    client->deleteLater();
    emit clientDisconnected();
}

void SocketServer::drainFrames(QLocalSocket* client)
{
    // The handler runs synchronously and may not touch m_clients, but a write
    // failure can disconnect the client; look the state up on every pass.
    for (;;) {
        auto it = m_clients.find(client);
        if (it == m_clients.end()) {
            return;
        }

        const std::optional<IpcMessage::DecodeResult> frame = IpcMessage::decode(it->pending);
        if (!frame) {
            return;
        }
        if (frame->status == IpcMessage::DecodeStatus::Oversized) {
            dropClient(client, "oversized frame");
            return;
        }
        it->pending.remove(0, frame->bytesConsumed);

        if (frame->status == IpcMessage::DecodeStatus::Malformed) {
            send(client, IpcMessage::makeError(0, IpcErrorCode::InvalidParams,
                                               QStringLiteral("Malformed JSON frame")));
            continue;
        }

        const QString type = IpcMessage::typeOf(frame->json);
        if (type != QLatin1String("request")) {
            LOG_WARN(pcIpc, "Ignoring '%s' message from client", qUtf8Printable(type));
            continue;
        }

        ++it->requests;
        ++m_requestsHandled;
        send(client, dispatch(frame->json));
    }
}

QJsonObject SocketServer::dispatch(const QJsonObject& request)
{
    LOG_DEBUG(pcIpc, "Request %llu: %s",
              static_cast<unsigned long long>(IpcMessage::idOf(request)),
              qUtf8Printable(request.value(QStringLiteral("method")).toString()));
    if (!m_handler) {
        return IpcMessage::makeError(IpcMessage::idOf(request), IpcErrorCode::InternalError,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(request);
}

void SocketServer::send(QLocalSocket* client, const QJsonObject& message)
{
    const QByteArray frame = IpcMessage::encode(message);
    if (frame.isEmpty()) {
        LOG_WARN(pcIpc, "Dropping reply that failed to encode");
        return;
    }
    client->write(frame);
    client->flush();
}

} // namespace pc
