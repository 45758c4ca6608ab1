#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"
#include <QElapsedTimer>

#include <algorithm>

namespace pc {

namespace {

constexpr int kPumpSliceMs = 50;

// The service may not have created its socket yet.
bool isRetryableConnectError(QLocalSocket::LocalSocketError error)
{
    return error == QLocalSocket::ServerNotFoundError
        || error == QLocalSocket::ConnectionRefusedError
        || error == QLocalSocket::SocketTimeoutError;
}

int remainingMs(const QElapsedTimer& timer, int timeoutMs)
{
    return std::max(0, timeoutMs - static_cast<int>(timer.elapsed()));
}

} // namespace

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>(this))
{
    connect(m_socket.get(), &QLocalSocket::readyRead, this, &SocketClient::onReadyRead);
    connect(m_socket.get(), &QLocalSocket::disconnected, this, &SocketClient::onDisconnected);
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed();
    if (path.isEmpty() || timeoutMs <= 0) {
        const QString error = QStringLiteral("Invalid connect arguments (path='%1', timeout=%2ms)")
                                  .arg(path)
                                  .arg(timeoutMs);
        LOG_ERROR(pcIpc, "%s", qUtf8Printable(error));
        emit errorOccurred(error);
        return false;
    }
    if (isConnected() && m_socket->serverName() == path) {
        return true;
    }

    m_socket->abort();
    resetState();
    m_notifications.clear();

    m_socket->connectToServer(path);
    if (m_socket->waitForConnected(timeoutMs)) {
        LOG_INFO(pcIpc, "Connected to %s", qUtf8Printable(path));
        return true;
    }

    const QString error = m_socket->errorString();
    if (isRetryableConnectError(m_socket->error())) {
        LOG_DEBUG(pcIpc, "Service at %s not reachable yet: %s",
                  qUtf8Printable(path), qUtf8Printable(error));
    } else {
        LOG_ERROR(pcIpc, "Cannot connect to %s: %s", qUtf8Printable(path), qUtf8Printable(error));
        emit errorOccurred(error);
    }
    return false;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    resetState();
}

void SocketClient::resetState()
{
    m_pending.clear();
    m_replies.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        LOG_WARN(pcIpc, "Cannot send '%s': not connected", qUtf8Printable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray frame = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (frame.isEmpty()) {
        LOG_WARN(pcIpc, "Request '%s' is too large to send", qUtf8Printable(method));
        return std::nullopt;
    }

    m_replies.insert(id, std::nullopt);
    m_socket->write(frame);
    m_socket->flush();

    QElapsedTimer timer;
    timer.start();
    while (!m_replies.value(id).has_value()) {
        const int left = remainingMs(timer, timeoutMs);
        if (left == 0 || !pump(std::min(left, kPumpSliceMs))) {
            break;
        }
    }

    std::optional<QJsonObject> reply = m_replies.take(id);
    if (!reply) {
        LOG_WARN(pcIpc, "Request '%s' (id %llu) got no reply within %d ms",
                 qUtf8Printable(method), static_cast<unsigned long long>(id), timeoutMs);
    }
    return reply;
}

std::optional<QJsonObject> SocketClient::waitForNotification(const QString& method, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    for (;;) {
        if (std::optional<QJsonObject> params = takeNotification(method)) {
            return params;
        }
        const int left = remainingMs(timer, timeoutMs);
        if (left == 0 || !pump(std::min(left, kPumpSliceMs))) {
            return takeNotification(method);
        }
    }
}

std::optional<QJsonObject> SocketClient::takeNotification(const QString& method)
{
    const auto it = std::find_if(m_notifications.begin(), m_notifications.end(),
                                 [&method](const auto& entry) { return entry.first == method; });
    if (it == m_notifications.end()) {
        return std::nullopt;
    }
    QJsonObject params = std::move(it->second);
    m_notifications.erase(it);
    return params;
}

void SocketClient::setNotificationHandler(NotificationHandler handler)
{
    m_notificationHandler = std::move(handler);
}

bool SocketClient::pump(int waitMs)
{
    if (m_socket->bytesAvailable() == 0 && isConnected()) {
        m_socket->waitForReadyRead(waitMs);
    }
    if (m_socket->bytesAvailable() > 0) {
        onReadyRead();
    }
    return isConnected() || m_socket->bytesAvailable() > 0;
}

void SocketClient::onReadyRead()
{
    m_pending.append(m_socket->readAll());
    if (m_pending.size() > kMaxPendingBytes) {
        LOG_ERROR(pcIpc, "Read buffer exceeded %d bytes, disconnecting", kMaxPendingBytes);
        m_pending.clear();
        m_socket->disconnectFromServer();
        return;
    }

    while (const std::optional<IpcMessage::DecodeResult> frame = IpcMessage::decode(m_pending)) {
        if (frame->status == IpcMessage::DecodeStatus::Oversized) {
            LOG_ERROR(pcIpc, "Server announced an oversized frame, disconnecting");
            m_pending.clear();
            m_socket->disconnectFromServer();
            return;
        }
        m_pending.remove(0, frame->bytesConsumed);
        if (frame->status == IpcMessage::DecodeStatus::Malformed) {
            continue;
        }

        const QJsonObject& message = frame->json;
        const QString type = IpcMessage::typeOf(message);
        if (type == QLatin1String("response") || type == QLatin1String("error")) {
            const uint64_t id = IpcMessage::idOf(message);
            auto it = m_replies.find(id);
            if (it != m_replies.end()) {
                *it = message;
            } else {
                LOG_WARN(pcIpc, "Reply for unknown request id %llu",
                         static_cast<unsigned long long>(id));
            }
        } else if (type == QLatin1String("notification")) {
            const QString method = message.value(QStringLiteral("method")).toString();
            const QJsonObject params = message.value(QStringLiteral("params")).toObject();
            m_notifications.emplace_back(method, params);
            if (m_notifications.size() > kMaxQueuedNotifications) {
                m_notifications.pop_front();
            }
            if (m_notificationHandler) {
                m_notificationHandler(method, params);
            }
        } else {
            LOG_WARN(pcIpc, "Unexpected message type '%s'", qUtf8Printable(type));
        }
    }
}

void SocketClient::onDisconnected()
{
    LOG_INFO(pcIpc, "Disconnected from service");
    for (auto it = m_replies.begin(); it != m_replies.end(); ++it) {
        if (!it->has_value()) {
            *it = IpcMessage::makeError(it.key(), IpcErrorCode::ServiceUnavailable,
                                        QStringLiteral("Connection lost"));
        }
    }
    emit disconnected();
}

} // namespace pc
