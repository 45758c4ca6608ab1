#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QLocalSocket>
#include <QObject>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace pc {

// Blocking client for a ServiceBase socket, used by tools and the service
// test harness. Calls pump the socket directly instead of spinning an event
// loop, so it is safe to use from a test slot.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // nullopt on timeout or when not connected. A dropped connection yields a
    // ServiceUnavailable error envelope.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000);

    // Notifications are queued as they arrive, including while a request is
    // in flight; this returns the oldest queued one with a matching method.
    std::optional<QJsonObject> waitForNotification(const QString& method, int timeoutMs);

    using NotificationHandler = std::function<void(const QString& method, const QJsonObject& params)>;
    void setNotificationHandler(NotificationHandler handler);

signals:
    void disconnected();
    void errorOccurred(const QString& error);

private slots:
    void onReadyRead();
    void onDisconnected();

private:
    static constexpr int kMaxPendingBytes = IpcMessage::kMaxMessageSize + IpcMessage::kPrefixSize;
    static constexpr size_t kMaxQueuedNotifications = 64;

    bool pump(int waitMs);
    std::optional<QJsonObject> takeNotification(const QString& method);
    void resetState();

    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_pending;
    uint64_t m_nextRequestId = 1;

    // Replies by request id; an entry exists only while its request waits.
    QHash<uint64_t, std::optional<QJsonObject>> m_replies;
    std::deque<std::pair<QString, QJsonObject>> m_notifications;
    NotificationHandler m_notificationHandler;
};

} // namespace pc
