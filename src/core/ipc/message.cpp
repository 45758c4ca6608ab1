#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

namespace pc {

namespace {

QJsonObject envelope(const QString& type, std::optional<uint64_t> id)
{
    QJsonObject json;
    json[QStringLiteral("type")] = type;
    if (id) {
        json[QStringLiteral("id")] = static_cast<qint64>(*id);
    }
    return json;
}

QJsonObject errorBody(IpcErrorCode code, const QString& message)
{
    QJsonObject body;
    body[QStringLiteral("code")] = static_cast<int>(code);
    body[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    body[QStringLiteral("message")] = message;
    return body;
}

} // namespace

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(pcIpc, "Refusing to frame %lld byte payload (limit %d)",
                 static_cast<long long>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame(kPrefixSize, Qt::Uninitialized);
    qToBigEndian<quint32>(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < kPrefixSize) {
        return std::nullopt;
    }

    const quint32 payloadSize = qFromBigEndian<quint32>(buffer.constData());
    if (payloadSize > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(pcIpc, "Frame announces %u bytes (limit %d)", payloadSize, kMaxMessageSize);
        DecodeResult oversized;
        oversized.status = DecodeStatus::Oversized;
        return oversized;
    }

    const int frameSize = kPrefixSize + static_cast<int>(payloadSize);
    if (buffer.size() < frameSize) {
        return std::nullopt;
    }

    DecodeResult result;
    result.bytesConsumed = frameSize;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kPrefixSize, static_cast<int>(payloadSize)), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(pcIpc, "Dropping frame with invalid JSON: %s",
                 qUtf8Printable(parseError.errorString()));
        result.status = DecodeStatus::Malformed;
    } else if (!doc.isObject()) {
        LOG_WARN(pcIpc, "Dropping frame whose payload is not a JSON object");
        result.status = DecodeStatus::Malformed;
    } else {
        result.json = doc.object();
    }
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json = envelope(QStringLiteral("request"), id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json = envelope(QStringLiteral("response"), id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject json = envelope(QStringLiteral("error"), id);
    json[QStringLiteral("error")] = errorBody(code, message);
    return json;
}

QJsonObject IpcMessage::makeRetrievalError(uint64_t id, const RetrievalError& error)
{
    QJsonObject body = errorBody(ipcErrorCodeFor(error.code), error.message);
    body[QStringLiteral("retrievalCode")] = retrievalErrorCodeToString(error.code);

    QJsonObject json = envelope(QStringLiteral("error"), id);
    json[QStringLiteral("error")] = body;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json = envelope(QStringLiteral("notification"), std::nullopt);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QString IpcMessage::typeOf(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString();
}

uint64_t IpcMessage::idOf(const QJsonObject& message)
{
    return static_cast<uint64_t>(message.value(QStringLiteral("id")).toInteger());
}

} // namespace pc
