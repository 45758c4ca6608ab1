#pragma once

#include "core/shared/errors.h"
#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace pc {

// Wire format for the retrieval socket. Every frame is a 4-byte big-endian
// payload length followed by one compact UTF-8 JSON object:
//
//   request       {"type":"request","id":N,"method":"...","params":{...}}
//   response      {"type":"response","id":N,"result":{...}}
//   error         {"type":"error","id":N,"error":{"code":C,"codeString":"...",
//                  "message":"...","retrievalCode":"..."}}
//   notification  {"type":"notification","method":"...","params":{...}}
class IpcMessage {
public:
    static constexpr int kPrefixSize = 4;

    // Uploads travel inline as base64, so one frame must hold a full
    // session's worth of PDFs (100 MB raw, about 134 MB encoded).
    static constexpr int kMaxMessageSize = 144 * 1024 * 1024;

    // Empty when the payload would exceed kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    enum class DecodeStatus {
        Ok,
        Malformed,   // complete frame, payload is not a JSON object
        Oversized,   // prefix announces more than kMaxMessageSize
    };
    struct DecodeResult {
        DecodeStatus status = DecodeStatus::Ok;
        QJsonObject json;
        int bytesConsumed = 0;   // 0 for Oversized; the stream cannot be resynced
    };

    // nullopt until the buffer holds a complete first frame.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    // Error envelope carrying both the numeric IPC code and the retrieval
    // code string under "retrievalCode".
    static QJsonObject makeRetrievalError(uint64_t id, const RetrievalError& error);

    static QString typeOf(const QJsonObject& message);
    static uint64_t idOf(const QJsonObject& message);
};

} // namespace pc
