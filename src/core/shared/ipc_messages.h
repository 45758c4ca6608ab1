#pragma once

#include "core/shared/errors.h"

#include <QString>

namespace pc {

// IPC error codes. 1-9 are transport level, 10+ carry a RetrievalErrorCode.
enum class IpcErrorCode : int {
    InvalidParams        = 1,
    NotFound             = 4,
    InternalError        = 6,
    Unsupported          = 7,
    ServiceUnavailable   = 9,
    UnreadablePdf        = 10,
    PageLimitExceeded    = 11,
    EmbeddingUnavailable = 12,
    IndexingInProgress   = 13,
    IndexNotReady        = 14,
    SessionNotFound      = 15,
    UploadLimitExceeded  = 16,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:        return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:             return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:        return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:          return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable:   return QStringLiteral("SERVICE_UNAVAILABLE");
    case IpcErrorCode::UnreadablePdf:        return QStringLiteral("UNREADABLE_PDF");
    case IpcErrorCode::PageLimitExceeded:    return QStringLiteral("PAGE_LIMIT_EXCEEDED");
    case IpcErrorCode::EmbeddingUnavailable: return QStringLiteral("EMBEDDING_UNAVAILABLE");
    case IpcErrorCode::IndexingInProgress:   return QStringLiteral("INDEXING_IN_PROGRESS");
    case IpcErrorCode::IndexNotReady:        return QStringLiteral("INDEX_NOT_READY");
    case IpcErrorCode::SessionNotFound:      return QStringLiteral("SESSION_NOT_FOUND");
    case IpcErrorCode::UploadLimitExceeded:  return QStringLiteral("UPLOAD_LIMIT_EXCEEDED");
    }
    return QStringLiteral("UNKNOWN");
}

inline IpcErrorCode ipcErrorCodeFor(RetrievalErrorCode code)
{
    switch (code) {
    case RetrievalErrorCode::UnreadablePdf:        return IpcErrorCode::UnreadablePdf;
    case RetrievalErrorCode::PageLimitExceeded:    return IpcErrorCode::PageLimitExceeded;
    case RetrievalErrorCode::EmbeddingUnavailable: return IpcErrorCode::EmbeddingUnavailable;
    case RetrievalErrorCode::IndexingInProgress:   return IpcErrorCode::IndexingInProgress;
    case RetrievalErrorCode::IndexNotReady:        return IpcErrorCode::IndexNotReady;
    case RetrievalErrorCode::SessionNotFound:      return IpcErrorCode::SessionNotFound;
    case RetrievalErrorCode::UploadLimitExceeded:  return IpcErrorCode::UploadLimitExceeded;
    case RetrievalErrorCode::InvalidRequest:       return IpcErrorCode::InvalidParams;
    }
    return IpcErrorCode::InternalError;
}

} // namespace pc
