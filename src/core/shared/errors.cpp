#include "core/shared/errors.h"

namespace pc {

QString retrievalErrorCodeToString(RetrievalErrorCode code)
{
    switch (code) {
    case RetrievalErrorCode::UnreadablePdf:        return QStringLiteral("UNREADABLE_PDF");
    case RetrievalErrorCode::PageLimitExceeded:    return QStringLiteral("PAGE_LIMIT_EXCEEDED");
    case RetrievalErrorCode::EmbeddingUnavailable: return QStringLiteral("EMBEDDING_UNAVAILABLE");
    case RetrievalErrorCode::IndexingInProgress:   return QStringLiteral("INDEXING_IN_PROGRESS");
    case RetrievalErrorCode::IndexNotReady:        return QStringLiteral("INDEX_NOT_READY");
    case RetrievalErrorCode::SessionNotFound:      return QStringLiteral("SESSION_NOT_FOUND");
    case RetrievalErrorCode::UploadLimitExceeded:  return QStringLiteral("UPLOAD_LIMIT_EXCEEDED");
    case RetrievalErrorCode::InvalidRequest:       return QStringLiteral("INVALID_REQUEST");
    }
    return QStringLiteral("UNKNOWN");
}

QString RetrievalError::describe() const
{
    return retrievalErrorCodeToString(code) + QStringLiteral(": ") + message;
}

} // namespace pc
