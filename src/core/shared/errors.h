#pragma once

#include <QString>

namespace pc {

// Retrieval error taxonomy. Operations report these as values; nothing in the
// core throws across a module boundary.
enum class RetrievalErrorCode {
    UnreadablePdf,
    PageLimitExceeded,
    EmbeddingUnavailable,
    IndexingInProgress,
    IndexNotReady,
    SessionNotFound,
    UploadLimitExceeded,
    InvalidRequest,
};

QString retrievalErrorCodeToString(RetrievalErrorCode code);

struct RetrievalError {
    RetrievalErrorCode code = RetrievalErrorCode::InvalidRequest;
    QString message;

    // "<CODE>: <message>", the form surfaced in status polling.
    QString describe() const;
};

} // namespace pc
