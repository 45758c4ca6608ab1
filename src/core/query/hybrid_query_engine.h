#pragma once

#include "core/shared/errors.h"
#include "core/vector/search_merger.h"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace pc {

class EmbeddingManager;
class SessionIndexManager;

struct QueryRequest {
    QString sessionId;
    QString text;
    std::optional<int> maxResults;   // settings default when unset
};

// One fused hit with its provenance.
struct QueryHit {
    QString chunkId;
    QString documentId;
    QString filename;
    int documentOrder = 0;
    int chunkIndex = 0;
    int pageStart = 1;
    int pageEnd = 1;
    int startOffset = 0;
    int endOffset = 0;
    QString text;
    FusedCandidate scores;
};

struct QueryResponse {
    std::optional<RetrievalError> error;
    std::vector<QueryHit> hits;
    int vectorCandidates = 0;
    int keywordCandidates = 0;
    double durationMs = 0.0;

    bool ok() const { return !error.has_value(); }
};

// HybridQueryEngine — answers a query against one session's indexes.
//
// The query is embedded once, then the vector and keyword indexes are
// searched concurrently under the session's shared index lock and the two
// lists are fused by SearchMerger. Only sessions in the done state answer.
class HybridQueryEngine {
public:
    HybridQueryEngine(std::shared_ptr<SessionIndexManager> sessions,
                      std::shared_ptr<EmbeddingManager> embeddings);

    QueryResponse query(const QueryRequest& request) const;

private:
    std::shared_ptr<SessionIndexManager> m_sessions;
    std::shared_ptr<EmbeddingManager> m_embeddings;
};

} // namespace pc
