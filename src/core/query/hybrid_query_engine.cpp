#include "core/query/hybrid_query_engine.h"
#include "core/embedding/embedding_manager.h"
#include "core/session/session.h"
#include "core/session/session_index_manager.h"
#include "core/session/session_indexes.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QHash>

#include <algorithm>
#include <future>

namespace pc {

namespace {

constexpr int kMaxResultsCeiling = 100;

} // namespace

HybridQueryEngine::HybridQueryEngine(std::shared_ptr<SessionIndexManager> sessions,
                                     std::shared_ptr<EmbeddingManager> embeddings)
    : m_sessions(std::move(sessions))
    , m_embeddings(std::move(embeddings))
{
}

QueryResponse HybridQueryEngine::query(const QueryRequest& request) const
{
    QueryResponse response;
    QElapsedTimer timer;
    timer.start();

    const QString text = request.text.trimmed();
    if (text.isEmpty()) {
        response.error = RetrievalError{RetrievalErrorCode::InvalidRequest,
                                        QStringLiteral("query text is empty")};
        return response;
    }

    const std::shared_ptr<Session> session = m_sessions->acquire(request.sessionId);
    if (!session) {
        response.error = RetrievalError{RetrievalErrorCode::SessionNotFound,
                                        QStringLiteral("no session with id '%1'")
                                            .arg(request.sessionId)};
        return response;
    }

    const IndexingStatus status = session->status();
    if (status != IndexingStatus::Done) {
        response.error = RetrievalError{RetrievalErrorCode::IndexNotReady,
                                        QStringLiteral("session index is %1")
                                            .arg(indexingStatusToString(status))};
        return response;
    }

    const RetrievalSettings& settings = m_sessions->settings();
    MergeConfig merge;
    merge.vectorWeight = settings.vectorWeight;
    merge.keywordWeight = settings.keywordWeight;
    merge.maxResults = std::clamp(request.maxResults.value_or(settings.maxResults),
                                  1, kMaxResultsCeiling);

    const EmbeddingBatchResult embedded = m_embeddings->embedQuery(text);
    if (!embedded.ok() || embedded.vectors.empty()) {
        response.error = RetrievalError{RetrievalErrorCode::EmbeddingUnavailable,
                                        embedded.errorMessage.isEmpty()
                                            ? QStringLiteral("query embedding failed")
                                            : embedded.errorMessage};
        return response;
    }

    RetrievalQuery probe;
    probe.text = text;
    probe.embedding = embedded.vectors.front();

    const std::shared_ptr<SessionIndexes> indexes = session->indexes();
    auto readLock = indexes->readLock();
    if (indexes->isReleased()) {
        response.error = RetrievalError{RetrievalErrorCode::SessionNotFound,
                                        QStringLiteral("session '%1' was torn down")
                                            .arg(request.sessionId)};
        return response;
    }

    const int vectorK = settings.vectorCandidates;
    const int keywordK = settings.keywordCandidates;
    auto vectorFuture = std::async(std::launch::async, [&]() {
        return indexes->vectorIndex().search(probe, vectorK);
    });
    const std::vector<Candidate> keywordResults = indexes->keywordIndex().search(probe, keywordK);
    const std::vector<Candidate> vectorResults = vectorFuture.get();

    response.vectorCandidates = static_cast<int>(vectorResults.size());
    response.keywordCandidates = static_cast<int>(keywordResults.size());

    const std::vector<FusedCandidate> fused = SearchMerger::merge(
        vectorResults, keywordResults,
        [&indexes](const QString& chunkId) {
            ChunkOrderKey key;
            if (const Chunk* c = indexes->chunk(chunkId)) {
                key.documentOrder = c->documentOrder;
                key.startOffset = c->startOffset;
                key.chunkIndex = c->chunkIndex;
            }
            return key;
        },
        merge);

    QHash<QString, QString> filenames;
    for (const DocumentRecord& record : session->documents()) {
        filenames.insert(record.documentId, record.filename);
    }

    response.hits.reserve(fused.size());
    for (const FusedCandidate& candidate : fused) {
        const Chunk* c = indexes->chunk(candidate.chunkId);
        if (!c) {
            LOG_WARN(pcRetrieval, "Fused candidate %s missing from chunk store",
                     qUtf8Printable(candidate.chunkId));
            continue;
        }
        QueryHit hit;
        hit.chunkId = c->chunkId;
        hit.documentId = c->documentId;
        hit.filename = filenames.value(c->documentId);
        hit.documentOrder = c->documentOrder;
        hit.chunkIndex = c->chunkIndex;
        hit.pageStart = c->pageStart;
        hit.pageEnd = c->pageEnd;
        hit.startOffset = c->startOffset;
        hit.endOffset = c->endOffset;
        hit.text = c->text;
        hit.scores = candidate;
        response.hits.push_back(std::move(hit));
    }

    response.durationMs = static_cast<double>(timer.nsecsElapsed()) / 1.0e6;
    LOG_DEBUG(pcRetrieval, "Query in session %s: %d vector, %d keyword, %d fused (%.1f ms)",
              qUtf8Printable(request.sessionId), response.vectorCandidates,
              response.keywordCandidates, static_cast<int>(response.hits.size()),
              response.durationMs);
    return response;
}

} // namespace pc
