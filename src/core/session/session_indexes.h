#pragma once

#include "core/index/keyword_index.h"
#include "core/shared/chunk.h"
#include "core/vector/vector_index.h"

#include <QHash>
#include <QString>

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace pc {

// One session's vector index, keyword index and chunk store, kept in step.
//
// insertChunk() holds the exclusive side of the lock across both indexes,
// so a reader holding readLock() never sees a chunk in one index but not
// the other. release() drops everything; inserts after release are refused.
class SessionIndexes {
public:
    enum class InsertResult {
        Inserted,
        Duplicate,
        Cancelled,       // cancellation token set or indexes released
        Rejected,        // vector index refused the embedding
    };

    SessionIndexes(std::unique_ptr<VectorIndex> vectorIndex, int dimensions);

    SessionIndexes(const SessionIndexes&) = delete;
    SessionIndexes& operator=(const SessionIndexes&) = delete;

    InsertResult insertChunk(Chunk chunk, const std::atomic<bool>& cancelled);

    // Shared lock for the duration of a query.
    std::shared_lock<std::shared_mutex> readLock() const;

    // The accessors below expect the caller to hold readLock().
    const VectorIndex& vectorIndex() const { return *m_vectorIndex; }
    const KeywordIndex& keywordIndex() const { return m_keywordIndex; }
    const Chunk* chunk(const QString& chunkId) const;

    int chunkCount() const;
    int dimensions() const { return m_dimensions; }
    bool isReleased() const;

    void release();

private:
    std::unique_ptr<VectorIndex> m_vectorIndex;
    KeywordIndex m_keywordIndex;
    QHash<QString, Chunk> m_chunks;   // embeddings dropped once indexed
    int m_dimensions = 0;
    bool m_released = false;
    mutable std::shared_mutex m_lock;
};

} // namespace pc
