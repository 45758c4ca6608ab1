#include "core/session/session_indexes.h"
#include "core/shared/logging.h"

#include <mutex>

namespace pc {

SessionIndexes::SessionIndexes(std::unique_ptr<VectorIndex> vectorIndex, int dimensions)
    : m_vectorIndex(std::move(vectorIndex))
    , m_dimensions(dimensions)
{
}

SessionIndexes::InsertResult SessionIndexes::insertChunk(Chunk chunk,
                                                         const std::atomic<bool>& cancelled)
{
    std::unique_lock<std::shared_mutex> lock(m_lock);
    if (m_released || cancelled.load()) {
        return InsertResult::Cancelled;
    }
    if (m_chunks.contains(chunk.chunkId)) {
        return InsertResult::Duplicate;
    }

    const VectorIndex::AddResult added = m_vectorIndex->add(chunk.chunkId, chunk.embedding);
    if (added == VectorIndex::AddResult::DimensionMismatch
        || added == VectorIndex::AddResult::Failed) {
        LOG_WARN(pcIndex, "Vector index rejected chunk %s", qUtf8Printable(chunk.chunkId));
        return InsertResult::Rejected;
    }
    m_keywordIndex.add(chunk.chunkId, chunk.text);

    chunk.embedding.clear();
    chunk.embedding.shrink_to_fit();
    const QString chunkId = chunk.chunkId;
    m_chunks.insert(chunkId, std::move(chunk));
    return InsertResult::Inserted;
}

std::shared_lock<std::shared_mutex> SessionIndexes::readLock() const
{
    return std::shared_lock<std::shared_mutex>(m_lock);
}

const Chunk* SessionIndexes::chunk(const QString& chunkId) const
{
    const auto it = m_chunks.constFind(chunkId);
    return it == m_chunks.constEnd() ? nullptr : &it.value();
}

int SessionIndexes::chunkCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return static_cast<int>(m_chunks.size());
}

bool SessionIndexes::isReleased() const
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return m_released;
}

void SessionIndexes::release()
{
    std::unique_lock<std::shared_mutex> lock(m_lock);
    m_released = true;
    m_vectorIndex->clear();
    m_keywordIndex.clear();
    m_chunks.clear();
    m_chunks.squeeze();
}

} // namespace pc
