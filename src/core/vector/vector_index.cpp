#include "core/vector/vector_index.h"
#include "core/vector/flat_vector_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <algorithm>

namespace pc {

std::unique_ptr<VectorIndex> createVectorIndex(const QString& backend, int dimensions)
{
    if (backend == QLatin1String("flat")) {
        return std::make_unique<FlatVectorIndex>(dimensions);
    }
    return std::make_unique<HnswVectorIndex>(dimensions);
}

HnswVectorIndex::HnswVectorIndex(int dimensions, int initialCapacity)
    : m_dimensions(dimensions)
    , m_initialCapacity(std::max(initialCapacity, 1))
{
    if (m_dimensions <= 0) {
        LOG_ERROR(pcIndex, "HnswVectorIndex requires a positive dimension, got %d", m_dimensions);
        return;
    }
    create(m_initialCapacity);
}

HnswVectorIndex::~HnswVectorIndex() = default;

bool HnswVectorIndex::create(int capacity)
{
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_chunkIdsByLabel.clear();
        m_labelsByChunkId.clear();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(pcIndex, "HnswVectorIndex create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

VectorIndex::AddResult HnswVectorIndex::add(const QString& chunkId,
                                            const std::vector<float>& embedding)
{
    if (m_dimensions <= 0 || static_cast<int>(embedding.size()) != m_dimensions) {
        LOG_WARN(pcIndex, "Rejecting %d-dim vector for %d-dim index (chunk %s)",
                 static_cast<int>(embedding.size()), m_dimensions, qUtf8Printable(chunkId));
        return AddResult::DimensionMismatch;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index && !create(m_initialCapacity)) {
        return AddResult::Failed;
    }
    if (m_labelsByChunkId.contains(chunkId)) {
        return AddResult::Duplicate;
    }
    if (!ensureCapacityForOneMore()) {
        return AddResult::Failed;
    }

    const uint64_t label = static_cast<uint64_t>(m_chunkIdsByLabel.size());
    try {
        m_index->addPoint(embedding.data(), static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_ERROR(pcIndex, "HnswVectorIndex add failed: %s", e.what());
        return AddResult::Failed;
    }
    m_chunkIdsByLabel.push_back(chunkId);
    m_labelsByChunkId.insert(chunkId, label);
    return AddResult::Added;
}

std::vector<Candidate> HnswVectorIndex::searchVector(const std::vector<float>& queryVector,
                                                     int k) const
{
    std::vector<Candidate> results;
    if (k <= 0 || static_cast<int>(queryVector.size()) != m_dimensions) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || m_chunkIdsByLabel.empty()) {
        return results;
    }

    struct Hit {
        uint64_t label;
        float distance;
    };
    std::vector<Hit> hits;
    try {
        const size_t limit = std::min(static_cast<size_t>(k), m_chunkIdsByLabel.size());
        auto queue = m_index->searchKnn(queryVector.data(), limit);
        hits.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            hits.push_back(Hit{static_cast<uint64_t>(entry.second), entry.first});
        }
    } catch (const std::exception& e) {
        LOG_ERROR(pcIndex, "HnswVectorIndex search failed: %s", e.what());
        return {};
    }

    // Labels are assigned in insertion order, so they break distance ties.
    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.label < b.label;
    });

    results.reserve(hits.size());
    for (const Hit& hit : hits) {
        // InnerProductSpace reports 1 - <a, b>.
        results.push_back(Candidate{m_chunkIdsByLabel[static_cast<size_t>(hit.label)],
                                    1.0 - static_cast<double>(hit.distance)});
    }
    return results;
}

bool HnswVectorIndex::contains(const QString& chunkId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_labelsByChunkId.contains(chunkId);
}

int HnswVectorIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_chunkIdsByLabel.size());
}

void HnswVectorIndex::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.reset();
    m_space.reset();
    m_chunkIdsByLabel.clear();
    m_chunkIdsByLabel.shrink_to_fit();
    m_labelsByChunkId.clear();
}

bool HnswVectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

int HnswVectorIndex::capacity() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index ? static_cast<int>(m_index->getMaxElements()) : 0;
}

bool HnswVectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(pcIndex, "HnswVectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        LOG_ERROR(pcIndex, "HnswVectorIndex resize overflow");
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(pcIndex, "HnswVectorIndex resized to capacity %llu",
                  static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(pcIndex, "HnswVectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace pc
