#include "core/vector/flat_vector_index.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace pc {

namespace {

double dot(const std::vector<float>& a, const std::vector<float>& b)
{
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

} // namespace

FlatVectorIndex::FlatVectorIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

VectorIndex::AddResult FlatVectorIndex::add(const QString& chunkId,
                                            const std::vector<float>& embedding)
{
    if (m_dimensions <= 0 || static_cast<int>(embedding.size()) != m_dimensions) {
        LOG_WARN(pcIndex, "Rejecting %d-dim vector for %d-dim index (chunk %s)",
                 static_cast<int>(embedding.size()), m_dimensions, qUtf8Printable(chunkId));
        return AddResult::DimensionMismatch;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_positions.contains(chunkId)) {
        return AddResult::Duplicate;
    }
    m_positions.insert(chunkId, m_entries.size());
    m_entries.push_back(Entry{chunkId, embedding});
    return AddResult::Added;
}

std::vector<Candidate> FlatVectorIndex::searchVector(const std::vector<float>& queryVector,
                                                     int k) const
{
    std::vector<Candidate> results;
    if (k <= 0 || static_cast<int>(queryVector.size()) != m_dimensions) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    results.reserve(m_entries.size());
    for (const Entry& entry : m_entries) {
        results.push_back(Candidate{entry.chunkId, dot(queryVector, entry.embedding)});
    }

    // stable_sort keeps insertion order among equal similarities.
    std::stable_sort(results.begin(), results.end(), [](const Candidate& a, const Candidate& b) {
        return a.score > b.score;
    });
    if (results.size() > static_cast<size_t>(k)) {
        results.resize(static_cast<size_t>(k));
    }
    return results;
}

bool FlatVectorIndex::contains(const QString& chunkId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_positions.contains(chunkId);
}

int FlatVectorIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_entries.size());
}

void FlatVectorIndex::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_entries.shrink_to_fit();
    m_positions.clear();
}

} // namespace pc
