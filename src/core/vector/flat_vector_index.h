#pragma once

#include "core/vector/vector_index.h"

namespace pc {

// Exact inner-product scan. A session holds at most a few thousand chunks.
class FlatVectorIndex : public VectorIndex {
public:
    explicit FlatVectorIndex(int dimensions);

    AddResult add(const QString& chunkId, const std::vector<float>& embedding) override;
    std::vector<Candidate> searchVector(const std::vector<float>& queryVector,
                                        int k) const override;
    bool contains(const QString& chunkId) const override;
    int dimensions() const override { return m_dimensions; }
    int size() const override;
    void clear() override;

private:
    struct Entry {
        QString chunkId;
        std::vector<float> embedding;
    };

    int m_dimensions = 0;
    std::vector<Entry> m_entries;
    QHash<QString, size_t> m_positions;
    mutable std::mutex m_mutex;
};

} // namespace pc
