#pragma once

#include "core/vector/candidate_retriever.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace pc {

// VectorIndex — per-session nearest-neighbour index over L2-normalized
// chunk embeddings. Similarity is the inner product (cosine).
class VectorIndex : public CandidateRetriever {
public:
    enum class AddResult {
        Added,
        Duplicate,           // chunk id already present, index unchanged
        DimensionMismatch,
        Failed,
    };

    ~VectorIndex() override = default;

    virtual AddResult add(const QString& chunkId, const std::vector<float>& embedding) = 0;
    virtual std::vector<Candidate> searchVector(const std::vector<float>& queryVector,
                                                int k) const = 0;
    virtual bool contains(const QString& chunkId) const = 0;
    virtual int dimensions() const = 0;
    virtual void clear() = 0;

    std::vector<Candidate> search(const RetrievalQuery& query, int k) const override
    {
        return searchVector(query.embedding, k);
    }
};

// Builds the backend named by settings.vectorBackend ("hnsw" or "flat").
std::unique_ptr<VectorIndex> createVectorIndex(const QString& backend, int dimensions);

// HnswVectorIndex — hnswlib HNSW graph. Capacity starts small and doubles
// once the graph is 80% full. clear() frees the graph; the next add()
// rebuilds an empty one.
class HnswVectorIndex : public VectorIndex {
public:
    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit HnswVectorIndex(int dimensions, int initialCapacity = kInitialCapacity);
    ~HnswVectorIndex() override;

    HnswVectorIndex(const HnswVectorIndex&) = delete;
    HnswVectorIndex& operator=(const HnswVectorIndex&) = delete;

    AddResult add(const QString& chunkId, const std::vector<float>& embedding) override;
    std::vector<Candidate> searchVector(const std::vector<float>& queryVector,
                                        int k) const override;
    bool contains(const QString& chunkId) const override;
    int dimensions() const override { return m_dimensions; }
    int size() const override;
    void clear() override;

    bool isAvailable() const;
    int capacity() const;

private:
    bool create(int capacity);
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    int m_initialCapacity = kInitialCapacity;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::vector<QString> m_chunkIdsByLabel;
    QHash<QString, uint64_t> m_labelsByChunkId;
    mutable std::mutex m_mutex;
};

} // namespace pc
