#pragma once

#include "core/embedding/embedding_provider.h"

#include <cstdint>

namespace pc {

// HashingEmbeddingProvider — feature-hashing embedder that needs no model.
//
// Each case-folded word contributes weight 1.0 and each character trigram of
// the padded word ("#word#") weight 0.5, hashed with 64-bit FNV-1a into
// `dimensions` buckets. The high hash bit picks the sign so collisions cancel
// rather than pile up. Output is L2-normalized; an input with no tokens maps
// to the zero vector.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(int dimensions = 384);

    QString name() const override { return QStringLiteral("hashing"); }
    int dimensions() const override { return m_dimensions; }
    bool isAvailable() const override { return true; }

    EmbeddingBatchResult embedBatch(const std::vector<QString>& texts) override;

    std::vector<float> embed(const QString& text) const;

    static uint64_t fnv1a64(const QByteArray& bytes);

private:
    void addFeature(std::vector<float>& vec, const QByteArray& feature, float weight) const;

    int m_dimensions = 384;
};

} // namespace pc
