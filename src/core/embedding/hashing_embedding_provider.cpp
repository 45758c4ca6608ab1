#include "core/embedding/hashing_embedding_provider.h"
#include "core/indexing/text_tokenizer.h"

#include <algorithm>

namespace pc {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;
constexpr float kWordWeight = 1.0f;
constexpr float kTrigramWeight = 0.5f;

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions)
    : m_dimensions(std::max(8, dimensions))
{
}

uint64_t HashingEmbeddingProvider::fnv1a64(const QByteArray& bytes)
{
    uint64_t hash = kFnvOffsetBasis;
    for (const char c : bytes) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
    return hash;
}

void HashingEmbeddingProvider::addFeature(std::vector<float>& vec, const QByteArray& feature,
                                          float weight) const
{
    const uint64_t hash = fnv1a64(feature);
    const size_t bucket = static_cast<size_t>(hash % static_cast<uint64_t>(m_dimensions));
    const float sign = (hash >> 63) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

std::vector<float> HashingEmbeddingProvider::embed(const QString& text) const
{
    std::vector<float> vec(static_cast<size_t>(m_dimensions), 0.0f);

    for (const TextToken& token : TextTokenizer::tokenize(text)) {
        addFeature(vec, QByteArrayLiteral("w:") + token.term.toUtf8(), kWordWeight);

        const QString padded = QLatin1Char('#') + token.term + QLatin1Char('#');
        for (int i = 0; i + 3 <= padded.size(); ++i) {
            addFeature(vec, QByteArrayLiteral("t:") + padded.mid(i, 3).toUtf8(), kTrigramWeight);
        }
    }

    return normalizeEmbedding(std::move(vec));
}

EmbeddingBatchResult HashingEmbeddingProvider::embedBatch(const std::vector<QString>& texts)
{
    EmbeddingBatchResult result;
    result.status = EmbeddingStatus::Ok;
    result.vectors.reserve(texts.size());
    for (const QString& text : texts) {
        result.vectors.push_back(embed(text));
    }
    return result;
}

} // namespace pc
