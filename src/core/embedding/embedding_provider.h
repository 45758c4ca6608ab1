#pragma once

#include "core/shared/settings.h"

#include <QString>

#include <memory>
#include <vector>

namespace pc {

enum class EmbeddingStatus {
    Ok,
    Transient,     // retryable (timeout, momentary resource pressure)
    Unavailable,   // model cannot be loaded or reached
};

struct EmbeddingBatchResult {
    EmbeddingStatus status = EmbeddingStatus::Unavailable;
    std::vector<std::vector<float>> vectors;   // one per input text on Ok
    QString errorMessage;

    bool ok() const { return status == EmbeddingStatus::Ok; }
};

// EmbeddingProvider — text to fixed-dimension, L2-normalized vectors.
//
// Implementations must be deterministic for identical input and safe to call
// from several indexing threads at once.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual QString name() const = 0;
    virtual int dimensions() const = 0;
    virtual bool isAvailable() const = 0;

    virtual EmbeddingBatchResult embedBatch(const std::vector<QString>& texts) = 0;

    // Query-side embedding. Asymmetric models override this to add an
    // instruction prefix.
    virtual EmbeddingBatchResult embedQuery(const QString& text) { return embedBatch({text}); }
};

std::vector<float> normalizeEmbedding(std::vector<float> embedding);

// Builds the provider named by settings.embeddingProvider. Never returns null:
// a provider that cannot start reports isAvailable() == false.
std::shared_ptr<EmbeddingProvider> createEmbeddingProvider(const RetrievalSettings& settings);

} // namespace pc
