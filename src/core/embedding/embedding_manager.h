#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace pc {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct EmbeddingManagerConfig {
    int batchSize = 32;
    int maxRetries = 3;
    int retryBackoffMs = 50;    // attempt n waits n * retryBackoffMs
};

// EmbeddingManager — the indexing-side face of an EmbeddingProvider.
//
// Splits input into provider batches of at most batchSize texts, retries
// Transient failures with linear backoff and trips a circuit breaker on
// repeated failure. Anything it cannot recover from comes back Unavailable.
// Thread-safe; one manager is shared by every session.
class EmbeddingManager {
public:
    explicit EmbeddingManager(std::shared_ptr<EmbeddingProvider> provider,
                              const EmbeddingManagerConfig& config = {});
    ~EmbeddingManager();

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;
    EmbeddingManager(EmbeddingManager&&) = delete;
    EmbeddingManager& operator=(EmbeddingManager&&) = delete;

    bool isAvailable() const;
    int dimensions() const;
    QString providerName() const;
    const EmbeddingManagerConfig& config() const { return m_config; }

    EmbeddingBatchResult embedTexts(const std::vector<QString>& texts);
    EmbeddingBatchResult embedQuery(const QString& text);

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    template <typename Call>
    EmbeddingBatchResult runWithRetry(size_t expectedCount, Call&& call);

    std::shared_ptr<EmbeddingProvider> m_provider;
    EmbeddingManagerConfig m_config;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace pc
