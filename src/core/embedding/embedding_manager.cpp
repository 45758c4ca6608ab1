#include "core/embedding/embedding_manager.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace pc {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: half-open once the delay has passed
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingManager::EmbeddingManager(std::shared_ptr<EmbeddingProvider> provider,
                                   const EmbeddingManagerConfig& config)
    : m_provider(std::move(provider))
    , m_config(config)
{
    m_config.batchSize = std::max(1, m_config.batchSize);
    m_config.maxRetries = std::max(0, m_config.maxRetries);
    m_config.retryBackoffMs = std::max(0, m_config.retryBackoffMs);
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::isAvailable() const
{
    return m_provider && m_provider->isAvailable() && !m_circuitBreaker.isOpen();
}

int EmbeddingManager::dimensions() const
{
    return m_provider ? m_provider->dimensions() : 0;
}

QString EmbeddingManager::providerName() const
{
    return m_provider ? m_provider->name() : QStringLiteral("none");
}

template <typename Call>
EmbeddingBatchResult EmbeddingManager::runWithRetry(size_t expectedCount, Call&& call)
{
    EmbeddingBatchResult last;
    last.status = EmbeddingStatus::Unavailable;

    for (int attempt = 0; attempt <= m_config.maxRetries; ++attempt) {
        if (m_circuitBreaker.isOpen()) {
            last.status = EmbeddingStatus::Unavailable;
            last.errorMessage = QStringLiteral("embedding circuit breaker is open");
            return last;
        }
        if (attempt > 0 && m_config.retryBackoffMs > 0) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(static_cast<int64_t>(attempt) * m_config.retryBackoffMs));
        }

        last = call();
        if (last.status == EmbeddingStatus::Ok) {
            if (last.vectors.size() != expectedCount) {
                LOG_WARN(pcEmbedding, "Provider '%s' returned %d vectors for %d texts",
                         qUtf8Printable(providerName()),
                         static_cast<int>(last.vectors.size()),
                         static_cast<int>(expectedCount));
                m_circuitBreaker.recordFailure();
                last.status = EmbeddingStatus::Unavailable;
                last.vectors.clear();
                last.errorMessage = QStringLiteral("provider returned a short batch");
                return last;
            }
            m_circuitBreaker.recordSuccess();
            return last;
        }

        m_circuitBreaker.recordFailure();
        if (last.status == EmbeddingStatus::Unavailable) {
            break;
        }
        LOG_DEBUG(pcEmbedding, "Transient embedding failure (attempt %d/%d): %s",
                  attempt + 1, m_config.maxRetries + 1, qUtf8Printable(last.errorMessage));
    }

    // Retries exhausted or hard failure: surface as unavailable.
    LOG_WARN(pcEmbedding, "Embedding failed: %s", qUtf8Printable(last.errorMessage));
    last.status = EmbeddingStatus::Unavailable;
    last.vectors.clear();
    return last;
}

EmbeddingBatchResult EmbeddingManager::embedTexts(const std::vector<QString>& texts)
{
    EmbeddingBatchResult result;
    if (!m_provider || !m_provider->isAvailable()) {
        result.status = EmbeddingStatus::Unavailable;
        result.errorMessage = QStringLiteral("embedding provider '%1' is unavailable")
                                  .arg(providerName());
        return result;
    }

    result.status = EmbeddingStatus::Ok;
    result.vectors.reserve(texts.size());

    const size_t batchSize = static_cast<size_t>(m_config.batchSize);
    for (size_t begin = 0; begin < texts.size(); begin += batchSize) {
        const size_t end = std::min(texts.size(), begin + batchSize);
        const std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));

        EmbeddingBatchResult part = runWithRetry(batch.size(), [&]() {
            return m_provider->embedBatch(batch);
        });
        if (!part.ok()) {
            return part;
        }
        for (std::vector<float>& vec : part.vectors) {
            result.vectors.push_back(std::move(vec));
        }
    }
    return result;
}

EmbeddingBatchResult EmbeddingManager::embedQuery(const QString& text)
{
    if (!m_provider || !m_provider->isAvailable()) {
        EmbeddingBatchResult result;
        result.status = EmbeddingStatus::Unavailable;
        result.errorMessage = QStringLiteral("embedding provider '%1' is unavailable")
                                  .arg(providerName());
        return result;
    }
    return runWithRetry(1, [&]() { return m_provider->embedQuery(text); });
}

} // namespace pc
