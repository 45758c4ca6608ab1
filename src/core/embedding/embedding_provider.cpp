#include "core/embedding/embedding_provider.h"
#include "core/embedding/hashing_embedding_provider.h"
#include "core/shared/logging.h"

#ifdef PDFCHAT_WITH_ONNX
#include "core/embedding/onnx_embedding_provider.h"
#endif

#include <cmath>

namespace pc {

namespace {

// Stands in for a provider this build cannot construct.
class UnavailableEmbeddingProvider : public EmbeddingProvider {
public:
    UnavailableEmbeddingProvider(QString name, QString reason, int dimensions)
        : m_name(std::move(name))
        , m_reason(std::move(reason))
        , m_dimensions(dimensions)
    {
    }

    QString name() const override { return m_name; }
    int dimensions() const override { return m_dimensions; }
    bool isAvailable() const override { return false; }

    EmbeddingBatchResult embedBatch(const std::vector<QString>& /*texts*/) override
    {
        EmbeddingBatchResult result;
        result.status = EmbeddingStatus::Unavailable;
        result.errorMessage = m_reason;
        return result;
    }

private:
    QString m_name;
    QString m_reason;
    int m_dimensions = 0;
};

} // namespace

std::vector<float> normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

std::shared_ptr<EmbeddingProvider> createEmbeddingProvider(const RetrievalSettings& settings)
{
    if (settings.embeddingProvider == QLatin1String("onnx")) {
#ifdef PDFCHAT_WITH_ONNX
        auto provider = std::make_shared<OnnxEmbeddingProvider>(settings.modelDir);
        if (!provider->initialize()) {
            LOG_ERROR(pcEmbedding, "ONNX embedding provider failed to initialize from '%s'",
                      qUtf8Printable(settings.modelDir));
        }
        return provider;
#else
        LOG_ERROR(pcEmbedding, "ONNX embedding provider requested but this build has no ONNX Runtime");
        return std::make_shared<UnavailableEmbeddingProvider>(
            QStringLiteral("onnx"),
            QStringLiteral("ONNX Runtime support was not compiled in"),
            settings.embeddingDimensions);
#endif
    }

    LOG_INFO(pcEmbedding, "Using hashing embedding provider (%d dims)", settings.embeddingDimensions);
    return std::make_shared<HashingEmbeddingProvider>(settings.embeddingDimensions);
}

} // namespace pc
