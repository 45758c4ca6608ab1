#include "core/embedding/onnx_embedding_provider.h"
#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <string>

namespace pc {

namespace {

constexpr int kDefaultEmbeddingSize = 384;

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "pdfchat-embedding");
    return env;
}

} // anonymous namespace

class OnnxEmbeddingProvider::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
    std::string outputName;
};

OnnxEmbeddingProvider::OnnxEmbeddingProvider(QString modelDir, QString queryPrefix)
    : m_impl(std::make_unique<Impl>())
    , m_modelDir(std::move(modelDir))
    , m_queryPrefix(std::move(queryPrefix))
{
}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() = default;

bool OnnxEmbeddingProvider::initialize()
{
    m_available = false;

    const QDir dir(m_modelDir);
    const QString modelPath = dir.filePath(QStringLiteral("model.onnx"));
    const QString vocabPath = dir.filePath(QStringLiteral("vocab.txt"));

    if (m_modelDir.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(pcEmbedding, "OnnxEmbeddingProvider: model file missing at %s",
                 qUtf8Printable(modelPath));
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(pcEmbedding, "OnnxEmbeddingProvider: tokenizer failed to load %s",
                 qUtf8Printable(vocabPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(2);
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_impl->session->GetOutputCount() == 0) {
            LOG_WARN(pcEmbedding, "OnnxEmbeddingProvider: model has no outputs");
            m_impl->session.reset();
            return false;
        }
        Ort::AllocatedStringPtr outputName = m_impl->session->GetOutputNameAllocated(0, allocator);
        m_impl->outputName = outputName.get() ? outputName.get() : "";

        const std::vector<int64_t> outputShape = m_impl->session->GetOutputTypeInfo(0)
                                                     .GetTensorTypeAndShapeInfo()
                                                     .GetShape();
        m_embeddingSize = (!outputShape.empty() && outputShape.back() > 0)
            ? static_cast<int>(outputShape.back())
            : kDefaultEmbeddingSize;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(pcEmbedding, "OnnxEmbeddingProvider: ONNX initialization failed: %s", ex.what());
        m_impl->session.reset();
        return false;
    }

    LOG_INFO(pcEmbedding, "OnnxEmbeddingProvider: loaded %s (%d dims, output '%s')",
             qUtf8Printable(modelPath), m_embeddingSize, m_impl->outputName.c_str());
    m_available = true;
    return true;
}

EmbeddingBatchResult OnnxEmbeddingProvider::embedQuery(const QString& text)
{
    return embedBatch({m_queryPrefix + text});
}

EmbeddingBatchResult OnnxEmbeddingProvider::embedBatch(const std::vector<QString>& texts)
{
    EmbeddingBatchResult result;
    if (!m_available || !m_impl->session || !m_tokenizer) {
        result.status = EmbeddingStatus::Unavailable;
        result.errorMessage = QStringLiteral("ONNX embedding model is not loaded");
        return result;
    }
    if (texts.empty()) {
        result.status = EmbeddingStatus::Ok;
        return result;
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        result.status = EmbeddingStatus::Transient;
        result.errorMessage = QStringLiteral("tokenization produced an empty batch");
        return result;
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        Ort::Value inputTensors[3] = {
            Ort::Value::CreateTensor<int64_t>(memoryInfo,
                                              const_cast<int64_t*>(tokenized.inputIds.data()),
                                              tokenized.inputIds.size(), inputShape, 2),
            Ort::Value::CreateTensor<int64_t>(memoryInfo,
                                              const_cast<int64_t*>(tokenized.attentionMask.data()),
                                              tokenized.attentionMask.size(), inputShape, 2),
            Ort::Value::CreateTensor<int64_t>(memoryInfo,
                                              const_cast<int64_t*>(tokenized.tokenTypeIds.data()),
                                              tokenized.tokenTypeIds.size(), inputShape, 2),
        };

        static constexpr const char* inputNames[3] = {
            "input_ids",
            "attention_mask",
            "token_type_ids",
        };
        const char* outputNames[1] = {m_impl->outputName.c_str()};

        std::vector<Ort::Value> outputs = m_impl->session->Run(
            Ort::RunOptions{nullptr}, inputNames, inputTensors, 3, outputNames, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            result.status = EmbeddingStatus::Transient;
            result.errorMessage = QStringLiteral("inference returned no tensor output");
            return result;
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const int64_t batch = tokenized.batchSize;
        const int64_t dims = m_embeddingSize;

        // Row stride: pooled output is [batch, dims], hidden states are
        // [batch, seq, dims] and the CLS vector leads each row.
        int64_t rowStride = 0;
        if (shape.size() == 2 && shape[0] == batch && shape[1] == dims) {
            rowStride = dims;
        } else if (shape.size() == 3 && shape[0] == batch && shape[2] == dims && shape[1] >= 1) {
            rowStride = shape[1] * dims;
        }
        if (!data || rowStride == 0) {
            result.status = EmbeddingStatus::Unavailable;
            result.errorMessage = QStringLiteral("unsupported model output shape");
            return result;
        }

        result.vectors.reserve(static_cast<size_t>(batch));
        for (int64_t i = 0; i < batch; ++i) {
            const float* row = data + i * rowStride;
            result.vectors.push_back(normalizeEmbedding(std::vector<float>(row, row + dims)));
        }
        result.status = EmbeddingStatus::Ok;
        return result;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(pcEmbedding, "OnnxEmbeddingProvider inference failed: %s", ex.what());
        result.status = EmbeddingStatus::Transient;
        result.errorMessage = QString::fromUtf8(ex.what());
        return result;
    }
}

} // namespace pc
