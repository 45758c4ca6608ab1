#pragma once

#include "core/embedding/embedding_provider.h"

#include <memory>

namespace pc {

class WordPieceTokenizer;

// OnnxEmbeddingProvider — BERT-style bi-encoder (bge-small-en-v1.5 layout)
// run through ONNX Runtime.
//
// Expects <modelDir>/model.onnx with inputs input_ids, attention_mask and
// token_type_ids, and <modelDir>/vocab.txt. Output is either pooled
// [batch, dims] or last hidden state [batch, seq, dims], in which case the
// CLS row is taken. Only built when ONNX Runtime is found.
class OnnxEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OnnxEmbeddingProvider(QString modelDir,
                                   QString queryPrefix = QStringLiteral(
                                       "Represent this sentence for searching relevant passages: "));
    ~OnnxEmbeddingProvider() override;

    OnnxEmbeddingProvider(const OnnxEmbeddingProvider&) = delete;
    OnnxEmbeddingProvider& operator=(const OnnxEmbeddingProvider&) = delete;

    bool initialize();

    QString name() const override { return QStringLiteral("onnx"); }
    int dimensions() const override { return m_embeddingSize; }
    bool isAvailable() const override { return m_available; }

    EmbeddingBatchResult embedBatch(const std::vector<QString>& texts) override;
    EmbeddingBatchResult embedQuery(const QString& text) override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    QString m_modelDir;
    QString m_queryPrefix;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    int m_embeddingSize = 0;
    bool m_available = false;
};

} // namespace pc
