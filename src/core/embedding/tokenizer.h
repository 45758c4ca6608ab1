#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

namespace pc {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

// Row-major [batchSize, seqLength] tensors.
struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// WordPieceTokenizer — BERT uncased tokenization over a vocab.txt (one token
// per line, id = line number). Produces [CLS] pieces [SEP], truncated to the
// 512-token model window. Special-token ids come from the vocab itself and
// fall back to the standard uncased layout when a vocab omits them.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath);

    bool isLoaded() const { return !m_vocab.isEmpty(); }
    int vocabSize() const { return m_vocabSize; }
    static constexpr int maxSequenceLength() { return kMaxSequenceLength; }

    // padToLength is capped at maxSequenceLength().
    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

private:
    static constexpr int kMaxSequenceLength = 512;
    static constexpr int kMaxPieces = kMaxSequenceLength - 2;
    static constexpr int kMaxWordChars = 100;

    // Lowercased, accent-free words; each punctuation or symbol character
    // is a word of its own.
    static QStringList basicWords(const QString& text);

    // [CLS] pieces [SEP], unpadded.
    std::vector<int64_t> encode(const QString& text) const;
    void appendPieces(const QString& word, std::vector<int64_t>& ids) const;
    int specialId(const QString& token, int fallback) const;

    QHash<QString, int> m_vocab;
    int m_vocabSize = 0;
    int m_padId = 0;
    int m_unkId = 100;
    int m_clsId = 101;
    int m_sepId = 102;
};

} // namespace pc
