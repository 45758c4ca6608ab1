#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>

namespace pc {

namespace {

bool isCombiningMark(QChar ch)
{
    switch (ch.category()) {
    case QChar::Mark_NonSpacing:
    case QChar::Mark_SpacingCombining:
    case QChar::Mark_Enclosing:
        return true;
    default:
        return false;
    }
}

} // namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath)
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(pcEmbedding, "Cannot open WordPiece vocab %s", qUtf8Printable(vocabPath));
        return;
    }

    int id = 0;
    while (!file.atEnd()) {
        const QString token = QString::fromUtf8(file.readLine()).trimmed();
        if (!token.isEmpty()) {
            m_vocab.insert(token, id);
        }
        ++id;
    }
    m_vocabSize = static_cast<int>(m_vocab.size());

    if (m_vocab.isEmpty()) {
        LOG_WARN(pcEmbedding, "WordPiece vocab %s is empty", qUtf8Printable(vocabPath));
        return;
    }

    m_padId = specialId(QStringLiteral("[PAD]"), m_padId);
    m_unkId = specialId(QStringLiteral("[UNK]"), m_unkId);
    m_clsId = specialId(QStringLiteral("[CLS]"), m_clsId);
    m_sepId = specialId(QStringLiteral("[SEP]"), m_sepId);
    LOG_DEBUG(pcEmbedding, "WordPiece vocab loaded: %d tokens", m_vocabSize);
}

int WordPieceTokenizer::specialId(const QString& token, int fallback) const
{
    return m_vocab.value(token, fallback);
}

QStringList WordPieceTokenizer::basicWords(const QString& text)
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QStringList words;
    QString current;
    const auto flush = [&]() {
        if (!current.isEmpty()) {
            words.append(current);
            current.clear();
        }
    };

    for (const QChar ch : decomposed) {
        if (isCombiningMark(ch)) {
            continue;
        }
        if (ch.isSpace()) {
            flush();
        } else if (ch.isPunct() || ch.isSymbol()) {
            flush();
            words.append(QString(ch));
        } else {
            current.append(ch);
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::appendPieces(const QString& word, std::vector<int64_t>& ids) const
{
    if (word.size() > kMaxWordChars) {
        ids.push_back(m_unkId);
        return;
    }

    // Greedy longest match; a word with any unmatched remainder is one [UNK].
    std::vector<int64_t> pieces;
    qsizetype start = 0;
    while (start < word.size()) {
        int matched = -1;
        qsizetype end = word.size();
        for (; end > start; --end) {
            const QString candidate = start == 0
                ? word.left(end)
                : QStringLiteral("##") + word.mid(start, end - start);
            const auto it = m_vocab.constFind(candidate);
            if (it != m_vocab.constEnd()) {
                matched = it.value();
                break;
            }
        }
        if (matched < 0) {
            ids.push_back(m_unkId);
            return;
        }
        pieces.push_back(matched);
        start = end;
    }
    ids.insert(ids.end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::encode(const QString& text) const
{
    std::vector<int64_t> ids;
    ids.push_back(m_clsId);
    for (const QString& word : basicWords(text)) {
        if (static_cast<int>(ids.size()) - 1 >= kMaxPieces) {
            break;
        }
        appendPieces(word, ids);
    }
    if (static_cast<int>(ids.size()) - 1 > kMaxPieces) {
        ids.resize(static_cast<size_t>(kMaxPieces) + 1);
    }
    ids.push_back(m_sepId);
    return ids;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!isLoaded()) {
        return output;
    }

    output.inputIds = encode(text);
    const size_t used = output.inputIds.size();
    const size_t length = std::max(used, static_cast<size_t>(
                                             std::clamp(padToLength, 0, kMaxSequenceLength)));

    output.inputIds.resize(length, m_padId);
    output.attentionMask.assign(length, 0);
    std::fill_n(output.attentionMask.begin(), used, 1);
    output.tokenTypeIds.assign(length, 0);
    output.seqLength = static_cast<int>(length);
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!isLoaded() || texts.empty()) {
        return batch;
    }

    std::vector<std::vector<int64_t>> rows;
    rows.reserve(texts.size());
    size_t width = 0;
    for (const QString& text : texts) {
        rows.push_back(encode(text));
        width = std::max(width, rows.back().size());
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.seqLength = static_cast<int>(width);
    batch.inputIds.assign(rows.size() * width, m_padId);
    batch.attentionMask.assign(rows.size() * width, 0);
    batch.tokenTypeIds.assign(rows.size() * width, 0);

    for (size_t r = 0; r < rows.size(); ++r) {
        const auto rowStart = static_cast<std::ptrdiff_t>(r * width);
        std::copy(rows[r].begin(), rows[r].end(), batch.inputIds.begin() + rowStart);
        std::fill_n(batch.attentionMask.begin() + rowStart, rows[r].size(), 1);
    }
    return batch;
}

} // namespace pc
