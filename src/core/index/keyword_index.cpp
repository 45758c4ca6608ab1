#include "core/index/keyword_index.h"
#include "core/indexing/text_tokenizer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace pc {

bool KeywordIndex::add(const QString& chunkId, const QString& text)
{
    const QStringList terms = TextTokenizer::terms(text);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_ordinals.contains(chunkId)) {
        LOG_DEBUG(pcIndex, "Keyword index already holds chunk %s", qUtf8Printable(chunkId));
        return false;
    }

    const int ordinal = static_cast<int>(m_chunks.size());
    QHash<QString, int> frequencies;
    for (const QString& term : terms) {
        ++frequencies[term];
    }
    for (auto it = frequencies.constBegin(); it != frequencies.constEnd(); ++it) {
        m_postings[it.key()].push_back(Posting{ordinal, it.value()});
    }

    ChunkEntry entry;
    entry.chunkId = chunkId;
    entry.terms = terms;
    entry.length = static_cast<int>(terms.size());
    m_chunks.push_back(std::move(entry));
    m_ordinals.insert(chunkId, ordinal);
    m_totalLength += static_cast<long long>(terms.size());
    return true;
}

double KeywordIndex::termScore(int documentFrequency, int termFrequency, int chunkLength) const
{
    const double n = static_cast<double>(m_chunks.size());
    const double df = static_cast<double>(documentFrequency);
    const double idf = std::log((n - df + 0.5) / (df + 0.5) + 1.0);

    const double avgLength = n > 0 ? static_cast<double>(m_totalLength) / n : 0.0;
    const double lengthRatio = avgLength > 0.0 ? chunkLength / avgLength : 1.0;
    const double tf = static_cast<double>(termFrequency);
    return idf * (tf * (kK1 + 1.0)) / (tf + kK1 * (1.0 - kB + kB * lengthRatio));
}

bool KeywordIndex::containsPhrase(const ChunkEntry& entry, const QStringList& phrase) const
{
    const int n = static_cast<int>(entry.terms.size());
    const int m = static_cast<int>(phrase.size());
    for (int start = 0; start + m <= n; ++start) {
        int matched = 0;
        while (matched < m && entry.terms[start + matched] == phrase[matched]) {
            ++matched;
        }
        if (matched == m) {
            return true;
        }
    }
    return false;
}

std::vector<Candidate> KeywordIndex::searchText(const QString& queryText, int k) const
{
    std::vector<Candidate> results;
    if (k <= 0) {
        return results;
    }

    const QStringList queryTerms = TextTokenizer::terms(queryText);
    if (queryTerms.isEmpty()) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_chunks.empty()) {
        return results;
    }

    std::unordered_map<int, double> scores;
    QStringList seen;
    for (const QString& term : queryTerms) {
        if (seen.contains(term)) {
            continue;
        }
        seen.append(term);

        std::unordered_map<int, bool> exactHit;
        const auto exact = m_postings.constFind(term);
        if (exact != m_postings.constEnd()) {
            const int df = static_cast<int>(exact->size());
            for (const Posting& posting : *exact) {
                scores[posting.chunk] += termScore(df, posting.termFrequency,
                                                   m_chunks[static_cast<size_t>(posting.chunk)].length);
                exactHit[posting.chunk] = true;
            }
        }

        if (term.size() < kMinSubstringTermLength) {
            continue;
        }

        // Weak partial matches: best containing vocabulary term per chunk.
        std::unordered_map<int, double> bestPartial;
        for (auto it = m_postings.constBegin(); it != m_postings.constEnd(); ++it) {
            if (it.key() == term || !it.key().contains(term)) {
                continue;
            }
            const int df = static_cast<int>(it->size());
            for (const Posting& posting : *it) {
                if (exactHit.count(posting.chunk)) {
                    continue;
                }
                const double partial = termScore(df, posting.termFrequency,
                                                 m_chunks[static_cast<size_t>(posting.chunk)].length);
                double& best = bestPartial[posting.chunk];
                best = std::max(best, partial);
            }
        }
        for (const auto& [chunk, partial] : bestPartial) {
            scores[chunk] += kSubstringWeight * partial;
        }
    }

    results.reserve(scores.size());
    std::vector<int> ordinals;
    ordinals.reserve(scores.size());
    for (auto& [chunk, score] : scores) {
        if (score <= 0.0) {
            continue;
        }
        if (queryTerms.size() >= 2 && containsPhrase(m_chunks[static_cast<size_t>(chunk)], queryTerms)) {
            score *= kPhraseBonus;
        }
        ordinals.push_back(chunk);
    }

    std::sort(ordinals.begin(), ordinals.end(), [&scores](int a, int b) {
        const double sa = scores.at(a);
        const double sb = scores.at(b);
        if (sa != sb) {
            return sa > sb;
        }
        return a < b;
    });
    if (ordinals.size() > static_cast<size_t>(k)) {
        ordinals.resize(static_cast<size_t>(k));
    }

    for (const int chunk : ordinals) {
        results.push_back(Candidate{m_chunks[static_cast<size_t>(chunk)].chunkId, scores.at(chunk)});
    }
    return results;
}

bool KeywordIndex::contains(const QString& chunkId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ordinals.contains(chunkId);
}

int KeywordIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_chunks.size());
}

int KeywordIndex::vocabularySize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_postings.size());
}

void KeywordIndex::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_chunks.clear();
    m_chunks.shrink_to_fit();
    m_ordinals.clear();
    m_postings.clear();
    m_totalLength = 0;
}

} // namespace pc
