#pragma once

#include "core/vector/candidate_retriever.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <mutex>
#include <vector>

namespace pc {

// KeywordIndex — per-session BM25 inverted index over chunk text.
//
// Scoring for each distinct query term:
//   - exact postings score BM25 (k1 = 1.2, b = 0.75)
//   - a term of 3+ characters also matches vocabulary terms containing it;
//     a chunk without an exact hit earns half the BM25 score of its best
//     such term
// When the query has two or more terms and a chunk contains the full term
// sequence contiguously, the chunk's score is multiplied by 1.5.
// Terms come from TextTokenizer, so matching is case-insensitive.
class KeywordIndex : public CandidateRetriever {
public:
    static constexpr double kK1 = 1.2;
    static constexpr double kB = 0.75;
    static constexpr int kMinSubstringTermLength = 3;
    static constexpr double kSubstringWeight = 0.5;
    static constexpr double kPhraseBonus = 1.5;

    KeywordIndex() = default;

    KeywordIndex(const KeywordIndex&) = delete;
    KeywordIndex& operator=(const KeywordIndex&) = delete;

    // Returns false if chunkId is already indexed (index unchanged).
    bool add(const QString& chunkId, const QString& text);

    std::vector<Candidate> searchText(const QString& queryText, int k) const;
    std::vector<Candidate> search(const RetrievalQuery& query, int k) const override
    {
        return searchText(query.text, k);
    }

    bool contains(const QString& chunkId) const;
    int size() const override;
    int vocabularySize() const;
    void clear();

private:
    struct Posting {
        int chunk = 0;     // insertion ordinal
        int termFrequency = 0;
    };

    struct ChunkEntry {
        QString chunkId;
        QStringList terms;   // full sequence, for phrase matching
        int length = 0;
    };

    double termScore(int documentFrequency, int termFrequency, int chunkLength) const;
    bool containsPhrase(const ChunkEntry& entry, const QStringList& phrase) const;

    std::vector<ChunkEntry> m_chunks;
    QHash<QString, int> m_ordinals;
    QHash<QString, std::vector<Posting>> m_postings;
    long long m_totalLength = 0;
    mutable std::mutex m_mutex;
};

} // namespace pc
