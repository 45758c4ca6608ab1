#pragma once

#include <QString>

#include <vector>

namespace pc {

// A retrieval probe. Vector retrievers read the embedding, keyword
// retrievers read the text; both are filled by the query engine.
struct RetrievalQuery {
    QString text;
    std::vector<float> embedding;
};

// One ranked hit. Score semantics depend on the retriever (cosine
// similarity, BM25); callers normalize before comparing across retrievers.
struct Candidate {
    QString chunkId;
    double score = 0.0;
};

// Search capability shared by the vector and keyword indexes. Results are
// ordered best first, ties in insertion order, at most k long.
// Implementations are safe for concurrent search.
class CandidateRetriever {
public:
    virtual ~CandidateRetriever() = default;

    virtual std::vector<Candidate> search(const RetrievalQuery& query, int k) const = 0;
    virtual int size() const = 0;
};

} // namespace pc
