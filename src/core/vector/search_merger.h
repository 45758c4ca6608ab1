#pragma once

#include "core/vector/candidate_retriever.h"

#include <QString>

#include <functional>
#include <optional>
#include <vector>

namespace pc {

struct MergeConfig {
    double vectorWeight = 0.4;
    double keywordWeight = 0.6;
    int maxResults = 8;
};

// Position of a chunk in its session: upload order of its document, then
// character offset, then chunk index. Used to break score ties.
struct ChunkOrderKey {
    int documentOrder = 0;
    int startOffset = 0;
    int chunkIndex = 0;
};

struct FusedCandidate {
    QString chunkId;
    double score = 0.0;
    double vectorScore = 0.0;      // min-max normalized, 0 when absent
    double keywordScore = 0.0;
    std::optional<double> rawVectorScore;
    std::optional<double> rawKeywordScore;
    int vectorRank = 0;            // 1-based, 0 when absent
    int keywordRank = 0;
};

class SearchMerger {
public:
    using OrderLookup = std::function<ChunkOrderKey(const QString& chunkId)>;

    // Weighted fusion of independently min-max normalized candidate lists.
    static std::vector<FusedCandidate> merge(
        const std::vector<Candidate>& vectorResults,
        const std::vector<Candidate>& keywordResults,
        const OrderLookup& orderOf,
        MergeConfig config = {});

    // Maps scores onto [0, 1]. A list whose scores are all equal maps to 1.0.
    static std::vector<double> normalizeScores(const std::vector<Candidate>& candidates);
};

} // namespace pc
