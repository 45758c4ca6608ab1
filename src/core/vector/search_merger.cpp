#include "core/vector/search_merger.h"

#include <QHash>

#include <algorithm>

namespace pc {

std::vector<double> SearchMerger::normalizeScores(const std::vector<Candidate>& candidates)
{
    std::vector<double> normalized;
    if (candidates.empty()) {
        return normalized;
    }

    const auto [minIt, maxIt] = std::minmax_element(
        candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.score < b.score; });
    const double minScore = minIt->score;
    const double range = maxIt->score - minScore;

    normalized.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        normalized.push_back(range > 0.0 ? (candidate.score - minScore) / range : 1.0);
    }
    return normalized;
}

std::vector<FusedCandidate> SearchMerger::merge(
    const std::vector<Candidate>& vectorResults,
    const std::vector<Candidate>& keywordResults,
    const OrderLookup& orderOf,
    MergeConfig config)
{
    std::vector<FusedCandidate> merged;
    QHash<QString, size_t> positions;
    merged.reserve(vectorResults.size() + keywordResults.size());

    auto slotFor = [&](const QString& chunkId) -> FusedCandidate& {
        const auto it = positions.constFind(chunkId);
        if (it != positions.constEnd()) {
            return merged[it.value()];
        }
        positions.insert(chunkId, merged.size());
        FusedCandidate fresh;
        fresh.chunkId = chunkId;
        merged.push_back(std::move(fresh));
        return merged.back();
    };

    const std::vector<double> vectorNorm = normalizeScores(vectorResults);
    for (size_t i = 0; i < vectorResults.size(); ++i) {
        FusedCandidate& slot = slotFor(vectorResults[i].chunkId);
        if (slot.vectorRank != 0) {
            continue;   // keep the best-ranked occurrence
        }
        slot.vectorScore = vectorNorm[i];
        slot.rawVectorScore = vectorResults[i].score;
        slot.vectorRank = static_cast<int>(i) + 1;
    }

    const std::vector<double> keywordNorm = normalizeScores(keywordResults);
    for (size_t i = 0; i < keywordResults.size(); ++i) {
        FusedCandidate& slot = slotFor(keywordResults[i].chunkId);
        if (slot.keywordRank != 0) {
            continue;
        }
        slot.keywordScore = keywordNorm[i];
        slot.rawKeywordScore = keywordResults[i].score;
        slot.keywordRank = static_cast<int>(i) + 1;
    }

    for (FusedCandidate& candidate : merged) {
        candidate.score = config.vectorWeight * candidate.vectorScore
                        + config.keywordWeight * candidate.keywordScore;
    }

    std::vector<ChunkOrderKey> keys;
    keys.reserve(merged.size());
    for (const FusedCandidate& candidate : merged) {
        keys.push_back(orderOf ? orderOf(candidate.chunkId) : ChunkOrderKey{});
    }

    std::vector<size_t> order(merged.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) {
        const FusedCandidate& a = merged[lhs];
        const FusedCandidate& b = merged[rhs];
        if (a.score != b.score) {
            return a.score > b.score;
        }
        const ChunkOrderKey& ka = keys[lhs];
        const ChunkOrderKey& kb = keys[rhs];
        if (ka.documentOrder != kb.documentOrder) {
            return ka.documentOrder < kb.documentOrder;
        }
        if (ka.startOffset != kb.startOffset) {
            return ka.startOffset < kb.startOffset;
        }
        if (ka.chunkIndex != kb.chunkIndex) {
            return ka.chunkIndex < kb.chunkIndex;
        }
        return a.chunkId < b.chunkId;
    });

    const size_t limit = static_cast<size_t>(std::max(config.maxResults, 0));
    std::vector<FusedCandidate> ranked;
    ranked.reserve(std::min(limit, order.size()));
    for (size_t i = 0; i < order.size() && ranked.size() < limit; ++i) {
        ranked.push_back(std::move(merged[order[i]]));
    }
    return ranked;
}

} // namespace pc
