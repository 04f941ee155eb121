#include <graphrag/search/result_fusion.h>
#include <graphrag/search/result_reranker.h>
#include <graphrag/search/text_similarity.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace graphrag::search {

namespace {

Error cancelled(const char* stage) {
    return Error{ErrorCode::OperationCancelled, std::string(stage) + " cancelled"};
}

// Token sets computed once per candidate; similarity is evaluated O(n^2) times
std::vector<TokenSet> tokenSets(const std::vector<FusedResult>& candidates) {
    std::vector<TokenSet> sets;
    sets.reserve(candidates.size());
    for (const auto& c : candidates) {
        sets.push_back(makeTokenSet(c.document.content));
    }
    return sets;
}

} // namespace

Result<std::vector<FusedResult>> ResultReranker::rerank(std::vector<FusedResult> candidates,
                                                        const std::string& query,
                                                        std::stop_token stop) const {
    spdlog::debug("ResultReranker: {} candidates, strategy={}, query='{}'", candidates.size(),
                  toString(options_.rerankStrategy), query);
    if (candidates.size() <= 1) {
        assignRanks(candidates);
        return candidates;
    }

    switch (options_.rerankStrategy) {
        case RerankStrategy::Score:
            assignRanks(candidates);
            return candidates;
        case RerankStrategy::Diversity:
            return byDiversity(std::move(candidates), stop);
        case RerankStrategy::MMR:
            return byMMR(std::move(candidates), stop);
    }
    return candidates;
}

Result<std::vector<FusedResult>>
ResultReranker::byDiversity(std::vector<FusedResult> candidates,
                            const std::stop_token& stop) const {
    const auto sets = tokenSets(candidates);
    std::vector<std::size_t> remaining;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        remaining.push_back(i);
    }
    std::vector<std::size_t> selected{0};
    selected.reserve(candidates.size());

    while (!remaining.empty()) {
        if (stop.stop_requested()) {
            return cancelled("diversity rerank");
        }
        double bestMinSim = -1.0;
        std::size_t bestPos = 0;
        for (std::size_t pos = 0; pos < remaining.size(); ++pos) {
            double minSim = 1.0;
            for (auto s : selected) {
                minSim = std::min(minSim, jaccard(sets[remaining[pos]], sets[s]));
            }
            if (minSim > bestMinSim) {
                bestMinSim = minSim;
                bestPos = pos;
            }
        }
        selected.push_back(remaining[bestPos]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(bestPos));
    }

    std::vector<FusedResult> out;
    out.reserve(selected.size());
    for (auto idx : selected) {
        out.push_back(std::move(candidates[idx]));
    }
    assignRanks(out);
    return out;
}

Result<std::vector<FusedResult>> ResultReranker::byMMR(std::vector<FusedResult> candidates,
                                                       const std::stop_token& stop) const {
    const double lambda = options_.mmrLambda;
    const std::size_t k = std::max<std::size_t>(1, options_.k);
    const auto sets = tokenSets(candidates);

    std::vector<std::size_t> remaining;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        remaining.push_back(i);
    }
    std::vector<std::size_t> selected{0};

    while (selected.size() < k && !remaining.empty()) {
        if (stop.stop_requested()) {
            return cancelled("mmr rerank");
        }
        double bestMmr = std::numeric_limits<double>::lowest();
        std::size_t bestPos = 0;
        for (std::size_t pos = 0; pos < remaining.size(); ++pos) {
            const auto idx = remaining[pos];
            double maxSim = 0.0;
            for (auto s : selected) {
                maxSim = std::max(maxSim, jaccard(sets[idx], sets[s]));
            }
            const double mmr = lambda * candidates[idx].fusedScore - (1.0 - lambda) * maxSim;
            if (mmr > bestMmr) {
                bestMmr = mmr;
                bestPos = pos;
            }
        }
        selected.push_back(remaining[bestPos]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(bestPos));
    }

    std::vector<FusedResult> out;
    out.reserve(selected.size());
    for (auto idx : selected) {
        out.push_back(std::move(candidates[idx]));
    }
    assignRanks(out);
    return out;
}

std::vector<FusedResult> rerankWithCustomScorer(std::vector<FusedResult> results,
                                                const CustomScorer& scorer) {
    if (!scorer) {
        return results;
    }
    for (auto& r : results) {
        r.fusedScore = scorer(r);
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const FusedResult& a, const FusedResult& b) {
                         return a.fusedScore > b.fusedScore;
                     });
    assignRanks(results);
    return results;
}

} // namespace graphrag::search
