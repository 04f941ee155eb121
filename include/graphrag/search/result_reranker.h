#pragma once

#include <graphrag/search/search_types.h>

#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace graphrag::search {

/**
 * Reorders fused candidates.
 *
 * Score keeps fusion order. Diversity seeds with the top candidate, then repeatedly takes the
 * remaining candidate whose minimum similarity to the selected set is largest, placing every
 * candidate. MMR seeds with the top candidate, then maximizes
 * lambda * fusedScore - (1 - lambda) * maxSimilarity until k are selected.
 * Ties go to the earliest candidate in fusion order. Ranks are reassigned on output.
 */
class ResultReranker {
public:
    explicit ResultReranker(const ResolvedSearchOptions& options) : options_(options) {}

    // Fails only with OperationCancelled when stop is requested between selections
    Result<std::vector<FusedResult>> rerank(std::vector<FusedResult> candidates,
                                            const std::string& query,
                                            std::stop_token stop = {}) const;

private:
    Result<std::vector<FusedResult>> byDiversity(std::vector<FusedResult> candidates,
                                                 const std::stop_token& stop) const;
    Result<std::vector<FusedResult>> byMMR(std::vector<FusedResult> candidates,
                                           const std::stop_token& stop) const;

    ResolvedSearchOptions options_;
};

using CustomScorer = std::function<double(const FusedResult&)>;

// Replaces fusedScore with scorer(result), stable-sorts descending and reassigns ranks
std::vector<FusedResult> rerankWithCustomScorer(std::vector<FusedResult> results,
                                                const CustomScorer& scorer);

} // namespace graphrag::search
