#pragma once

#include <graphrag/graph/graph_store.h>
#include <graphrag/search/search_types.h>

#include <string>
#include <vector>

namespace graphrag::search {

// Candidate identity: document id when non-empty, else the first 100 bytes of content
std::string documentKey(const Document& doc);

// Synthesizes "{type}: {label}" content (plus description) and copies node properties
Document nodeToDocument(const graph::GraphNode& node);

// Human-readable breakdown of a fused score, e.g. "RRF: 0.033 (vector: 0.016, graph: 0.016)"
std::string explainScore(const FusedResult& result, FusionStrategy strategy);

/**
 * Merges a vector-ranked document list with a graph-ranked node list.
 *
 * Each list is rank-scored by position: 1 - i/len for weighted/max/min, 1/(rrfK + i + 1) for
 * RRF. Candidates sharing a key are merged; the first occurrence within a list keeps its score
 * and later graph duplicates only contribute related nodes. Output is sorted by fused score
 * descending with ties kept in arrival order (vector list first, then graph-only
 * candidates), and ranks are 1..N.
 */
class ResultFusion {
public:
    explicit ResultFusion(const ResolvedSearchOptions& options) : options_(options) {}

    std::vector<FusedResult> fuse(const std::vector<Document>& vectorDocs,
                                  const std::vector<graph::GraphNode>& graphNodes) const;

    // Applies the configured law to already-merged candidates, then sorts and ranks them
    void score(std::vector<FusedResult>& candidates) const;

    double positionScore(std::size_t index, std::size_t length) const;

private:
    double fuseOne(const FusedResult& r) const;

    ResolvedSearchOptions options_;
};

// Reassigns rank 1..N in current order
void assignRanks(std::vector<FusedResult>& results);

} // namespace graphrag::search
