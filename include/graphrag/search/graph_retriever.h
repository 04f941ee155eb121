#pragma once

#include <graphrag/core/document.h>
#include <graphrag/core/types.h>
#include <graphrag/search/search_types.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace graphrag::search {

struct SearchResponse {
    std::vector<Document> documents; // At most k, in final rank order
    Statistics statistics;           // Counters and timings for this call
};

/**
 * Hybrid retriever combining vector similarity search with knowledge-graph traversal.
 *
 * Modes:
 * - Hybrid: vector search (2k) runs concurrently with entity extraction and per-entity
 *   traversal; results are fused, reranked, annotated and cut to k.
 * - Vector: vector search only.
 * - Graph: entity extraction and traversal only; nodes are returned as documents.
 *
 * Failure policy: vector search failure fails the call. Entity extraction or traversal
 * failures in hybrid mode are recorded in Statistics::degraded and the call continues with
 * whatever succeeded. In graph mode they fail the call.
 *
 * Thread-safety: search() may be called concurrently. Only the last-call statistics snapshot
 * is shared between calls.
 */
class GraphRetriever {
public:
    // Use makeGraphRetriever() for a validated instance
    explicit GraphRetriever(RetrieverConfig config);
    ~GraphRetriever();

    GraphRetriever(const GraphRetriever&) = delete;
    GraphRetriever& operator=(const GraphRetriever&) = delete;

    /**
     * Run one retrieval. Unset option fields come from the retriever configuration; set
     * fields out of range yield InvalidArgument. A stop request on `stop` returns
     * OperationCancelled promptly, abandoning any in-flight collaborator calls.
     */
    Result<SearchResponse> search(const std::string& query, const SearchOptions& options = {},
                                  std::stop_token stop = {});

    // Statistics of the most recent call, including failed ones
    Statistics getStatistics() const;

    const RetrieverConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Validates collaborators and option ranges; ValidationError on failure
Result<std::unique_ptr<GraphRetriever>> makeGraphRetriever(RetrieverConfig config);

} // namespace graphrag::search
