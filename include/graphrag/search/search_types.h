#pragma once

#include <graphrag/core/document.h>
#include <graphrag/core/types.h>
#include <graphrag/graph/graph_store.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphrag::vector {
class VectorStore;
}

namespace graphrag::extraction {
class EntityExtractor;
}

namespace graphrag::search {

enum class SearchMode {
    Hybrid, // Vector + graph, fused and reranked
    Vector, // Vector store only
    Graph   // Entity extraction + traversal only
};

enum class FusionStrategy {
    Weighted, // Normalized weighted sum of rank scores
    RRF,      // Reciprocal Rank Fusion, 1/(k + rank)
    Max,      // Best of the two scores
    Min       // Worst of the two when both present, else the one present
};

enum class RerankStrategy {
    Score,     // Keep fusion order
    Diversity, // Greedy farthest-first on text similarity
    MMR        // Maximal Marginal Relevance
};

const char* toString(SearchMode mode);
const char* toString(FusionStrategy strategy);
const char* toString(RerankStrategy strategy);

// Case-insensitive name parsing; unknown names yield InvalidArgument
Result<SearchMode> parseSearchMode(std::string_view name);
Result<FusionStrategy> parseFusionStrategy(std::string_view name);
Result<RerankStrategy> parseRerankStrategy(std::string_view name);

/**
 * Scored candidate shared by fusion, reranking and augmentation
 */
struct FusedResult {
    Document document;

    double vectorScore = 0.0; // [0,1], 0 when not produced by vector search
    double graphScore = 0.0;  // [0,1], 0 when not produced by traversal
    double fusedScore = 0.0;  // Range depends on the fusion law
    std::size_t rank = 0;     // 1-based, reassigned after every reorder

    // Which lists produced this candidate
    bool fromVector = false;
    bool fromGraph = false;

    std::vector<graph::GraphNode> relatedNodes;
    Metadata metadata;
};

/**
 * Per-call overrides. Unset fields come from the retriever configuration.
 */
struct SearchOptions {
    std::optional<SearchMode> mode;
    std::optional<std::size_t> k;
    std::optional<double> vectorWeight;
    std::optional<double> graphWeight;
    std::optional<std::size_t> maxTraverseDepth;
    std::optional<FusionStrategy> fusionStrategy;
    std::optional<RerankStrategy> rerankStrategy;
    std::optional<bool> enableContextAugmentation;
    std::optional<double> minScore;
    std::optional<double> mmrLambda;
    std::optional<double> rrfConstant;
};

// Fully populated options for one call
struct ResolvedSearchOptions {
    SearchMode mode = SearchMode::Hybrid;
    std::size_t k = 10;
    double vectorWeight = 0.6;
    double graphWeight = 0.4;
    std::size_t maxTraverseDepth = 2;
    FusionStrategy fusionStrategy = FusionStrategy::Weighted;
    RerankStrategy rerankStrategy = RerankStrategy::Score;
    bool enableContextAugmentation = true;
    double minScore = 0.0;
    double mmrLambda = 0.5;
    double rrfConstant = 60.0;
};

/**
 * Retriever-level configuration: collaborators plus default search options.
 */
struct RetrieverConfig {
    std::shared_ptr<vector::VectorStore> vectorStore;
    std::shared_ptr<graph::GraphStore> graphStore;
    std::shared_ptr<extraction::EntityExtractor> entityExtractor; // Optional

    SearchMode mode = SearchMode::Hybrid;
    double vectorWeight = 0.6; // [0,1]
    double graphWeight = 0.4;  // [0,1]
    std::size_t maxTraverseDepth = 2;
    std::size_t topK = 10;
    FusionStrategy fusionStrategy = FusionStrategy::Weighted;
    RerankStrategy rerankStrategy = RerankStrategy::Score;
    double rrfConstant = 60.0;
    double mmrLambda = 0.5;
    bool enableContextAugmentation = true;
    double minScore = 0.0;

    // Thread pool size for the fork-join phase, 0 = hardware concurrency
    std::size_t workerThreads = 0;

    // Range checks on the default options only
    Result<void> validate() const;

    ResolvedSearchOptions defaults() const;
};

// Merge per-call overrides onto defaults. Out-of-range overrides yield InvalidArgument.
Result<ResolvedSearchOptions> resolveOptions(const ResolvedSearchOptions& defaults,
                                             const SearchOptions& overrides);

/**
 * Observational counters and timings for one Search call
 */
struct Statistics {
    std::size_t vectorResults = 0;
    std::size_t graphResults = 0;
    std::size_t fusedResults = 0;
    std::size_t entitiesExtracted = 0;
    std::size_t nodesTraversed = 0;
    std::size_t failedTraversals = 0;
    std::size_t returnedResults = 0;

    Duration vectorSearchTime{0};
    Duration entityExtractionTime{0};
    Duration graphTraverseTime{0};
    Duration fusionTime{0};
    Duration rerankTime{0};
    Duration augmentationTime{0};
    Duration totalTime{0};

    // Modalities that failed without failing the call, e.g. "entity_extraction"
    std::vector<std::string> degraded;

    bool isDegraded() const { return !degraded.empty(); }
};

} // namespace graphrag::search
