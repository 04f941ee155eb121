#pragma once

#include <graphrag/search/search_types.h>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphrag::search {

// Node id -> hops from the traversal seed that first reached it
using NodeDepthMap = std::unordered_map<std::string, std::size_t>;

// Graph neighbourhood summary for one candidate
struct GraphContextInfo {
    std::vector<std::string> relatedEntities; // "{label} ({type})", de-duplicated
    std::size_t neighborCount = 0;            // Distinct related nodes
    std::size_t graphDepth = 0;               // Shallowest known depth, 1 when unknown
    std::string text;                         // "Related Entities: ..." or empty
};

GraphContextInfo buildContextInfo(const FusedResult& result, const NodeDepthMap& depths);

/**
 * Converts ranked candidates into documents. Scores and rank are always attached as metadata;
 * graph context only when `includeGraphContext` is set and the candidate has related nodes.
 * The context text lives in Document::graphContext, never in content, so re-running on an
 * augmented document replaces the previous context.
 */
class ContextAugmenter {
public:
    explicit ContextAugmenter(bool includeGraphContext = true)
        : includeGraphContext_(includeGraphContext) {}

    std::vector<Document> augment(const std::vector<FusedResult>& ranked,
                                  const NodeDepthMap& depths = {}) const;

    Document augmentOne(const FusedResult& result, const NodeDepthMap& depths) const;

private:
    bool includeGraphContext_;
};

/**
 * Annotates a document with its own graph node (node_id, node_type, node_label, node_<prop>)
 * and neighbour labels. The "Connected to: ..." line becomes the document's graph context.
 */
Document enhanceWithGraphStructure(const Document& doc, const graph::GraphNode* node,
                                   const std::vector<graph::GraphNode>& neighbors);

// Numbered "Document i:" blocks for an LLM prompt, optionally with entities and relevance
std::string formatContextForLLM(const std::vector<Document>& docs, bool includeMetadata);

} // namespace graphrag::search
