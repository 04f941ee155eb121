#pragma once

#include <graphrag/graph/graph_store.h>

#include <memory>

namespace graphrag::graph {

/**
 * In-process graph store with insertion-ordered adjacency, so traversal output is
 * reproducible for identical insert sequences. All methods are thread-safe.
 */
class MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore();
    ~MemoryGraphStore() override;

    MemoryGraphStore(const MemoryGraphStore&) = delete;
    MemoryGraphStore& operator=(const MemoryGraphStore&) = delete;

    // -----------------------------------------------------------------------------
    // Mutation
    // -----------------------------------------------------------------------------

    // Fails with InvalidArgument on empty id, InvalidState if the id exists
    Result<void> addNode(GraphNode node);

    // Replaces type/label when non-empty and merges properties
    Result<void> updateNode(const GraphNode& node);

    // Removes the node and every incident edge. Unknown ids are not an error.
    Result<void> deleteNode(std::string_view id);

    // Both endpoints must exist. An empty edge id is replaced by "source-type-target".
    Result<void> addEdge(GraphEdge edge);

    // -----------------------------------------------------------------------------
    // Queries
    // -----------------------------------------------------------------------------

    Result<GraphNode> getNode(std::string_view id) const override;
    Result<std::vector<GraphNode>> findNodes(const NodeFilter& filter) const;

    Result<TraverseResult> traverse(std::string_view startId,
                                    const TraverseOptions& options) const override;

    Result<Path> shortestPath(std::string_view fromId, std::string_view toId,
                              const PathOptions& options) const override;

    std::size_t nodeCount() const;
    std::size_t edgeCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace graphrag::graph
