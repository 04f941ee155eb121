#pragma once

#include <graphrag/core/document.h>
#include <graphrag/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace graphrag::graph {

/**
 * Knowledge graph node. Properties use the same typed values as document metadata so that a
 * node can be converted to a Document without loss.
 */
struct GraphNode {
    std::string id;    // Unique identifier
    std::string type;  // Category, e.g. "person", "concept"
    std::string label; // Display name
    Metadata properties;
};

/**
 * Knowledge graph edge. Edges are stored directed; traversal direction decides whether an
 * edge is followed forward, backward or both.
 */
struct GraphEdge {
    std::string id;
    std::string source; // Source node id
    std::string target; // Target node id
    std::string type;   // Relation, e.g. "works_for"
    std::string label;
    Metadata properties;
    double weight = 1.0; // Used for path cost
};

enum class Direction { Outbound, Inbound, Both };

enum class TraverseStrategy { BFS, DFS };

enum class PathAlgorithm {
    BFS,     // Hop-minimal; cost is the sum of edge weights along that path
    Dijkstra // Weight-minimal
};

struct Path {
    std::vector<GraphNode> nodes; // Ordered start..end
    std::vector<GraphEdge> edges; // nodes.size() - 1 edges
    double cost = 0.0;            // Sum of edge weights
    std::size_t length = 0;       // Edge count
};

struct TraverseOptions {
    std::size_t maxDepth = 1;
    Direction direction = Direction::Both;
    TraverseStrategy strategy = TraverseStrategy::BFS;
    std::vector<std::string> edgeTypes; // Empty means any
    std::vector<std::string> nodeTypes; // Empty means any; start node is always included
    std::size_t limit = 0;              // Maximum nodes returned, 0 = unlimited
    bool includePath = false;           // Populate TraverseResult::paths
};

struct PathOptions {
    std::size_t maxDepth = 6;
    PathAlgorithm algorithm = PathAlgorithm::BFS;
    std::vector<std::string> edgeTypes;
};

struct TraverseResult {
    std::vector<GraphNode> nodes; // Visit order, start node first
    std::vector<GraphEdge> edges; // Edges used to reach each non-start node
    std::vector<Path> paths;      // Start-to-node paths when includePath is set
    std::unordered_map<std::string, std::size_t> depths; // Node id -> hops from start
};

struct NodeFilter {
    std::string type;  // Exact match, empty = any
    std::string label; // Case-insensitive substring, empty = any
    std::size_t limit = 0;
};

/**
 * Read-side contract the retriever needs from a knowledge graph.
 * Implementations must be safe for concurrent calls.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Returns ErrorCode::NotFound for an unknown id
    virtual Result<GraphNode> getNode(std::string_view id) const = 0;

    // Expands from startId visiting every node at most once. Unknown start yields NotFound.
    virtual Result<TraverseResult> traverse(std::string_view startId,
                                            const TraverseOptions& options) const = 0;

    // Returns ErrorCode::NoPathFound when target is unreachable within maxDepth
    virtual Result<Path> shortestPath(std::string_view fromId, std::string_view toId,
                                      const PathOptions& options) const = 0;
};

// Printable names used in logs and configuration
const char* toString(Direction direction);
const char* toString(TraverseStrategy strategy);
const char* toString(PathAlgorithm algorithm);

} // namespace graphrag::graph
