#include <graphrag/graph/memory_graph_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <unordered_set>

namespace graphrag::graph {

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::Outbound:
            return "outbound";
        case Direction::Inbound:
            return "inbound";
        case Direction::Both:
            return "both";
    }
    return "both";
}

const char* toString(TraverseStrategy strategy) {
    switch (strategy) {
        case TraverseStrategy::BFS:
            return "bfs";
        case TraverseStrategy::DFS:
            return "dfs";
    }
    return "bfs";
}

const char* toString(PathAlgorithm algorithm) {
    switch (algorithm) {
        case PathAlgorithm::BFS:
            return "bfs";
        case PathAlgorithm::Dijkstra:
            return "dijkstra";
    }
    return "bfs";
}

namespace {

bool matchesAny(const std::vector<std::string>& allowed, const std::string& value) {
    if (allowed.empty()) {
        return true;
    }
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Step from one node to a neighbour through a specific edge
struct Hop {
    const GraphEdge* edge = nullptr;
    std::string neighbor;
};

// Parent pointer used to rebuild paths after a search
struct Backlink {
    std::string parent;
    std::string edgeId;
};

} // namespace

class MemoryGraphStore::Impl {
public:
    mutable std::shared_mutex mutex;

    std::unordered_map<std::string, GraphNode> nodes;
    std::vector<std::string> nodeOrder;

    std::unordered_map<std::string, GraphEdge> edges;
    std::unordered_map<std::string, std::vector<std::string>> outEdges;
    std::unordered_map<std::string, std::vector<std::string>> inEdges;

    std::vector<Hop> neighbors(const std::string& id, Direction direction,
                               const std::vector<std::string>& edgeTypes) const {
        std::vector<Hop> hops;
        auto collect = [&](const auto& index, bool forward) {
            auto it = index.find(id);
            if (it == index.end()) {
                return;
            }
            for (const auto& edgeId : it->second) {
                auto eit = edges.find(edgeId);
                if (eit == edges.end() || !matchesAny(edgeTypes, eit->second.type)) {
                    continue;
                }
                const GraphEdge& edge = eit->second;
                hops.push_back(Hop{&edge, forward ? edge.target : edge.source});
            }
        };

        if (direction == Direction::Outbound || direction == Direction::Both) {
            collect(outEdges, true);
        }
        if (direction == Direction::Inbound || direction == Direction::Both) {
            collect(inEdges, false);
        }
        return hops;
    }

    Path buildPath(const std::string& from, const std::string& to,
                   const std::unordered_map<std::string, Backlink>& parents) const {
        std::vector<std::string> nodeIds{to};
        std::vector<std::string> edgeIds;
        std::string cursor = to;
        while (cursor != from) {
            const auto& link = parents.at(cursor);
            edgeIds.push_back(link.edgeId);
            nodeIds.push_back(link.parent);
            cursor = link.parent;
        }
        std::reverse(nodeIds.begin(), nodeIds.end());
        std::reverse(edgeIds.begin(), edgeIds.end());
        return assemblePath(nodeIds, edgeIds);
    }

    // Node and edge ids are in walk order, edgeIds one shorter than nodeIds
    Path assemblePath(const std::vector<std::string>& nodeIds,
                      const std::vector<std::string>& edgeIds) const {
        Path path;
        for (const auto& id : nodeIds) {
            path.nodes.push_back(nodes.at(id));
        }
        for (const auto& id : edgeIds) {
            const auto& edge = edges.at(id);
            path.cost += edge.weight;
            path.edges.push_back(edge);
        }
        path.length = path.edges.size();
        return path;
    }

    void eraseEdge(const std::string& edgeId) {
        auto it = edges.find(edgeId);
        if (it == edges.end()) {
            return;
        }
        auto dropFrom = [&](auto& index, const std::string& nodeId) {
            auto nit = index.find(nodeId);
            if (nit == index.end()) {
                return;
            }
            auto& list = nit->second;
            list.erase(std::remove(list.begin(), list.end(), edgeId), list.end());
        };
        dropFrom(outEdges, it->second.source);
        dropFrom(inEdges, it->second.target);
        edges.erase(it);
    }

    Result<TraverseResult> bfs(const std::string& startId, const TraverseOptions& options) const;
    Result<TraverseResult> dfs(const std::string& startId, const TraverseOptions& options) const;
    Result<Path> bfsPath(const std::string& from, const std::string& to,
                         const PathOptions& options) const;
    Result<Path> dijkstraPath(const std::string& from, const std::string& to,
                              const PathOptions& options) const;

    // Record a reached node in the result if it passes the node-type filter
    bool report(TraverseResult& result, const std::string& nodeId, std::size_t depth,
                const std::string& viaEdge, const std::string& startId,
                const std::unordered_map<std::string, Backlink>& parents,
                const TraverseOptions& options) const {
        const auto& node = nodes.at(nodeId);
        if (nodeId != startId && !matchesAny(options.nodeTypes, node.type)) {
            return false;
        }
        result.nodes.push_back(node);
        result.depths.emplace(nodeId, depth);
        if (!viaEdge.empty()) {
            result.edges.push_back(edges.at(viaEdge));
        }
        if (options.includePath) {
            result.paths.push_back(buildPath(startId, nodeId, parents));
        }
        return true;
    }
};

Result<TraverseResult> MemoryGraphStore::Impl::bfs(const std::string& startId,
                                                   const TraverseOptions& options) const {
    TraverseResult result;
    std::unordered_set<std::string> visited{startId};
    std::unordered_map<std::string, Backlink> parents;
    std::deque<std::pair<std::string, std::size_t>> queue{{startId, 0}};

    report(result, startId, 0, {}, startId, parents, options);

    while (!queue.empty()) {
        if (options.limit > 0 && result.nodes.size() >= options.limit) {
            break;
        }
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (depth >= options.maxDepth) {
            continue;
        }

        for (const auto& hop : neighbors(current, options.direction, options.edgeTypes)) {
            // Marked on enqueue so each node keeps the depth of its first discovery
            if (!visited.insert(hop.neighbor).second) {
                continue;
            }
            parents[hop.neighbor] = Backlink{current, hop.edge->id};
            report(result, hop.neighbor, depth + 1, hop.edge->id, startId, parents, options);
            if (options.limit > 0 && result.nodes.size() >= options.limit) {
                break;
            }
            queue.emplace_back(hop.neighbor, depth + 1);
        }
    }
    return result;
}

Result<TraverseResult> MemoryGraphStore::Impl::dfs(const std::string& startId,
                                                   const TraverseOptions& options) const {
    struct Frame {
        std::string id;
        std::size_t depth;
        std::string parent;
        std::string edgeId;
    };

    TraverseResult result;
    std::unordered_set<std::string> visited;
    std::unordered_map<std::string, Backlink> parents;
    std::vector<Frame> stack{{startId, 0, {}, {}}};

    while (!stack.empty()) {
        if (options.limit > 0 && result.nodes.size() >= options.limit) {
            break;
        }
        Frame frame = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(frame.id).second) {
            continue;
        }
        if (!frame.parent.empty()) {
            parents[frame.id] = Backlink{frame.parent, frame.edgeId};
        }
        report(result, frame.id, frame.depth, frame.edgeId, startId, parents, options);

        if (frame.depth >= options.maxDepth) {
            continue;
        }
        auto hops = neighbors(frame.id, options.direction, options.edgeTypes);
        // Reverse push keeps the first adjacency entry on top of the stack
        for (auto it = hops.rbegin(); it != hops.rend(); ++it) {
            if (!visited.count(it->neighbor)) {
                stack.push_back(Frame{it->neighbor, frame.depth + 1, frame.id, it->edge->id});
            }
        }
    }
    return result;
}

Result<Path> MemoryGraphStore::Impl::bfsPath(const std::string& from, const std::string& to,
                                             const PathOptions& options) const {
    std::unordered_set<std::string> visited{from};
    std::unordered_map<std::string, Backlink> parents;
    std::deque<std::pair<std::string, std::size_t>> queue{{from, 0}};

    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (current == to) {
            return buildPath(from, to, parents);
        }
        if (options.maxDepth > 0 && depth >= options.maxDepth) {
            continue;
        }
        for (const auto& hop : neighbors(current, Direction::Both, options.edgeTypes)) {
            if (!visited.insert(hop.neighbor).second) {
                continue;
            }
            parents[hop.neighbor] = Backlink{current, hop.edge->id};
            queue.emplace_back(hop.neighbor, depth + 1);
        }
    }
    return Error{ErrorCode::NoPathFound,
                 "No path from '" + from + "' to '" + to + "' within depth limit"};
}

Result<Path> MemoryGraphStore::Impl::dijkstraPath(const std::string& from, const std::string& to,
                                                  const PathOptions& options) const {
    // One search state per (node, hop count); a cheaper path that spent the hop budget must not
    // hide a dearer one that can still reach the target
    struct Step {
        std::string id;
        std::string edgeId;
        std::size_t parent; // index into trail, npos for the start
    };
    struct Entry {
        double cost;
        std::size_t hops;
        std::uint64_t seq; // FIFO among equal costs
        std::size_t step;
        bool operator>(const Entry& other) const {
            if (cost != other.cost) {
                return cost > other.cost;
            }
            return seq > other.seq;
        }
    };
    constexpr auto npos = std::numeric_limits<std::size_t>::max();
    const bool capped = options.maxDepth > 0;

    std::vector<Step> trail{Step{from, {}, npos}};
    // Fewest hops with which each node was settled; entries pop in cost order, so a later state
    // with at least as many hops is dominated
    std::unordered_map<std::string, std::size_t> settledHops;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    std::uint64_t seq = 0;
    frontier.push(Entry{0.0, 0, seq++, 0});

    while (!frontier.empty()) {
        Entry entry = frontier.top();
        frontier.pop();
        const std::string current = trail[entry.step].id;
        const std::size_t rank = capped ? entry.hops : 0;
        auto settled = settledHops.find(current);
        if (settled != settledHops.end() && settled->second <= rank) {
            continue;
        }
        settledHops[current] = rank;

        if (current == to) {
            std::vector<std::string> nodeIds;
            std::vector<std::string> edgeIds;
            for (std::size_t i = entry.step; i != npos; i = trail[i].parent) {
                nodeIds.push_back(trail[i].id);
                if (trail[i].parent != npos) {
                    edgeIds.push_back(trail[i].edgeId);
                }
            }
            std::reverse(nodeIds.begin(), nodeIds.end());
            std::reverse(edgeIds.begin(), edgeIds.end());
            return assemblePath(nodeIds, edgeIds);
        }
        if (capped && entry.hops >= options.maxDepth) {
            continue;
        }
        const std::size_t nextRank = capped ? entry.hops + 1 : 0;
        for (const auto& hop : neighbors(current, Direction::Both, options.edgeTypes)) {
            auto seen = settledHops.find(hop.neighbor);
            if (seen != settledHops.end() && seen->second <= nextRank) {
                continue;
            }
            trail.push_back(Step{hop.neighbor, hop.edge->id, entry.step});
            frontier.push(Entry{entry.cost + hop.edge->weight, entry.hops + 1, seq++,
                                trail.size() - 1});
        }
    }
    return Error{ErrorCode::NoPathFound,
                 "No path from '" + from + "' to '" + to + "' within depth limit"};
}

MemoryGraphStore::MemoryGraphStore() : pImpl(std::make_unique<Impl>()) {}

MemoryGraphStore::~MemoryGraphStore() = default;

Result<void> MemoryGraphStore::addNode(GraphNode node) {
    if (node.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Node id must not be empty"};
    }
    std::unique_lock lock(pImpl->mutex);
    if (pImpl->nodes.count(node.id)) {
        return Error{ErrorCode::InvalidState, "Node already exists: " + node.id};
    }
    pImpl->nodeOrder.push_back(node.id);
    std::string id = node.id;
    pImpl->nodes.emplace(std::move(id), std::move(node));
    return {};
}

Result<void> MemoryGraphStore::updateNode(const GraphNode& node) {
    std::unique_lock lock(pImpl->mutex);
    auto it = pImpl->nodes.find(node.id);
    if (it == pImpl->nodes.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + node.id};
    }
    if (!node.type.empty()) {
        it->second.type = node.type;
    }
    if (!node.label.empty()) {
        it->second.label = node.label;
    }
    for (const auto& [key, value] : node.properties) {
        it->second.properties.insert_or_assign(key, value);
    }
    return {};
}

Result<void> MemoryGraphStore::deleteNode(std::string_view id) {
    std::unique_lock lock(pImpl->mutex);
    std::string key(id);
    if (!pImpl->nodes.erase(key)) {
        return {};
    }
    auto& order = pImpl->nodeOrder;
    order.erase(std::remove(order.begin(), order.end(), key), order.end());

    std::vector<std::string> incident;
    for (auto* index : {&pImpl->outEdges, &pImpl->inEdges}) {
        auto it = index->find(key);
        if (it != index->end()) {
            incident.insert(incident.end(), it->second.begin(), it->second.end());
        }
    }
    for (const auto& edgeId : incident) {
        pImpl->eraseEdge(edgeId);
    }
    pImpl->outEdges.erase(key);
    pImpl->inEdges.erase(key);
    spdlog::debug("MemoryGraphStore: deleted node '{}' with {} incident edges", key,
                  incident.size());
    return {};
}

Result<void> MemoryGraphStore::addEdge(GraphEdge edge) {
    std::unique_lock lock(pImpl->mutex);
    if (!pImpl->nodes.count(edge.source)) {
        return Error{ErrorCode::NotFound, "Edge source not found: " + edge.source};
    }
    if (!pImpl->nodes.count(edge.target)) {
        return Error{ErrorCode::NotFound, "Edge target not found: " + edge.target};
    }
    if (edge.id.empty()) {
        edge.id = edge.source + "-" + edge.type + "-" + edge.target;
    }
    if (pImpl->edges.count(edge.id)) {
        return Error{ErrorCode::InvalidState, "Edge already exists: " + edge.id};
    }
    pImpl->outEdges[edge.source].push_back(edge.id);
    pImpl->inEdges[edge.target].push_back(edge.id);
    std::string id = edge.id;
    pImpl->edges.emplace(std::move(id), std::move(edge));
    return {};
}

Result<GraphNode> MemoryGraphStore::getNode(std::string_view id) const {
    std::shared_lock lock(pImpl->mutex);
    auto it = pImpl->nodes.find(std::string(id));
    if (it == pImpl->nodes.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + std::string(id)};
    }
    return it->second;
}

Result<std::vector<GraphNode>> MemoryGraphStore::findNodes(const NodeFilter& filter) const {
    std::shared_lock lock(pImpl->mutex);
    std::vector<GraphNode> out;
    const std::string needle = toLower(filter.label);
    for (const auto& id : pImpl->nodeOrder) {
        const auto& node = pImpl->nodes.at(id);
        if (!filter.type.empty() && node.type != filter.type) {
            continue;
        }
        if (!needle.empty() && toLower(node.label).find(needle) == std::string::npos) {
            continue;
        }
        out.push_back(node);
        if (filter.limit > 0 && out.size() >= filter.limit) {
            break;
        }
    }
    return out;
}

Result<TraverseResult> MemoryGraphStore::traverse(std::string_view startId,
                                                  const TraverseOptions& options) const {
    std::shared_lock lock(pImpl->mutex);
    std::string start(startId);
    if (!pImpl->nodes.count(start)) {
        return Error{ErrorCode::NotFound, "Start node not found: " + start};
    }
    switch (options.strategy) {
        case TraverseStrategy::BFS:
            return pImpl->bfs(start, options);
        case TraverseStrategy::DFS:
            return pImpl->dfs(start, options);
    }
    return Error{ErrorCode::NotSupported, "Unknown traversal strategy"};
}

Result<Path> MemoryGraphStore::shortestPath(std::string_view fromId, std::string_view toId,
                                            const PathOptions& options) const {
    std::shared_lock lock(pImpl->mutex);
    std::string from(fromId);
    std::string to(toId);
    if (!pImpl->nodes.count(from)) {
        return Error{ErrorCode::NotFound, "Node not found: " + from};
    }
    if (!pImpl->nodes.count(to)) {
        return Error{ErrorCode::NotFound, "Node not found: " + to};
    }
    switch (options.algorithm) {
        case PathAlgorithm::BFS:
            return pImpl->bfsPath(from, to, options);
        case PathAlgorithm::Dijkstra:
            return pImpl->dijkstraPath(from, to, options);
    }
    return Error{ErrorCode::NotSupported, "Unknown path algorithm"};
}

std::size_t MemoryGraphStore::nodeCount() const {
    std::shared_lock lock(pImpl->mutex);
    return pImpl->nodes.size();
}

std::size_t MemoryGraphStore::edgeCount() const {
    std::shared_lock lock(pImpl->mutex);
    return pImpl->edges.size();
}

} // namespace graphrag::graph
