#include <graphrag/extraction/entity_extractor.h>
#include <graphrag/graph/graph_store.h>
#include <graphrag/search/context_augmenter.h>
#include <graphrag/search/graph_retriever.h>
#include <graphrag/search/result_fusion.h>
#include <graphrag/search/result_reranker.h>
#include <graphrag/vector/vector_store.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <limits>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace graphrag::search {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kWaitSlice = std::chrono::milliseconds(5);
constexpr const char* kEntityExtraction = "entity_extraction";
constexpr const char* kGraphTraversal = "graph_traversal";

Duration elapsedSince(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start);
}

// Outcome of a task run on the pool, timed where it ran
template <typename T> struct Timed {
    Result<T> result;
    Duration elapsed{0};
};

// Runs a collaborator call, converting exceptions into errors
template <typename T, typename Fn> Timed<T> runGuarded(const char* what, Fn&& fn) {
    const auto start = Clock::now();
    try {
        auto r = fn();
        return Timed<T>{std::move(r), elapsedSince(start)};
    } catch (const std::exception& e) {
        return Timed<T>{Error{ErrorCode::BackendUnavailable, std::string(what) + ": " + e.what()},
                        elapsedSince(start)};
    } catch (...) {
        return Timed<T>{
            Error{ErrorCode::BackendUnavailable, std::string(what) + ": unknown exception"},
            elapsedSince(start)};
    }
}

// Waits in short slices so a stop request is observed promptly
template <typename T>
Result<T> awaitTask(std::future<Timed<T>>& future, const std::stop_token& stop, const char* what,
                    Duration* elapsed = nullptr) {
    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, std::string(what) + " cancelled"};
        }
    }
    try {
        auto timed = future.get();
        if (elapsed) {
            *elapsed = timed.elapsed;
        }
        return std::move(timed.result);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string(what) + ": " + e.what()};
    } catch (...) {
        return Error{ErrorCode::InternalError, std::string(what) + ": unknown exception"};
    }
}

// Candidates fetched per modality before fusion; saturates instead of wrapping
std::size_t candidateCount(std::size_t k) {
    constexpr auto kMax = std::numeric_limits<std::size_t>::max();
    return k > kMax / 2 ? kMax : k * 2;
}

std::size_t poolSize(std::size_t requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

} // namespace

class GraphRetriever::Impl {
public:
    explicit Impl(RetrieverConfig cfg)
        : config(std::move(cfg)), defaults(config.defaults()),
          pool(poolSize(config.workerThreads)) {}

    ~Impl() { pool.join(); }

    RetrieverConfig config;
    ResolvedSearchOptions defaults;
    boost::asio::thread_pool pool;

    mutable std::mutex statsMutex;
    Statistics lastStats;

    template <typename T, typename Fn> std::future<Timed<T>> submit(Fn fn) {
        auto promise = std::make_shared<std::promise<Timed<T>>>();
        auto future = promise->get_future();
        boost::asio::post(pool, [promise, fn = std::move(fn)]() mutable {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        return future;
    }

    // Tasks own copies of everything they touch; a cancelled call may return before they run
    std::future<Timed<std::vector<Document>>> submitVectorSearch(const std::string& query,
                                                                 std::size_t k,
                                                                 std::stop_token stop) {
        return submit<std::vector<Document>>(
            [store = config.vectorStore, query, k, stop]() -> Timed<std::vector<Document>> {
                if (stop.stop_requested()) {
                    return {Error{ErrorCode::OperationCancelled, "vector search cancelled"}};
                }
                return runGuarded<std::vector<Document>>(
                    "vector search", [&] { return store->similaritySearch(query, k); });
            });
    }

    std::future<Timed<std::vector<extraction::Entity>>>
    submitExtraction(const std::string& query, std::stop_token stop) {
        return submit<std::vector<extraction::Entity>>(
            [extractor = config.entityExtractor, query,
             stop]() -> Timed<std::vector<extraction::Entity>> {
                if (stop.stop_requested()) {
                    return {Error{ErrorCode::OperationCancelled, "entity extraction cancelled"}};
                }
                return runGuarded<std::vector<extraction::Entity>>(
                    "entity extraction", [&] { return extractor->extract(query); });
            });
    }

    Result<std::vector<extraction::Entity>> extractEntities(const std::string& query,
                                                            const std::stop_token& stop,
                                                            Statistics& stats) {
        if (!config.entityExtractor) {
            return std::vector<extraction::Entity>{};
        }
        auto future = submitExtraction(query, stop);
        auto entities = awaitTask(future, stop, "entity extraction", &stats.entityExtractionTime);
        if (!entities) {
            return entities.error();
        }

        // Distinct ids only; the first mention wins
        std::vector<extraction::Entity> unique;
        std::unordered_set<std::string> seen;
        for (auto& e : entities.value()) {
            if (!e.id.empty() && seen.insert(e.id).second) {
                unique.push_back(std::move(e));
            }
        }
        return unique;
    }

    struct GraphBranch {
        std::vector<graph::GraphNode> nodes; // De-duplicated union, first-seen order
        NodeDepthMap depths;                 // Shallowest depth per node
        std::size_t attempted = 0;
        std::size_t failed = 0;
        std::string lastError;
    };

    Result<GraphBranch> traverseEntities(const std::vector<extraction::Entity>& entities,
                                         const ResolvedSearchOptions& opts,
                                         const std::stop_token& stop, Statistics& stats) {
        GraphBranch branch;
        if (entities.empty()) {
            return branch;
        }

        graph::TraverseOptions topts;
        topts.maxDepth = opts.maxTraverseDepth;
        topts.direction = graph::Direction::Both;
        topts.strategy = graph::TraverseStrategy::BFS;
        topts.limit = candidateCount(opts.k);

        const auto start = Clock::now();
        std::vector<std::future<Timed<graph::TraverseResult>>> futures;
        futures.reserve(entities.size());
        for (const auto& entity : entities) {
            futures.push_back(submit<graph::TraverseResult>(
                [store = config.graphStore, id = entity.id, topts,
                 stop]() -> Timed<graph::TraverseResult> {
                    if (stop.stop_requested()) {
                        return {Error{ErrorCode::OperationCancelled, "traversal cancelled"}};
                    }
                    return runGuarded<graph::TraverseResult>(
                        "graph traversal", [&] { return store->traverse(id, topts); });
                }));
        }

        std::unordered_set<std::string> seen;
        for (std::size_t i = 0; i < futures.size(); ++i) {
            ++branch.attempted;
            auto result = awaitTask(futures[i], stop, "graph traversal");
            if (!result) {
                if (result.error().code == ErrorCode::OperationCancelled &&
                    stop.stop_requested()) {
                    return result.error();
                }
                ++branch.failed;
                branch.lastError = result.error().message;
                spdlog::warn("GraphRetriever: traversal from '{}' failed: {}", entities[i].id,
                             result.error().message);
                continue;
            }

            auto& traversal = result.value();
            stats.nodesTraversed += traversal.nodes.size();
            for (auto& node : traversal.nodes) {
                auto depthIt = traversal.depths.find(node.id);
                if (depthIt != traversal.depths.end()) {
                    auto [it, inserted] = branch.depths.emplace(node.id, depthIt->second);
                    if (!inserted) {
                        it->second = std::min(it->second, depthIt->second);
                    }
                }
                if (seen.insert(node.id).second) {
                    branch.nodes.push_back(std::move(node));
                }
            }
        }

        stats.graphTraverseTime = elapsedSince(start);
        stats.failedTraversals = branch.failed;
        return branch;
    }

    Result<SearchResponse> vectorMode(const std::string& query, const ResolvedSearchOptions& opts,
                                      const std::stop_token& stop, Statistics& stats);
    Result<SearchResponse> graphMode(const std::string& query, const ResolvedSearchOptions& opts,
                                     const std::stop_token& stop, Statistics& stats);
    Result<SearchResponse> hybridMode(const std::string& query, const ResolvedSearchOptions& opts,
                                      const std::stop_token& stop, Statistics& stats);
};

Result<SearchResponse> GraphRetriever::Impl::vectorMode(const std::string& query,
                                                        const ResolvedSearchOptions& opts,
                                                        const std::stop_token& stop,
                                                        Statistics& stats) {
    auto future = submitVectorSearch(query, opts.k, stop);
    auto docs = awaitTask(future, stop, "vector search", &stats.vectorSearchTime);
    if (!docs) {
        if (docs.error().code == ErrorCode::OperationCancelled) {
            return docs.error();
        }
        spdlog::error("GraphRetriever: vector search failed: {}", docs.error().message);
        return Error{ErrorCode::BackendUnavailable,
                     "vector search failed: " + docs.error().message};
    }

    SearchResponse response;
    response.documents = std::move(docs).value();
    stats.vectorResults = response.documents.size();
    if (response.documents.size() > opts.k) {
        response.documents.resize(opts.k);
    }
    return response;
}

Result<SearchResponse> GraphRetriever::Impl::graphMode(const std::string& query,
                                                       const ResolvedSearchOptions& opts,
                                                       const std::stop_token& stop,
                                                       Statistics& stats) {
    auto entities = extractEntities(query, stop, stats);
    if (!entities) {
        if (entities.error().code == ErrorCode::OperationCancelled) {
            return entities.error();
        }
        return Error{ErrorCode::BackendUnavailable,
                     "entity extraction failed: " + entities.error().message};
    }
    stats.entitiesExtracted = entities.value().size();
    if (entities.value().empty()) {
        spdlog::debug("GraphRetriever: no entities in query, graph search returns nothing");
        return SearchResponse{};
    }

    auto branch = traverseEntities(entities.value(), opts, stop, stats);
    if (!branch) {
        return branch.error();
    }
    if (branch.value().failed == branch.value().attempted) {
        return Error{ErrorCode::BackendUnavailable,
                     "graph traversal failed for every entity: " + branch.value().lastError};
    }

    SearchResponse response;
    stats.graphResults = branch.value().nodes.size();
    for (const auto& node : branch.value().nodes) {
        if (response.documents.size() >= opts.k) {
            break;
        }
        response.documents.push_back(nodeToDocument(node));
    }
    return response;
}

Result<SearchResponse> GraphRetriever::Impl::hybridMode(const std::string& query,
                                                        const ResolvedSearchOptions& opts,
                                                        const std::stop_token& stop,
                                                        Statistics& stats) {
    // Fork: vector branch runs on the pool while this thread drives the graph branch
    auto vectorFuture = submitVectorSearch(query, candidateCount(opts.k), stop);

    std::vector<extraction::Entity> entities;
    auto extracted = extractEntities(query, stop, stats);
    if (extracted) {
        entities = std::move(extracted).value();
    } else if (extracted.error().code == ErrorCode::OperationCancelled &&
               stop.stop_requested()) {
        return extracted.error();
    } else {
        spdlog::warn("GraphRetriever: entity extraction failed, continuing without graph: {}",
                     extracted.error().message);
        stats.degraded.emplace_back(kEntityExtraction);
    }
    stats.entitiesExtracted = entities.size();

    auto branch = traverseEntities(entities, opts, stop, stats);
    if (!branch) {
        return branch.error();
    }
    if (branch.value().failed > 0) {
        stats.degraded.emplace_back(kGraphTraversal);
    }
    auto& graphNodes = branch.value().nodes;
    stats.graphResults = graphNodes.size();

    // Join
    auto vectorDocs = awaitTask(vectorFuture, stop, "vector search", &stats.vectorSearchTime);
    if (!vectorDocs) {
        if (vectorDocs.error().code == ErrorCode::OperationCancelled) {
            return vectorDocs.error();
        }
        spdlog::error("GraphRetriever: vector search failed: {}", vectorDocs.error().message);
        return Error{ErrorCode::BackendUnavailable,
                     "vector search failed: " + vectorDocs.error().message};
    }
    stats.vectorResults = vectorDocs.value().size();

    auto phaseStart = Clock::now();
    auto fused = ResultFusion(opts).fuse(vectorDocs.value(), graphNodes);
    stats.fusedResults = fused.size();
    stats.fusionTime = elapsedSince(phaseStart);

    phaseStart = Clock::now();
    auto ranked = ResultReranker(opts).rerank(std::move(fused), query, stop);
    stats.rerankTime = elapsedSince(phaseStart);
    if (!ranked) {
        return ranked.error();
    }

    phaseStart = Clock::now();
    auto docs = ContextAugmenter(opts.enableContextAugmentation)
                    .augment(ranked.value(), branch.value().depths);
    stats.augmentationTime = elapsedSince(phaseStart);

    // Documents without a fused score came from a single-phase path and always pass
    SearchResponse response;
    for (auto& doc : docs) {
        if (response.documents.size() >= opts.k) {
            break;
        }
        const auto* score = doc.metadataAs<double>(metadata_keys::kFusedScore);
        if (score && *score < opts.minScore) {
            continue;
        }
        response.documents.push_back(std::move(doc));
    }
    return response;
}

GraphRetriever::GraphRetriever(RetrieverConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

GraphRetriever::~GraphRetriever() = default;

Result<SearchResponse> GraphRetriever::search(const std::string& query,
                                              const SearchOptions& options,
                                              std::stop_token stop) {
    const auto start = Clock::now();
    Statistics stats;

    auto publish = [&](Statistics s) {
        s.totalTime = elapsedSince(start);
        std::lock_guard<std::mutex> lock(pImpl->statsMutex);
        pImpl->lastStats = std::move(s);
    };

    auto resolved = resolveOptions(pImpl->defaults, options);
    if (!resolved) {
        publish(stats);
        return resolved.error();
    }
    const auto& opts = resolved.value();
    spdlog::debug("GraphRetriever: mode={} k={} fusion={} rerank={} depth={} context={}",
                  toString(opts.mode), opts.k, toString(opts.fusionStrategy),
                  toString(opts.rerankStrategy), opts.maxTraverseDepth,
                  opts.enableContextAugmentation);

    // Internal source lets pending pool tasks skip their work once this call is abandoned
    std::stop_source callStop;
    std::stop_callback forwardStop(stop, [&callStop] { callStop.request_stop(); });
    const auto token = callStop.get_token();

    if (token.stop_requested()) {
        publish(stats);
        return Error{ErrorCode::OperationCancelled, "search cancelled before start"};
    }

    Result<SearchResponse> result = Error{ErrorCode::InvalidState};
    switch (opts.mode) {
        case SearchMode::Vector:
            result = pImpl->vectorMode(query, opts, token, stats);
            break;
        case SearchMode::Graph:
            result = pImpl->graphMode(query, opts, token, stats);
            break;
        case SearchMode::Hybrid:
            result = pImpl->hybridMode(query, opts, token, stats);
            break;
    }
    callStop.request_stop();

    if (!result) {
        publish(stats);
        return result.error();
    }

    auto response = std::move(result).value();
    stats.returnedResults = response.documents.size();
    stats.totalTime = elapsedSince(start);
    if (stats.isDegraded()) {
        spdlog::info("GraphRetriever: search completed degraded ({} failed traversals, {} results)",
                     stats.failedTraversals, stats.returnedResults);
    }
    spdlog::debug("GraphRetriever: vector={} graph={} fused={} returned={} in {}us",
                  stats.vectorResults, stats.graphResults, stats.fusedResults,
                  stats.returnedResults, stats.totalTime.count());
    response.statistics = stats;
    publish(std::move(stats));
    return response;
}

Statistics GraphRetriever::getStatistics() const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    return pImpl->lastStats;
}

const RetrieverConfig& GraphRetriever::getConfig() const {
    return pImpl->config;
}

Result<std::unique_ptr<GraphRetriever>> makeGraphRetriever(RetrieverConfig config) {
    if (!config.vectorStore) {
        return Error{ErrorCode::ValidationError, "vector store is required"};
    }
    if (!config.graphStore) {
        return Error{ErrorCode::ValidationError, "graph store is required"};
    }
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    spdlog::debug("GraphRetriever: created (weights {}/{}, k={}, extractor={})",
                  config.vectorWeight, config.graphWeight, config.topK,
                  config.entityExtractor ? "yes" : "no");
    return std::make_unique<GraphRetriever>(std::move(config));
}

} // namespace graphrag::search
