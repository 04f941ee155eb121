#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <stop_token>
#include <thread>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <graphrag/config/config_loader.h>
#include <graphrag/extraction/entity_extractor.h>
#include <graphrag/graph/memory_graph_store.h>
#include <graphrag/search/context_augmenter.h>
#include <graphrag/search/graph_retriever.h>
#include <graphrag/search/text_similarity.h>
#include <graphrag/serialization/json.h>
#include <graphrag/vector/memory_vector_store.h>

using json = nlohmann::json;
using namespace graphrag;

namespace {

// Feature-hashed bag of words. Good enough to demo retrieval without a model.
class HashingEmbeddingProvider final : public vector::EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(std::size_t dim) : dim_(dim) {}

    Result<std::vector<float>> embed(const std::string& text) const override {
        std::vector<float> v(dim_, 0.0f);
        for (const auto& word : search::extractWords(text)) {
            v[std::hash<std::string>{}(word) % dim_] += 1.0f;
        }
        float norm = 0.0f;
        for (float x : v)
            norm += x * x;
        if (norm > 0.0f) {
            norm = std::sqrt(norm);
            for (float& x : v)
                x /= norm;
        }
        return v;
    }

    std::size_t dimension() const override { return dim_; }

private:
    std::size_t dim_;
};

struct Corpus {
    std::shared_ptr<vector::MemoryVectorStore> vectors;
    std::shared_ptr<graph::MemoryGraphStore> graph;
    std::shared_ptr<extraction::AliasEntityExtractor> extractor;
};

Result<Corpus> loadCorpus(const std::string& path, std::size_t dim) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open corpus: " + path};
    }
    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Corpus is not valid JSON: ") + e.what()};
    }

    auto embedder = std::make_shared<HashingEmbeddingProvider>(dim);
    Corpus corpus{std::make_shared<vector::MemoryVectorStore>(embedder),
                  std::make_shared<graph::MemoryGraphStore>(),
                  std::make_shared<extraction::AliasEntityExtractor>()};

    try {
        for (const auto& item : root.value("documents", json::array())) {
            auto doc = item.get<Document>();
            auto embedding = embedder->embed(doc.content);
            if (!embedding) {
                return embedding.error();
            }
            if (auto r = corpus.vectors->add(std::move(doc), std::move(embedding).value()); !r) {
                return r.error();
            }
        }
        for (const auto& item : root.value("nodes", json::array())) {
            auto node = item.get<graph::GraphNode>();
            // Every node is findable by its own label
            extraction::AliasEntry self{node.label, node.id, node.type, 1.0f};
            if (auto r = corpus.graph->addNode(node); !r) {
                return r.error();
            }
            if (!self.alias.empty()) {
                if (auto r = corpus.extractor->addAlias(self); !r) {
                    return r.error();
                }
            }
        }
        for (const auto& item : root.value("edges", json::array())) {
            if (auto r = corpus.graph->addEdge(item.get<graph::GraphEdge>()); !r) {
                return r.error();
            }
        }
        for (const auto& item : root.value("aliases", json::array())) {
            extraction::AliasEntry entry{item.at("alias").get<std::string>(),
                                         item.at("entity_id").get<std::string>(),
                                         item.value("type", std::string{}),
                                         item.value("prior", 1.0f)};
            if (auto r = corpus.extractor->addAlias(entry); !r) {
                return r.error();
            }
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed corpus entry: ") + e.what()};
    }

    spdlog::info("Loaded corpus: {} documents, {} nodes, {} edges, {} aliases",
                 corpus.vectors->size(), corpus.graph->nodeCount(), corpus.graph->edgeCount(),
                 corpus.extractor->aliasCount());
    return corpus;
}

void setLogLevel(const std::string& level) {
    if (level == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (level == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (level == "info")
        spdlog::set_level(spdlog::level::info);
    else if (level == "warn")
        spdlog::set_level(spdlog::level::warn);
    else if (level == "error")
        spdlog::set_level(spdlog::level::err);
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"graphrag-search - hybrid vector + knowledge graph retrieval over a JSON corpus"};

    std::string corpusPath;
    std::string query;
    std::string configPath;
    std::string logLevel = "warn";
    if (const char* env = std::getenv("GRAPHRAG_LOG_LEVEL"); env && *env) {
        logLevel = env;
    }
    std::string mode;
    std::string fusion;
    std::string rerank;
    std::string format = "json";
    std::size_t k = 0;
    std::size_t depth = 0;
    double minScore = -1.0;
    double mmrLambda = -1.0;
    bool noContext = false;
    std::size_t dim = 256;
    long timeoutMs = 0;

    app.add_option("-c,--corpus", corpusPath, "Corpus JSON (documents, nodes, edges, aliases)")
        ->required();
    app.add_option("-q,--query", query, "Query text")->required();
    app.add_option("--config", configPath, "Config file (default: $GRAPHRAG_CONFIG or XDG path)");
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("-m,--mode", mode, "Search mode")
        ->check(CLI::IsMember({"hybrid", "vector", "graph"}));
    app.add_option("--fusion", fusion, "Fusion strategy")
        ->check(CLI::IsMember({"weighted", "rrf", "max", "min"}));
    app.add_option("--rerank", rerank, "Rerank strategy")
        ->check(CLI::IsMember({"score", "diversity", "mmr"}));
    app.add_option("-k,--top-k", k, "Number of results");
    app.add_option("--depth", depth, "Maximum traversal depth");
    app.add_option("--min-score", minScore, "Minimum fused score");
    app.add_option("--mmr-lambda", mmrLambda, "MMR relevance/diversity trade-off in [0,1]");
    app.add_flag("--no-context", noContext, "Skip graph context augmentation");
    app.add_option("--dim", dim, "Hashing embedding dimension")->default_val(256);
    app.add_option("--timeout-ms", timeoutMs, "Cancel the search after this many milliseconds");
    app.add_option("--format", format, "Output format")->check(CLI::IsMember({"json", "text"}));
    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stderr_color_mt("graphrag");
    spdlog::set_default_logger(logger);
    setLogLevel(logLevel);

    auto loaded = config::loadRetrieverConfig(configPath);
    if (!loaded) {
        spdlog::error("Configuration error: {}", loaded.error().message);
        return 2;
    }
    auto cfg = std::move(loaded).value();

    auto corpus = loadCorpus(corpusPath, dim == 0 ? 256 : dim);
    if (!corpus) {
        spdlog::error("{}", corpus.error().message);
        return 1;
    }
    cfg.vectorStore = corpus.value().vectors;
    cfg.graphStore = corpus.value().graph;
    cfg.entityExtractor = corpus.value().extractor;

    auto retriever = search::makeGraphRetriever(std::move(cfg));
    if (!retriever) {
        spdlog::error("Invalid retriever configuration: {}", retriever.error().message);
        return 2;
    }

    search::SearchOptions opts;
    if (!mode.empty())
        opts.mode = search::parseSearchMode(mode).value();
    if (!fusion.empty())
        opts.fusionStrategy = search::parseFusionStrategy(fusion).value();
    if (!rerank.empty())
        opts.rerankStrategy = search::parseRerankStrategy(rerank).value();
    if (k > 0)
        opts.k = k;
    if (depth > 0)
        opts.maxTraverseDepth = depth;
    if (minScore >= 0.0)
        opts.minScore = minScore;
    if (mmrLambda >= 0.0)
        opts.mmrLambda = mmrLambda;
    if (noContext)
        opts.enableContextAugmentation = false;

    std::stop_source cancel;
    std::jthread timer;
    if (timeoutMs > 0) {
        timer = std::jthread([&cancel, timeoutMs](std::stop_token done) {
            const auto deadline =
                std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
            while (!done.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            if (!done.stop_requested()) {
                cancel.request_stop();
            }
        });
    }

    auto response = retriever.value()->search(query, opts, cancel.get_token());
    if (!response) {
        spdlog::error("Search failed ({}): {}", response.error().code, response.error().message);
        return 1;
    }

    const auto& result = response.value();
    if (format == "text") {
        std::cout << search::formatContextForLLM(result.documents, true);
    } else {
        json out;
        out["query"] = query;
        out["results"] = result.documents;
        out["statistics"] = result.statistics;
        std::cout << out.dump(2) << std::endl;
    }
    return 0;
}
