#include <graphrag/config/config_loader.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>
#include <utility>

namespace graphrag::config {

namespace {

constexpr const char* kSection = "retriever";

// Environment variable -> setting key
constexpr std::pair<const char*, const char*> kEnvOverrides[] = {
    {"GRAPHRAG_VECTOR_WEIGHT", "vector_weight"},
    {"GRAPHRAG_GRAPH_WEIGHT", "graph_weight"},
    {"GRAPHRAG_TOP_K", "top_k"},
    {"GRAPHRAG_MAX_DEPTH", "max_traverse_depth"},
    {"GRAPHRAG_FUSION", "fusion_strategy"},
    {"GRAPHRAG_RERANK", "rerank_strategy"},
    {"GRAPHRAG_MMR_LAMBDA", "mmr_lambda"},
    {"GRAPHRAG_RRF_K", "rrf_constant"},
    {"GRAPHRAG_MIN_SCORE", "min_score"},
    {"GRAPHRAG_CONTEXT", "enable_context_augmentation"},
};

template <typename T, typename Parsed> Result<void> assign(T& field, Parsed parsed) {
    if (!parsed) {
        return parsed.error();
    }
    field = parsed.value();
    return {};
}

} // namespace

Result<void> applySetting(search::RetrieverConfig& config, std::string key,
                          const std::string& value) {
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "mode")
        return assign(config.mode, search::parseSearchMode(unquote(value)));
    if (key == "vector_weight")
        return assign(config.vectorWeight, parse_double(key, value));
    if (key == "graph_weight")
        return assign(config.graphWeight, parse_double(key, value));
    if (key == "max_traverse_depth" || key == "max_depth")
        return assign(config.maxTraverseDepth, parse_size(key, value));
    if (key == "top_k")
        return assign(config.topK, parse_size(key, value));
    if (key == "fusion_strategy" || key == "fusion")
        return assign(config.fusionStrategy, search::parseFusionStrategy(unquote(value)));
    if (key == "rerank_strategy" || key == "rerank")
        return assign(config.rerankStrategy, search::parseRerankStrategy(unquote(value)));
    if (key == "rrf_constant" || key == "rrf_k")
        return assign(config.rrfConstant, parse_double(key, value));
    if (key == "mmr_lambda")
        return assign(config.mmrLambda, parse_double(key, value));
    if (key == "min_score")
        return assign(config.minScore, parse_double(key, value));
    if (key == "enable_context_augmentation" || key == "context")
        return assign(config.enableContextAugmentation, parse_bool(key, value));
    if (key == "worker_threads")
        return assign(config.workerThreads, parse_size(key, value));

    spdlog::debug("config: ignoring unknown retriever key '{}'", key);
    return {};
}

Result<void> applyConfigMap(search::RetrieverConfig& config, const ConfigMap& values) {
    const std::string prefix = std::string(kSection) + ".";
    for (const auto& [fullKey, value] : values) {
        if (fullKey.rfind(prefix, 0) != 0) {
            continue;
        }
        if (auto r = applySetting(config, fullKey.substr(prefix.size()), value); !r) {
            return r;
        }
    }
    return {};
}

Result<void> applyEnvOverrides(search::RetrieverConfig& config) {
    for (const auto& [envName, key] : kEnvOverrides) {
        const char* raw = std::getenv(envName);
        if (!raw || !*raw) {
            continue;
        }
        if (auto r = applySetting(config, key, raw); !r) {
            return Error{r.error().code, std::string(envName) + ": " + r.error().message};
        }
        spdlog::debug("config: {} overrides {}", envName, key);
    }
    return {};
}

Result<search::RetrieverConfig> loadRetrieverConfig(const std::string& override_path) {
    search::RetrieverConfig config;

    const char* envPath = std::getenv("GRAPHRAG_CONFIG");
    const bool explicitPath = !override_path.empty() || (envPath && *envPath);
    const auto path = get_config_path(override_path);

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto parsed = parse_config_file(path);
        if (!parsed) {
            return parsed.error();
        }
        if (auto r = applyConfigMap(config, parsed.value()); !r) {
            return Error{r.error().code, path.string() + ": " + r.error().message};
        }
        spdlog::debug("config: loaded {}", path.string());
    } else if (explicitPath) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }

    if (auto r = applyEnvOverrides(config); !r) {
        return r.error();
    }
    return config;
}

} // namespace graphrag::config
