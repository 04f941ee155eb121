#pragma once

#include <graphrag/config/config_helpers.h>
#include <graphrag/search/search_types.h>

#include <filesystem>
#include <string>

namespace graphrag::config {

/**
 * Applies one retriever setting by key (file key or env suffix, case-insensitive):
 * mode, vector_weight, graph_weight, max_traverse_depth (max_depth), top_k, fusion_strategy
 * (fusion), rerank_strategy (rerank), rrf_constant (rrf_k), mmr_lambda, min_score,
 * enable_context_augmentation (context), worker_threads.
 * Unknown keys are ignored with a debug log; unparseable values yield InvalidArgument.
 */
Result<void> applySetting(search::RetrieverConfig& config, std::string key,
                          const std::string& value);

// Applies [retriever] entries of a parsed file
Result<void> applyConfigMap(search::RetrieverConfig& config, const ConfigMap& values);

// Applies GRAPHRAG_* environment overrides
Result<void> applyEnvOverrides(search::RetrieverConfig& config);

/**
 * Defaults, then the config file, then environment overrides. A missing file at the default
 * location is not an error; an explicit path that cannot be read is NotFound.
 * Collaborator pointers are left empty for the caller to fill.
 */
Result<search::RetrieverConfig> loadRetrieverConfig(const std::string& override_path = "");

} // namespace graphrag::config
