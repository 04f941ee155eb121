#pragma once

#include <graphrag/core/document.h>
#include <graphrag/graph/graph_store.h>
#include <graphrag/search/search_types.h>

#include <nlohmann/json.hpp>

namespace graphrag {

// JSON scalars map to bool/int64/double/string, string arrays to string lists.
// Other arrays and objects are kept as their serialized text.
nlohmann::json metadataValueToJson(const MetadataValue& value);
MetadataValue metadataValueFromJson(const nlohmann::json& j);

nlohmann::json metadataToJson(const Metadata& metadata);
Metadata metadataFromJson(const nlohmann::json& j);

// {"id", "content", "metadata", "graph_context"?}
void to_json(nlohmann::json& j, const Document& doc);
void from_json(const nlohmann::json& j, Document& doc);

} // namespace graphrag

namespace graphrag::graph {

// {"id", "type", "label", "properties"}
void to_json(nlohmann::json& j, const GraphNode& node);
void from_json(const nlohmann::json& j, GraphNode& node);

// {"id", "source", "target", "type", "label", "properties", "weight"}
void to_json(nlohmann::json& j, const GraphEdge& edge);
void from_json(const nlohmann::json& j, GraphEdge& edge);

} // namespace graphrag::graph

namespace graphrag::search {

// Counts plus timings in microseconds
void to_json(nlohmann::json& j, const Statistics& stats);

} // namespace graphrag::search
