#include <graphrag/serialization/json.h>

#include <cstdint>

namespace graphrag {

using json = nlohmann::json;

json metadataValueToJson(const MetadataValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

MetadataValue metadataValueFromJson(const json& j) {
    switch (j.type()) {
        case json::value_t::boolean:
            return j.get<bool>();
        case json::value_t::number_integer:
            return j.get<std::int64_t>();
        case json::value_t::number_unsigned:
            return static_cast<std::int64_t>(j.get<std::uint64_t>());
        case json::value_t::number_float:
            return j.get<double>();
        case json::value_t::string:
            return j.get<std::string>();
        case json::value_t::array: {
            std::vector<std::string> items;
            for (const auto& item : j) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            return items;
        }
        case json::value_t::null:
            return std::string{};
        default:
            return j.dump();
    }
}

json metadataToJson(const Metadata& metadata) {
    json out = json::object();
    for (const auto& [key, value] : metadata) {
        out[key] = metadataValueToJson(value);
    }
    return out;
}

Metadata metadataFromJson(const json& j) {
    Metadata out;
    if (!j.is_object()) {
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        out.emplace(it.key(), metadataValueFromJson(it.value()));
    }
    return out;
}

void to_json(json& j, const Document& doc) {
    j = json{{"id", doc.id}, {"content", doc.content}, {"metadata", metadataToJson(doc.metadata)}};
    if (doc.graphContext) {
        j["graph_context"] = *doc.graphContext;
    }
}

void from_json(const json& j, Document& doc) {
    doc.id = j.value("id", std::string{});
    doc.content = j.value("content", std::string{});
    doc.metadata = metadataFromJson(j.value("metadata", json::object()));
    if (j.contains("graph_context") && j.at("graph_context").is_string()) {
        doc.graphContext = j.at("graph_context").get<std::string>();
    } else {
        doc.graphContext.reset();
    }
}

} // namespace graphrag

namespace graphrag::graph {

using json = nlohmann::json;

void to_json(json& j, const GraphNode& node) {
    j = json{{"id", node.id},
             {"type", node.type},
             {"label", node.label},
             {"properties", metadataToJson(node.properties)}};
}

void from_json(const json& j, GraphNode& node) {
    j.at("id").get_to(node.id);
    node.type = j.value("type", std::string{});
    node.label = j.value("label", std::string{});
    node.properties = metadataFromJson(j.value("properties", json::object()));
}

void to_json(json& j, const GraphEdge& edge) {
    j = json{{"id", edge.id},         {"source", edge.source},
             {"target", edge.target}, {"type", edge.type},
             {"label", edge.label},   {"properties", metadataToJson(edge.properties)},
             {"weight", edge.weight}};
}

void from_json(const json& j, GraphEdge& edge) {
    edge.id = j.value("id", std::string{});
    j.at("source").get_to(edge.source);
    j.at("target").get_to(edge.target);
    edge.type = j.value("type", std::string{});
    edge.label = j.value("label", std::string{});
    edge.properties = metadataFromJson(j.value("properties", json::object()));
    edge.weight = j.value("weight", 1.0);
}

} // namespace graphrag::graph

namespace graphrag::search {

void to_json(nlohmann::json& j, const Statistics& stats) {
    j = nlohmann::json{{"vector_results", stats.vectorResults},
                       {"graph_results", stats.graphResults},
                       {"fused_results", stats.fusedResults},
                       {"entities_extracted", stats.entitiesExtracted},
                       {"nodes_traversed", stats.nodesTraversed},
                       {"failed_traversals", stats.failedTraversals},
                       {"returned_results", stats.returnedResults},
                       {"degraded", stats.degraded}};
    j["timings_us"] = {{"vector_search", stats.vectorSearchTime.count()},
                       {"entity_extraction", stats.entityExtractionTime.count()},
                       {"graph_traverse", stats.graphTraverseTime.count()},
                       {"fusion", stats.fusionTime.count()},
                       {"rerank", stats.rerankTime.count()},
                       {"augmentation", stats.augmentationTime.count()},
                       {"total", stats.totalTime.count()}};
}

} // namespace graphrag::search
