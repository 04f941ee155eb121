#include <graphrag/search/context_augmenter.h>

#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace graphrag::search {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

} // namespace

GraphContextInfo buildContextInfo(const FusedResult& result, const NodeDepthMap& depths) {
    GraphContextInfo info;
    if (result.relatedNodes.empty()) {
        return info;
    }

    std::unordered_set<std::string> seenIds;
    std::unordered_set<std::string> seenEntities;
    std::size_t shallowest = std::numeric_limits<std::size_t>::max();

    for (const auto& node : result.relatedNodes) {
        if (seenIds.insert(node.id).second) {
            ++info.neighborCount;
        }
        if (auto it = depths.find(node.id); it != depths.end()) {
            shallowest = std::min(shallowest, it->second);
        }
        if (node.label.empty()) {
            continue;
        }
        auto entity = fmt::format("{} ({})", node.label, node.type);
        if (seenEntities.insert(entity).second) {
            info.relatedEntities.push_back(std::move(entity));
        }
    }

    info.graphDepth = shallowest == std::numeric_limits<std::size_t>::max() ? 1 : shallowest;
    if (!info.relatedEntities.empty()) {
        info.text = "Related Entities: " + join(info.relatedEntities, ", ");
    }
    return info;
}

Document ContextAugmenter::augmentOne(const FusedResult& result, const NodeDepthMap& depths) const {
    Document doc = result.document;
    doc.addMetadata(metadata_keys::kFusedScore, result.fusedScore);
    doc.addMetadata(metadata_keys::kVectorScore, result.vectorScore);
    doc.addMetadata(metadata_keys::kGraphScore, result.graphScore);
    doc.addMetadata(metadata_keys::kRank, static_cast<std::int64_t>(result.rank));

    if (!includeGraphContext_ || result.relatedNodes.empty()) {
        return doc;
    }

    auto info = buildContextInfo(result, depths);
    if (!info.relatedEntities.empty()) {
        doc.addMetadata(metadata_keys::kRelatedEntities, info.relatedEntities);
    }
    doc.addMetadata(metadata_keys::kNeighborCount, static_cast<std::int64_t>(info.neighborCount));
    doc.addMetadata(metadata_keys::kGraphDepth, static_cast<std::int64_t>(info.graphDepth));
    if (!info.text.empty()) {
        doc.addMetadata(metadata_keys::kGraphContext, info.text);
        doc.graphContext = std::move(info.text);
    }
    return doc;
}

std::vector<Document> ContextAugmenter::augment(const std::vector<FusedResult>& ranked,
                                                const NodeDepthMap& depths) const {
    std::vector<Document> docs;
    docs.reserve(ranked.size());
    for (const auto& r : ranked) {
        docs.push_back(augmentOne(r, depths));
    }
    return docs;
}

Document enhanceWithGraphStructure(const Document& doc, const graph::GraphNode* node,
                                   const std::vector<graph::GraphNode>& neighbors) {
    Document enhanced = doc;
    if (node) {
        enhanced.addMetadata("node_id", node->id);
        enhanced.addMetadata("node_type", node->type);
        enhanced.addMetadata("node_label", node->label);
        for (const auto& [key, value] : node->properties) {
            enhanced.addMetadata("node_" + key, value);
        }
    }

    if (!neighbors.empty()) {
        std::vector<std::string> labels;
        labels.reserve(neighbors.size());
        for (const auto& n : neighbors) {
            labels.push_back(n.label);
        }
        auto text = "Connected to: " + join(labels, ", ");
        enhanced.addMetadata("neighbors", labels);
        enhanced.addMetadata(metadata_keys::kNeighborCount,
                             static_cast<std::int64_t>(neighbors.size()));
        enhanced.addMetadata(metadata_keys::kGraphContext, text);
        enhanced.graphContext = std::move(text);
    }
    return enhanced;
}

std::string formatContextForLLM(const std::vector<Document>& docs, bool includeMetadata) {
    std::string out = "Context:\n\n";
    for (std::size_t i = 0; i < docs.size(); ++i) {
        const auto& doc = docs[i];
        out += fmt::format("Document {}:\n", i + 1);
        out += doc.renderContent();
        out += "\n";

        if (includeMetadata && !doc.metadata.empty()) {
            out += "Metadata:\n";
            if (const auto* entities =
                    doc.metadataAs<std::vector<std::string>>(metadata_keys::kRelatedEntities)) {
                out += "  Related Entities: " + join(*entities, ", ") + "\n";
            }
            if (const auto* score = doc.metadataAs<double>(metadata_keys::kFusedScore)) {
                out += fmt::format("  Relevance Score: {:.3f}\n", *score);
            }
        }
        out += "\n---\n\n";
    }
    return out;
}

} // namespace graphrag::search
