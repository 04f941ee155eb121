#include <graphrag/search/result_fusion.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace graphrag::search {

namespace {
constexpr std::size_t kContentKeyBytes = 100;
} // namespace

std::string documentKey(const Document& doc) {
    if (!doc.id.empty()) {
        return doc.id;
    }
    return doc.content.substr(0, kContentKeyBytes);
}

Document nodeToDocument(const graph::GraphNode& node) {
    std::string content = node.type + ": " + node.label;
    auto desc = node.properties.find("description");
    if (desc != node.properties.end()) {
        if (const auto* text = std::get_if<std::string>(&desc->second)) {
            content += "\n" + *text;
        }
    }

    Document doc(node.id, std::move(content));
    doc.addMetadata(metadata_keys::kEntityId, node.id);
    doc.addMetadata(metadata_keys::kEntityType, node.type);
    doc.addMetadata(metadata_keys::kEntityLabel, node.label);
    for (const auto& [key, value] : node.properties) {
        doc.addMetadata(key, value);
    }
    return doc;
}

std::string explainScore(const FusedResult& result, FusionStrategy strategy) {
    const char* law = "Score";
    switch (strategy) {
        case FusionStrategy::Weighted:
            law = "Weighted";
            break;
        case FusionStrategy::RRF:
            law = "RRF";
            break;
        case FusionStrategy::Max:
            law = "Max";
            break;
        case FusionStrategy::Min:
            law = "Min";
            break;
    }
    return fmt::format("{}: {:.3f} (vector: {:.3f}, graph: {:.3f})", law, result.fusedScore,
                       result.vectorScore, result.graphScore);
}

void assignRanks(std::vector<FusedResult>& results) {
    for (std::size_t i = 0; i < results.size(); ++i) {
        results[i].rank = i + 1;
    }
}

double ResultFusion::positionScore(std::size_t index, std::size_t length) const {
    if (options_.fusionStrategy == FusionStrategy::RRF) {
        return 1.0 / (options_.rrfConstant + static_cast<double>(index) + 1.0);
    }
    if (length == 0) {
        return 0.0;
    }
    return 1.0 - static_cast<double>(index) / static_cast<double>(length);
}

double ResultFusion::fuseOne(const FusedResult& r) const {
    switch (options_.fusionStrategy) {
        case FusionStrategy::Weighted: {
            const double total = options_.vectorWeight + options_.graphWeight;
            if (total <= 0.0) {
                return std::max(r.vectorScore, r.graphScore);
            }
            return (options_.vectorWeight * r.vectorScore + options_.graphWeight * r.graphScore) /
                   total;
        }
        case FusionStrategy::RRF:
            return r.vectorScore + r.graphScore;
        case FusionStrategy::Max:
            return std::max(r.vectorScore, r.graphScore);
        case FusionStrategy::Min:
            // Single-modality hits keep the score they have
            if (r.fromVector && r.fromGraph) {
                return std::min(r.vectorScore, r.graphScore);
            }
            return r.fromVector ? r.vectorScore : r.graphScore;
    }
    return r.vectorScore;
}

void ResultFusion::score(std::vector<FusedResult>& candidates) const {
    for (auto& c : candidates) {
        c.fusedScore = fuseOne(c);
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const FusedResult& a, const FusedResult& b) {
                         return a.fusedScore > b.fusedScore;
                     });
    assignRanks(candidates);
}

std::vector<FusedResult> ResultFusion::fuse(const std::vector<Document>& vectorDocs,
                                            const std::vector<graph::GraphNode>& graphNodes) const {
    std::vector<FusedResult> merged;
    merged.reserve(vectorDocs.size() + graphNodes.size());
    std::unordered_map<std::string, std::size_t> index;

    for (std::size_t i = 0; i < vectorDocs.size(); ++i) {
        auto key = documentKey(vectorDocs[i]);
        if (index.count(key)) {
            spdlog::debug("ResultFusion: duplicate vector candidate '{}' at position {} ignored",
                          key, i);
            continue;
        }
        FusedResult r;
        r.document = vectorDocs[i];
        r.vectorScore = positionScore(i, vectorDocs.size());
        r.fromVector = true;
        index.emplace(std::move(key), merged.size());
        merged.push_back(std::move(r));
    }

    for (std::size_t j = 0; j < graphNodes.size(); ++j) {
        const auto& node = graphNodes[j];
        Document doc = nodeToDocument(node);
        auto key = documentKey(doc);
        const double s = positionScore(j, graphNodes.size());

        if (auto it = index.find(key); it != index.end()) {
            auto& existing = merged[it->second];
            if (!existing.fromGraph) {
                existing.graphScore = s;
                existing.fromGraph = true;
            }
            existing.relatedNodes.push_back(node);
            continue;
        }

        FusedResult r;
        r.document = std::move(doc);
        r.graphScore = s;
        r.fromGraph = true;
        r.relatedNodes.push_back(node);
        index.emplace(std::move(key), merged.size());
        merged.push_back(std::move(r));
    }

    score(merged);
    spdlog::debug("ResultFusion: {} vector + {} graph -> {} candidates ({})", vectorDocs.size(),
                  graphNodes.size(), merged.size(), toString(options_.fusionStrategy));
    return merged;
}

} // namespace graphrag::search
