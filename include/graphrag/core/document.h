#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace graphrag {

/**
 * Typed metadata value. Every consumer matches all alternatives through std::visit, so adding
 * a kind is a compile error at each site that has not handled it.
 */
using MetadataValue =
    std::variant<bool, std::int64_t, double, std::string, std::vector<std::string>>;

using Metadata = std::map<std::string, MetadataValue>;

// Metadata keys written by the retrieval pipeline
namespace metadata_keys {
inline constexpr const char* kFusedScore = "fused_score";
inline constexpr const char* kVectorScore = "vector_score";
inline constexpr const char* kGraphScore = "graph_score";
inline constexpr const char* kRank = "rank";
inline constexpr const char* kRelatedEntities = "related_entities";
inline constexpr const char* kNeighborCount = "neighbor_count";
inline constexpr const char* kGraphDepth = "graph_depth";
inline constexpr const char* kGraphContext = "graph_context";
inline constexpr const char* kEntityId = "entity_id";
inline constexpr const char* kEntityType = "entity_type";
inline constexpr const char* kEntityLabel = "entity_label";
inline constexpr const char* kScore = "score";
} // namespace metadata_keys

/**
 * Retrievable payload shared by the vector store, the graph conversion and every pipeline
 * stage.
 */
struct Document {
    std::string id;      // Stable identifier; may be empty
    std::string content; // Text payload as stored
    Metadata metadata;

    // Graph context attached by augmentation. Kept apart from `content` so that augmenting
    // twice replaces instead of appending.
    std::optional<std::string> graphContext;

    Document() = default;
    Document(std::string id_, std::string content_, Metadata metadata_ = {})
        : id(std::move(id_)), content(std::move(content_)), metadata(std::move(metadata_)) {}

    void addMetadata(std::string key, MetadataValue value) {
        metadata.insert_or_assign(std::move(key), std::move(value));
    }

    bool hasMetadata(std::string_view key) const {
        return metadata.find(std::string(key)) != metadata.end();
    }

    template <typename T> const T* metadataAs(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        if (it == metadata.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    // Content followed by the graph context block, if any
    std::string renderContent() const;
};

// Numeric view of a metadata value (bool/int/double); nullopt for text kinds
std::optional<double> metadataAsNumber(const MetadataValue& value);

// Human-readable rendering of any metadata value
std::string metadataToString(const MetadataValue& value);

} // namespace graphrag
