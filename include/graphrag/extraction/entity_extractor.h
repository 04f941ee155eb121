#pragma once

#include <graphrag/core/types.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace graphrag::extraction {

// Entity recognised in query text; id is the graph node id traversal starts from
struct Entity {
    std::string id;
    std::string name; // Surface form as matched
    std::string type;
    float confidence = 1.0f;
    std::size_t start = 0; // Byte offset of the mention
};

/**
 * Best-effort query entity extraction. An empty result is a normal outcome; an error means
 * the extractor itself could not run.
 */
class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;

    virtual Result<std::vector<Entity>> extract(const std::string& text) const = 0;
};

struct AliasExtractorConfig {
    // Minimum confidence for emitting an entity
    float minConfidence = 0.5f;

    // Consider multi-token phrases up to this n-gram size
    std::size_t maxNgram = 3;

    // Fold simple plurals ("graphs" -> "graph", "libraries" -> "library") on lookup
    bool foldPlurals = true;

    // Tokens ignored during tokenization (already lowercase)
    std::unordered_set<std::string> stopwords;

    bool isValid() const {
        return minConfidence >= 0.0f && minConfidence <= 1.0f && maxNgram >= 1;
    }
};

// Dictionary entry mapping a surface form to a graph entity
struct AliasEntry {
    std::string alias;    // e.g. "NYC"
    std::string entityId; // e.g. "city:new-york"
    std::string type;     // e.g. "city"
    float prior = 1.0f;   // [0,1]
};

/**
 * Dictionary extractor.
 * - Lowercase + punctuation-trim normalization
 * - Longest-first n-gram matching, so "new york city" wins over "york"
 * - Optional plural folding
 * - Entities de-duplicated by id, reported in mention order
 */
class AliasEntityExtractor final : public EntityExtractor {
public:
    AliasEntityExtractor() = default;
    explicit AliasEntityExtractor(AliasExtractorConfig cfg) : config_(std::move(cfg)) {}

    Result<void> addAlias(const AliasEntry& entry);
    Result<void> addAliases(const std::vector<AliasEntry>& entries);
    void clearAliases();
    std::size_t aliasCount() const;

    Result<std::vector<Entity>> extract(const std::string& text) const override;

    const AliasExtractorConfig& config() const { return config_; }

    // Exposed for tests
    static std::string normalize(std::string_view s);
    static std::string foldPlural(const std::string& s);

private:
    struct Target {
        std::string entityId;
        std::string type;
        float prior;
    };

    struct Token {
        std::string text;
        std::size_t start;
        std::size_t end;
    };

    std::vector<Token> tokenize(const std::string& text) const;
    std::optional<Target> lookupBest(const std::string& normAlias) const;

    AliasExtractorConfig config_{};
    std::unordered_map<std::string, std::vector<Target>> aliases_;
    mutable std::mutex mutex_;
};

} // namespace graphrag::extraction
