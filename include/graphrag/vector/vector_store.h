#pragma once

#include <graphrag/core/document.h>
#include <graphrag/core/types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace graphrag::vector {

/**
 * Dense similarity search collaborator. Returns at most k documents ordered by descending
 * relevance. Implementations must be safe for concurrent calls.
 */
class VectorStore {
public:
    virtual ~VectorStore() = default;

    virtual Result<std::vector<Document>> similaritySearch(const std::string& query,
                                                           std::size_t k) const = 0;
};

/**
 * Turns query text into an embedding. Embedding generation itself is outside this library;
 * callers plug in their model here.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) const = 0;
    virtual std::size_t dimension() const = 0;
};

} // namespace graphrag::vector
