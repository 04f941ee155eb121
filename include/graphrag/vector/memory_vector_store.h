#pragma once

#include <graphrag/vector/vector_store.h>

#include <memory>
#include <shared_mutex>

namespace graphrag::vector {

// Cosine similarity of two equal-length vectors; 0 when either has zero norm
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * Brute-force cosine index over caller-supplied embeddings. Queries are embedded with the
 * configured EmbeddingProvider. The similarity of each hit is written to metadata "score".
 */
class MemoryVectorStore : public VectorStore {
public:
    explicit MemoryVectorStore(std::shared_ptr<EmbeddingProvider> embedder);

    // Dimension must match the provider; empty embeddings are rejected
    Result<void> add(Document doc, std::vector<float> embedding);

    Result<std::vector<Document>> similaritySearch(const std::string& query,
                                                   std::size_t k) const override;

    // Search with a precomputed query embedding
    Result<std::vector<Document>> searchByVector(const std::vector<float>& query,
                                                 std::size_t k) const;

    std::size_t size() const;

private:
    struct Entry {
        Document doc;
        std::vector<float> embedding;
    };

    std::shared_ptr<EmbeddingProvider> embedder_;
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace graphrag::vector
