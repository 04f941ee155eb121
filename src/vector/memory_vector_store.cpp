#include <graphrag/vector/memory_vector_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>

namespace graphrag::vector {

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(normA) * std::sqrt(normB)));
}

MemoryVectorStore::MemoryVectorStore(std::shared_ptr<EmbeddingProvider> embedder)
    : embedder_(std::move(embedder)) {}

Result<void> MemoryVectorStore::add(Document doc, std::vector<float> embedding) {
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "Embedding must not be empty"};
    }
    if (embedder_ && embedding.size() != embedder_->dimension()) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding dimension " + std::to_string(embedding.size()) +
                         " does not match provider dimension " +
                         std::to_string(embedder_->dimension())};
    }
    std::unique_lock lock(mutex_);
    if (!entries_.empty() && entries_.front().embedding.size() != embedding.size()) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension mismatch"};
    }
    entries_.push_back(Entry{std::move(doc), std::move(embedding)});
    return {};
}

Result<std::vector<Document>> MemoryVectorStore::similaritySearch(const std::string& query,
                                                                  std::size_t k) const {
    if (!embedder_) {
        return Error{ErrorCode::NotConnected, "No embedding provider configured"};
    }
    auto embedding = embedder_->embed(query);
    if (!embedding) {
        return Error{ErrorCode::BackendUnavailable,
                     "Query embedding failed: " + embedding.error().message};
    }
    return searchByVector(embedding.value(), k);
}

Result<std::vector<Document>> MemoryVectorStore::searchByVector(const std::vector<float>& query,
                                                                std::size_t k) const {
    std::shared_lock lock(mutex_);
    if (k == 0 || entries_.empty()) {
        return std::vector<Document>{};
    }

    std::vector<std::pair<float, std::size_t>> scored;
    scored.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        scored.emplace_back(cosineSimilarity(query, entries_[i].embedding), i);
    }

    // Ties keep insertion order
    const std::size_t kk = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(kk),
                      scored.end(), [](const auto& a, const auto& b) {
                          if (a.first != b.first) {
                              return a.first > b.first;
                          }
                          return a.second < b.second;
                      });

    std::vector<Document> out;
    out.reserve(kk);
    for (std::size_t i = 0; i < kk; ++i) {
        Document doc = entries_[scored[i].second].doc;
        doc.addMetadata(metadata_keys::kScore, static_cast<double>(scored[i].first));
        out.push_back(std::move(doc));
    }
    spdlog::debug("MemoryVectorStore: {} of {} entries returned", out.size(), entries_.size());
    return out;
}

std::size_t MemoryVectorStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace graphrag::vector
