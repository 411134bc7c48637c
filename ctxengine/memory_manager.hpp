#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "embedder.hpp"

namespace ctxengine {

struct MemoryItem {
    std::string id;
    std::string text;
    Vector vector;
    nlohmann::json metadata = nlohmann::json::object();
    std::chrono::system_clock::time_point created_at;
};

struct ScoredResult {
    std::string id;
    std::string text;
    float score;
    nlohmann::json metadata;
};

struct SearchOptions {
    size_t top_k = 10;                // results returned at most
    float min_semantic_score = 0.0f;  // results scoring below this are dropped
    bool enable_jaccard_filter = true;
    float max_jaccard_score = 0.8f;   // max lexical overlap with any kept result
};

struct MemoryStats {
    size_t total_memories;
    size_t vocabulary_size;
};

// In-memory store of (id, text, vector) triples sharing one Embedder.
// Items keep their insertion order, which breaks score ties in search.
class MemoryManager {
public:
    // max_memories == 0 means unbounded. Adding a new id to a full store
    // first evicts the oldest-inserted fifth of it (at least one item).
    explicit MemoryManager(size_t max_memories = 0);

    // Insert or overwrite an entry by id. A replaced item keeps its position.
    void add_memory(const std::string& id,
                    const std::string& text,
                    const nlohmann::json& metadata = nlohmann::json::object());

    bool remove_memory(const std::string& id);

    // Retrain the vocabulary over all stored texts and re-embed every item.
    void train();

    // Brute-force cosine ranking of all items against `query`.
    std::vector<ScoredResult> search(const std::string& query,
                                     const SearchOptions& options = {}) const;

    // Like search() but queries with the stored vector of `id`, excluding it.
    // Throws NotFound if `id` is not stored.
    std::vector<ScoredResult> find_similar(const std::string& id,
                                           const SearchOptions& options = {}) const;

    const MemoryItem* get_memory(const std::string& id) const;
    bool contains(const std::string& id) const { return index_.count(id) > 0; }
    const std::vector<MemoryItem>& all_memories() const { return items_; }
    void clear();

    // Snapshot/restore. import_memories() replaces everything and retrains.
    std::vector<MemoryItem> export_memories() const { return items_; }
    void import_memories(std::vector<MemoryItem> items);

    MemoryStats stats() const;
    size_t max_memories() const { return max_memories_; }

private:
    Embedder embedder_;
    std::vector<MemoryItem> items_;

    // id -> position in items_
    std::unordered_map<std::string, size_t> index_;

    size_t max_memories_;

    std::vector<ScoredResult> rank(const Vector& query,
                                   const SearchOptions& options,
                                   const std::string* exclude_id) const;
    void evict_oldest();
    void reindex();
};

} // namespace ctxengine
