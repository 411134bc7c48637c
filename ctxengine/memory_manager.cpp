#include "memory_manager.hpp"

#include <algorithm>

#include "errors.hpp"
#include "similarity.hpp"

namespace ctxengine {

MemoryManager::MemoryManager(size_t max_memories)
    : max_memories_(max_memories) {}

void MemoryManager::add_memory(const std::string& id,
                               const std::string& text,
                               const nlohmann::json& metadata) {
    MemoryItem item{id, text, embedder_.embed(text),
                    metadata.is_null() ? nlohmann::json::object() : metadata,
                    std::chrono::system_clock::now()};

    // If overwriting, replace in place
    auto it = index_.find(id);
    if (it != index_.end()) {
        items_[it->second] = std::move(item);
        return;
    }

    if (max_memories_ > 0 && items_.size() >= max_memories_) {
        evict_oldest();
    }
    index_[id] = items_.size();
    items_.push_back(std::move(item));
}

bool MemoryManager::remove_memory(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

void MemoryManager::train() {
    std::vector<std::string> documents;
    documents.reserve(items_.size());
    for (const auto& item : items_) {
        documents.push_back(item.text);
    }

    embedder_.train(documents);
    for (auto& item : items_) {
        item.vector = embedder_.embed(item.text);
    }
}

std::vector<ScoredResult> MemoryManager::search(const std::string& query,
                                                const SearchOptions& options) const {
    return rank(embedder_.embed(query), options, nullptr);
}

std::vector<ScoredResult> MemoryManager::find_similar(const std::string& id,
                                                      const SearchOptions& options) const {
    const MemoryItem* item = get_memory(id);
    if (!item) {
        throw NotFound(id);
    }
    return rank(item->vector, options, &item->id);
}

const MemoryItem* MemoryManager::get_memory(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &items_[it->second];
}

void MemoryManager::clear() {
    items_.clear();
    index_.clear();
}

void MemoryManager::import_memories(std::vector<MemoryItem> items) {
    clear();
    for (auto& item : items) {
        auto it = index_.find(item.id);
        if (it != index_.end()) {
            items_[it->second] = std::move(item);
            continue;
        }
        index_[item.id] = items_.size();
        items_.push_back(std::move(item));
    }

    if (max_memories_ > 0 && items_.size() > max_memories_) {
        items_.erase(items_.begin(),
                     items_.end() - static_cast<std::ptrdiff_t>(max_memories_));
        reindex();
    }

    // Stored vectors came from another vocabulary; rebuild from the texts.
    train();
}

MemoryStats MemoryManager::stats() const {
    return {items_.size(), embedder_.vocabulary_size()};
}

std::vector<ScoredResult> MemoryManager::rank(const Vector& query,
                                              const SearchOptions& options,
                                              const std::string* exclude_id) const {
    std::vector<std::pair<float, const MemoryItem*>> scored;
    scored.reserve(items_.size());
    for (const auto& item : items_) {
        if (exclude_id && item.id == *exclude_id) continue;

        float score = cosine_similarity(query, item.vector);
        if (score >= options.min_semantic_score) {
            scored.emplace_back(score, &item);
        }
    }

    // Sort descending by score; stable so ties stay in insertion order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<ScoredResult> results;
    for (const auto& entry : scored) {
        if (results.size() >= options.top_k) break;
        const MemoryItem& item = *entry.second;

        // Greedy near-duplicate filter: higher-ranked texts always win.
        if (options.enable_jaccard_filter) {
            bool duplicate = std::any_of(results.begin(), results.end(),
                [&](const ScoredResult& kept) {
                    return jaccard_similarity(kept.text, item.text) > options.max_jaccard_score;
                });
            if (duplicate) continue;
        }

        results.push_back({item.id, item.text, entry.first, item.metadata});
    }

    return results;
}

void MemoryManager::evict_oldest() {
    if (items_.empty()) return;
    // Drop the oldest fifth at once so reindexing amortizes over many adds.
    size_t count = std::min(items_.size(), std::max<size_t>(1, (items_.size() + 4) / 5));
    items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(count));
    reindex();
}

void MemoryManager::reindex() {
    index_.clear();
    for (size_t i = 0; i < items_.size(); ++i) {
        index_[items_[i].id] = i;
    }
}

} // namespace ctxengine
