#pragma once

#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "memory_manager.hpp"

namespace ctxengine {

struct FilterDocument {
    std::string id;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
};

// top_k 10, min_semantic_score 0.1, max_jaccard_score 0.8
SearchOptions semantic_filter_options();

// top_k 3, min_semantic_score 0.1, max_jaccard_score 0.9
SearchOptions pinned_note_options();

// One-shot ranking: indexes `documents` in a throwaway MemoryManager,
// trains it and searches for `query`.
std::vector<ScoredResult> semantic_filter(const std::vector<FilterDocument>& documents,
                                          const std::string& query,
                                          const SearchOptions& options = semantic_filter_options());

// Most relevant pinned notes for `query`, best first, keeping notes while
// their combined length fits in `budget` characters.
std::vector<std::string> select_pinned_notes(const std::vector<std::string>& notes,
                                             const std::string& query,
                                             const SearchOptions& options = pinned_note_options(),
                                             size_t budget = std::numeric_limits<size_t>::max());

} // namespace ctxengine
