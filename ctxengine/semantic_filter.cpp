#include "semantic_filter.hpp"

namespace ctxengine {

std::vector<ScoredResult> semantic_filter(const std::vector<FilterDocument>& documents,
                                          const std::string& query,
                                          const SearchOptions& options) {
    if (documents.empty()) {
        return {};
    }

    MemoryManager manager;
    for (const auto& doc : documents) {
        manager.add_memory(doc.id, doc.text, doc.metadata);
    }
    manager.train();
    return manager.search(query, options);
}

SearchOptions semantic_filter_options() {
    SearchOptions options;
    options.min_semantic_score = 0.1f;
    return options;
}

SearchOptions pinned_note_options() {
    SearchOptions options;
    options.top_k = 3;
    options.min_semantic_score = 0.1f;
    options.enable_jaccard_filter = true;
    options.max_jaccard_score = 0.9f;
    return options;
}

std::vector<std::string> select_pinned_notes(const std::vector<std::string>& notes,
                                             const std::string& query,
                                             const SearchOptions& options,
                                             size_t budget) {
    std::vector<FilterDocument> documents;
    documents.reserve(notes.size());
    for (size_t i = 0; i < notes.size(); ++i) {
        documents.push_back({"note-" + std::to_string(i), notes[i]});
    }

    std::vector<std::string> selected;
    size_t used = 0;
    for (auto& result : semantic_filter(documents, query, options)) {
        if (result.text.size() > budget - used) break;
        used += result.text.size();
        selected.push_back(std::move(result.text));
    }
    return selected;
}

} // namespace ctxengine
