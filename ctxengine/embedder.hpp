#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace ctxengine {

using Vector = std::vector<float>;

// Lowercase, split on non-alphanumeric, drop tokens shorter than 2 chars.
std::vector<std::string> tokenize(const std::string& text);

// TF-IDF bag-of-words embedder.
// train() builds the vocabulary from a corpus; embed() maps text onto it
// and L2-normalizes. Vectors are as long as the vocabulary.
class Embedder {
public:
    // Replaces the vocabulary with one built from `documents`.
    void train(const std::vector<std::string>& documents);

    // Zero vector when `text` has no trained terms (or nothing is trained).
    Vector embed(const std::string& text) const;

    size_t vocabulary_size() const { return idf_.size(); }
    bool is_trained() const { return !idf_.empty(); }

private:
    // term -> index into idf_ (first-seen order over the corpus)
    std::unordered_map<std::string, size_t> vocabulary_;
    std::vector<float> idf_;
};

} // namespace ctxengine
