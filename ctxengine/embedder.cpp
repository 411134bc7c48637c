#include "embedder.hpp"

#include <cctype>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace ctxengine {

namespace {

constexpr size_t MIN_TOKEN_LENGTH = 2;

void flush_token(std::string& token, std::vector<std::string>& out) {
    if (token.size() >= MIN_TOKEN_LENGTH) {
        out.push_back(token);
    }
    token.clear();
}

} // namespace

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;

    std::string token;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!token.empty()) {
            flush_token(token, tokens);
        }
    }
    if (!token.empty()) {
        flush_token(token, tokens);
    }

    return tokens;
}

void Embedder::train(const std::vector<std::string>& documents) {
    vocabulary_.clear();
    idf_.clear();

    // Document frequency per term, indexed like the vocabulary.
    std::vector<size_t> doc_freq;
    for (const auto& doc : documents) {
        std::unordered_set<std::string> seen;
        for (auto& token : tokenize(doc)) {
            if (!seen.insert(token).second) continue;

            auto it = vocabulary_.find(token);
            if (it == vocabulary_.end()) {
                vocabulary_.emplace(std::move(token), doc_freq.size());
                doc_freq.push_back(1);
            } else {
                ++doc_freq[it->second];
            }
        }
    }

    // Smoothed IDF: ln(1 + N/df) stays positive even for terms in every document.
    const double n = static_cast<double>(documents.size());
    idf_.reserve(doc_freq.size());
    for (size_t df : doc_freq) {
        idf_.push_back(static_cast<float>(std::log(1.0 + n / static_cast<double>(df))));
    }
}

Vector Embedder::embed(const std::string& text) const {
    Vector vec(idf_.size(), 0.0f);
    if (idf_.empty()) {
        return vec;
    }

    // Term frequency, accumulated straight into the vocabulary slot.
    std::vector<double> weights(idf_.size(), 0.0);
    for (const auto& token : tokenize(text)) {
        auto it = vocabulary_.find(token);
        if (it != vocabulary_.end()) {
            weights[it->second] += 1.0;
        }
    }

    double norm = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        weights[i] *= idf_[i];
        norm += weights[i] * weights[i];
    }

    // L2-normalize
    if (norm > 0.0) {
        norm = std::sqrt(norm);
        for (size_t i = 0; i < weights.size(); ++i) {
            vec[i] = static_cast<float>(weights[i] / norm);
        }
    }

    return vec;
}

} // namespace ctxengine
