#include "similarity.hpp"

#include <cmath>
#include <unordered_set>

#include "errors.hpp"

namespace ctxengine {

float cosine_similarity(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }

    double dot = 0.0;
    double mag_a = 0.0;
    double mag_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        mag_a += static_cast<double>(a[i]) * a[i];
        mag_b += static_cast<double>(b[i]) * b[i];
    }

    double magnitude = std::sqrt(mag_a) * std::sqrt(mag_b);
    if (magnitude <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / magnitude);
}

float jaccard_similarity(const std::string& a, const std::string& b) {
    auto tokens_a = tokenize(a);
    auto tokens_b = tokenize(b);
    std::unordered_set<std::string> set_a(tokens_a.begin(), tokens_a.end());
    std::unordered_set<std::string> set_b(tokens_b.begin(), tokens_b.end());

    if (set_a.empty() && set_b.empty()) return 1.0f;
    if (set_a.empty() || set_b.empty()) return 0.0f;

    size_t intersection = 0;
    for (const auto& token : set_a) {
        if (set_b.count(token)) ++intersection;
    }
    size_t union_size = set_a.size() + set_b.size() - intersection;
    return static_cast<float>(intersection) / static_cast<float>(union_size);
}

} // namespace ctxengine
