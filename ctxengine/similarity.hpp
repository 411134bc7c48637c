#pragma once

#include <string>

#include "embedder.hpp"

namespace ctxengine {

// Dot product over the product of magnitudes, in [-1, 1].
// Throws DimensionMismatch when lengths differ; 0 when either vector is zero.
float cosine_similarity(const Vector& a, const Vector& b);

// Intersection over union of the token sets of both texts (see tokenize()).
// 1.0 when both token sets are empty, 0.0 when only one is.
float jaccard_similarity(const std::string& a, const std::string& b);

} // namespace ctxengine
