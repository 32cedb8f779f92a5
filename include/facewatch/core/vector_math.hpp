// ============= include/facewatch/core/vector_math.hpp =============
/*
 * Embedding math
 *
 * COSINE SIMILARITY:
 * - Both inputs are L2-normalized first
 * - Result clamped to [0, 1] (negative = "not similar")
 *
 * ZERO VECTORS:
 * - normalize() passes them through unchanged
 * - similarity against a zero vector is 0
 *
 * Binary operations throw std::invalid_argument on dimension mismatch.
 */

#pragma once
#include "facewatch/core/types.hpp"
#include <vector>

namespace facewatch {

EmbeddingVector normalize(const EmbeddingVector& v);
void l2_normalize_inplace(EmbeddingVector& v);
float l2_norm(const EmbeddingVector& v);

float dot(const EmbeddingVector& a, const EmbeddingVector& b);
float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b);
float euclidean_distance(const EmbeddingVector& a, const EmbeddingVector& b);
float squared_l2(const EmbeddingVector& a, const EmbeddingVector& b);

// One query against many candidates; element i equals cosine_similarity(query, candidates[i])
std::vector<float> batch_compare(const EmbeddingVector& query,
                                 const std::vector<EmbeddingVector>& candidates);

// Arithmetic mean (not normalized). Throws on empty input or mixed dimensions.
EmbeddingVector mean(const std::vector<EmbeddingVector>& vectors);

} // namespace facewatch
