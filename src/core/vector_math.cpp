#include "facewatch/core/vector_math.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace facewatch {

namespace {

void check_dimensions(const EmbeddingVector& a, const EmbeddingVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Dimension mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
}

// query must already be normalized
float similarity_to_normalized(const EmbeddingVector& normalized_query,
                               const EmbeddingVector& candidate) {
    check_dimensions(normalized_query, candidate);
    EmbeddingVector c = normalize(candidate);
    float d = 0.0f;
    for (size_t i = 0; i < c.size(); ++i) {
        d += normalized_query[i] * c[i];
    }
    return std::max(0.0f, std::min(1.0f, d));
}

} // namespace

float l2_norm(const EmbeddingVector& v) {
    float sum = 0.0f;
    for (float x : v) {
        sum += x * x;
    }
    return std::sqrt(sum);
}

void l2_normalize_inplace(EmbeddingVector& v) {
    float norm = l2_norm(v);
    if (norm == 0.0f) return;
    for (float& x : v) {
        x /= norm;
    }
}

EmbeddingVector normalize(const EmbeddingVector& v) {
    EmbeddingVector out = v;
    l2_normalize_inplace(out);
    return out;
}

float dot(const EmbeddingVector& a, const EmbeddingVector& b) {
    check_dimensions(a, b);
    float d = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        d += a[i] * b[i];
    }
    return d;
}

float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
    check_dimensions(a, b);
    return similarity_to_normalized(normalize(a), b);
}

float squared_l2(const EmbeddingVector& a, const EmbeddingVector& b) {
    check_dimensions(a, b);
    float sum = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return sum;
}

float euclidean_distance(const EmbeddingVector& a, const EmbeddingVector& b) {
    return std::sqrt(squared_l2(a, b));
}

std::vector<float> batch_compare(const EmbeddingVector& query,
                                 const std::vector<EmbeddingVector>& candidates) {
    std::vector<float> scores;
    scores.reserve(candidates.size());

    EmbeddingVector q = normalize(query);
    for (const auto& candidate : candidates) {
        scores.push_back(similarity_to_normalized(q, candidate));
    }
    return scores;
}

EmbeddingVector mean(const std::vector<EmbeddingVector>& vectors) {
    if (vectors.empty()) {
        throw std::invalid_argument("Cannot average an empty set of vectors");
    }

    const size_t dim = vectors.front().size();
    std::vector<double> acc(dim, 0.0);
    for (const auto& v : vectors) {
        check_dimensions(vectors.front(), v);
        for (size_t i = 0; i < dim; ++i) {
            acc[i] += v[i];
        }
    }

    EmbeddingVector out(dim);
    for (size_t i = 0; i < dim; ++i) {
        out[i] = static_cast<float>(acc[i] / vectors.size());
    }
    return out;
}

} // namespace facewatch
