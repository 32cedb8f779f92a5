#pragma once
#include "facewatch/core/errors.hpp"
#include "facewatch/core/types.hpp"
#include "facewatch/core/vector_math.hpp"
#include "facewatch/database/sqlite_face_store.hpp"
#include <atomic>
#include <cmath>
#include <random>

namespace facewatch {
namespace testing {

// Deterministic random unit vector
inline EmbeddingVector random_unit(size_t dim, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> gauss(0.0f, 1.0f);
    EmbeddingVector v(dim);
    for (auto& x : v) x = gauss(gen);
    return normalize(v);
}

inline EmbeddingVector axis(size_t dim, size_t i, float value = 1.0f) {
    EmbeddingVector v(dim, 0.0f);
    v[i] = value;
    return v;
}

// Unit vector with cosine `cos_to_axis0` to axis 0, rest on axis `other`
inline EmbeddingVector at_cosine(size_t dim, float cos_to_axis0, size_t other = 1) {
    EmbeddingVector v(dim, 0.0f);
    v[0] = cos_to_axis0;
    v[other] = std::sqrt(1.0f - cos_to_axis0 * cos_to_axis0);
    return v;
}

// In-memory SQLite store whose identity writes can be made to fail
class FlakyFaceStore : public SqliteFaceStore {
public:
    FlakyFaceStore() : SqliteFaceStore(":memory:") {}

    void save_identity(const Identity& identity) override {
        saves++;
        if (fail_saves) {
            throw TransientIOError("disk full");
        }
        SqliteFaceStore::save_identity(identity);
    }

    std::atomic<bool> fail_saves{false};
    std::atomic<int> saves{0};
};

} // namespace testing
} // namespace facewatch
