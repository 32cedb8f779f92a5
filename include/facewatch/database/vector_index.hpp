// ============= include/facewatch/database/vector_index.hpp =============
/*
 * HNSW Vector Index - approximate nearest neighbour backend
 *
 * ALGORITHM: Hierarchical Navigable Small World
 * - Search: O(log n)
 * - Memory: O(n * d * M) where M = max connections
 *
 * METRICS:
 * - InnerProduct: distance = 1 - dot(a, b) (vectors are unit length)
 * - L2:           distance = squared euclidean
 *
 * NOT THREAD-SAFE. SimilarityIndex builds one instance per snapshot
 * and never mutates it after publishing, so readers need no lock.
 *
 * Layer assignment uses a seeded generator: same input order + same seed
 * produces the same graph.
 */

#pragma once
#include "facewatch/core/types.hpp"
#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace facewatch {

enum class Metric {
    InnerProduct,
    L2
};

const char* to_string(Metric metric);
Metric metric_from_string(const std::string& name);   // "ip" | "l2"

struct HnswResult {
    int node;          // insertion position
    float distance;    // lower = better
};

class VectorIndex {
public:
    struct Params {
        int M;                  // max connections per layer
        int ef_construction;    // candidate list size while inserting
        int ef_search;          // candidate list size while searching
        unsigned seed;

        Params() : M(16), ef_construction(200), ef_search(64), seed(42) {}
    };

    VectorIndex(int dim, Metric metric, const Params& params = Params());

    // Node ids are assigned in insertion order starting at 0
    int insert(const EmbeddingVector& vector);

    // Results sorted by ascending distance, at most k
    std::vector<HnswResult> search(const EmbeddingVector& query, int k) const;

    float distance(const EmbeddingVector& a, const EmbeddingVector& b) const;

    size_t size() const { return nodes.size(); }
    int dimension() const { return dim; }
    int top_layer() const { return max_layer; }
    size_t memory_usage() const;

private:
    static constexpr int kMaxLayers = 16;

    struct Node {
        EmbeddingVector vector;
        int layer;
        std::vector<std::vector<int>> neighbors;   // one list per layer [0, layer]
    };

    int dim;
    Metric metric;
    Params params;
    int M0;                    // max connections at layer 0
    int max_layer;
    int entry_point;
    double level_mult;

    std::vector<Node> nodes;
    std::mt19937 gen;

    int random_layer();

    std::vector<int> search_layer(const EmbeddingVector& query,
                                  int entry_id,
                                  int layer,
                                  int ef) const;

    std::vector<int> select_neighbors(const EmbeddingVector& base,
                                      const std::vector<int>& candidates,
                                      int max_count) const;
};

} // namespace facewatch
