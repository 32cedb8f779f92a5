// ============= include/facewatch/database/similarity_index.hpp =============
/*
 * Similarity Index - catalog vectors + names, nearest match queries
 *
 * BACKENDS (chosen at every rebuild):
 * - n <  approximate_threshold: exact linear scan
 * - n >= approximate_threshold: HNSW graph (VectorIndex)
 *
 * SCORES:
 * - InnerProduct: cosine similarity clamped to [0, 1]
 * - L2:           max(0, 1 - d^2 / 2) over unit vectors, distance 0 -> 1.0
 * Both scores agree on unit vectors, so callers apply one threshold
 * regardless of metric or backend.
 *
 * MUTATIONS:
 * - insert/update/remove edit the logical entry set, then rebuild all of it
 * - a rebuild creates a new immutable snapshot off-lock and swaps it in
 * - readers copy the snapshot pointer under a shared lock and never see
 *   a half-built index
 *
 * FAILURES:
 * - build_index throws BuildError (empty input, mixed dimensions,
 *   duplicate names) and keeps the previous snapshot
 * - query() before any successful build returns {}
 */

#pragma once
#include "facewatch/core/types.hpp"
#include "facewatch/database/vector_index.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace facewatch {

struct IndexEntry {
    std::string name;
    EmbeddingVector vector;
};

struct SearchResult {
    std::string name;
    float similarity;
};

enum class IndexBackend {
    None,
    Exact,
    Approximate
};

const char* to_string(IndexBackend backend);

class SimilarityIndex {
public:
    struct Config {
        size_t approximate_threshold;
        Metric metric;
        VectorIndex::Params hnsw;

        Config()
            : approximate_threshold(50),
              metric(Metric::InnerProduct) {}
    };

    explicit SimilarityIndex(const Config& config = Config());

    // Replaces the whole content. Throws BuildError.
    void build_index(const std::vector<IndexEntry>& entries, Metric metric);
    void build_index(const std::vector<IndexEntry>& entries);

    // At most min(k, n) results, descending similarity.
    // Equal scores keep catalog (insertion) order.
    std::vector<SearchResult> query(const EmbeddingVector& vector, int k = 1) const;

    // false when the name already exists / does not exist
    bool insert(const std::string& name, const EmbeddingVector& vector);
    bool update(const std::string& name, const EmbeddingVector& vector);
    bool remove(const std::string& name);

    void clear();

    bool contains(const std::string& name) const;
    size_t size() const;
    size_t dimension() const;
    bool is_trained() const;
    IndexBackend backend() const;
    Metric metric() const;
    std::vector<IndexEntry> entries() const;
    size_t memory_usage() const;

    void print_stats() const;

private:
    struct Snapshot {
        std::vector<IndexEntry> entries;         // as given, catalog order
        std::vector<EmbeddingVector> normalized; // parallel to entries
        Metric metric;
        IndexBackend backend;
        size_t dim;
        std::unique_ptr<VectorIndex> hnsw;       // only for Approximate
    };

    Config config;

    std::shared_ptr<const Snapshot> current;
    mutable std::shared_mutex snapshot_mutex;   // guards `current`
    std::mutex writer_mutex;                    // one rebuild at a time

    std::shared_ptr<const Snapshot> snapshot() const;
    std::shared_ptr<const Snapshot> make_snapshot(const std::vector<IndexEntry>& entries,
                                                  Metric metric) const;
    void publish(std::shared_ptr<const Snapshot> next);
    void rebuild_locked(const std::vector<IndexEntry>& entries, Metric metric);

    float to_similarity(const Snapshot& snap, const EmbeddingVector& query,
                        const EmbeddingVector& stored) const;
};

} // namespace facewatch
