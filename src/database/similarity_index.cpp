#include "facewatch/database/similarity_index.hpp"
#include "facewatch/core/errors.hpp"
#include "facewatch/core/vector_math.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace facewatch {

const char* to_string(IndexBackend backend) {
    switch (backend) {
        case IndexBackend::None:        return "none";
        case IndexBackend::Exact:       return "exact";
        case IndexBackend::Approximate: return "hnsw";
    }
    return "unknown";
}

SimilarityIndex::SimilarityIndex(const Config& config)
    : config(config)
{
    spdlog::debug("SimilarityIndex: approximate backend from {} entries, metric {}",
                  config.approximate_threshold, to_string(config.metric));
}

// ==================== SNAPSHOTS ====================

std::shared_ptr<const SimilarityIndex::Snapshot> SimilarityIndex::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(snapshot_mutex);
    return current;
}

void SimilarityIndex::publish(std::shared_ptr<const Snapshot> next) {
    std::unique_lock<std::shared_mutex> lock(snapshot_mutex);
    current = std::move(next);
}

std::shared_ptr<const SimilarityIndex::Snapshot>
SimilarityIndex::make_snapshot(const std::vector<IndexEntry>& entries, Metric metric) const {
    if (entries.empty()) {
        throw BuildError("Cannot build index from an empty entry set");
    }

    const size_t dim = entries.front().vector.size();
    if (dim == 0) {
        throw BuildError("Cannot build index from zero-length vectors");
    }

    std::unordered_set<std::string> names;
    for (const auto& entry : entries) {
        if (entry.vector.size() != dim) {
            throw BuildError("Inconsistent dimensions: '" + entry.name + "' has " +
                             std::to_string(entry.vector.size()) + ", expected " +
                             std::to_string(dim));
        }
        if (entry.name.empty()) {
            throw BuildError("Index entry without a name");
        }
        if (!names.insert(entry.name).second) {
            throw BuildError("Duplicate index entry: " + entry.name);
        }
    }

    auto snap = std::make_shared<Snapshot>();
    snap->entries = entries;
    snap->metric = metric;
    snap->dim = dim;
    snap->normalized.reserve(entries.size());
    for (const auto& entry : entries) {
        snap->normalized.push_back(normalize(entry.vector));
    }

    if (entries.size() < config.approximate_threshold) {
        snap->backend = IndexBackend::Exact;
    } else {
        snap->backend = IndexBackend::Approximate;
        snap->hnsw = std::make_unique<VectorIndex>(static_cast<int>(dim), metric, config.hnsw);
        for (const auto& vec : snap->normalized) {
            snap->hnsw->insert(vec);
        }
    }

    return snap;
}

// ==================== BUILD ====================

void SimilarityIndex::rebuild_locked(const std::vector<IndexEntry>& entries, Metric metric) {
    auto next = make_snapshot(entries, metric);

    spdlog::debug("Index rebuilt: {} entries, backend {}, metric {}",
                  next->entries.size(), to_string(next->backend), to_string(metric));

    publish(std::move(next));
}

void SimilarityIndex::build_index(const std::vector<IndexEntry>& entries, Metric metric) {
    std::lock_guard<std::mutex> lock(writer_mutex);
    rebuild_locked(entries, metric);
    spdlog::info("✓ Built similarity index with {} identities", entries.size());
}

void SimilarityIndex::build_index(const std::vector<IndexEntry>& entries) {
    build_index(entries, config.metric);
}

// ==================== QUERY ====================

float SimilarityIndex::to_similarity(const Snapshot& snap, const EmbeddingVector& query,
                                     const EmbeddingVector& stored) const {
    if (snap.metric == Metric::InnerProduct) {
        return cosine_similarity(query, stored);
    }
    // Unit vectors: d^2 = 2 - 2cos, so this matches the clamped cosine
    return std::max(0.0f, 1.0f - squared_l2(query, stored) / 2.0f);
}

std::vector<SearchResult> SimilarityIndex::query(const EmbeddingVector& vector, int k) const {
    auto snap = snapshot();
    if (!snap || k <= 0) {
        return {};
    }
    if (vector.size() != snap->dim) {
        throw std::invalid_argument("Query dimension " + std::to_string(vector.size()) +
                                    " does not match index dimension " +
                                    std::to_string(snap->dim));
    }

    const EmbeddingVector q = normalize(vector);
    const size_t n = snap->entries.size();
    const size_t limit = std::min(static_cast<size_t>(k), n);

    // (similarity, catalog position)
    std::vector<std::pair<float, size_t>> scored;

    if (snap->backend == IndexBackend::Exact) {
        scored.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            scored.push_back({to_similarity(*snap, q, snap->normalized[i]), i});
        }
    } else {
        auto hits = snap->hnsw->search(q, static_cast<int>(limit));
        scored.reserve(hits.size());
        for (const auto& hit : hits) {
            size_t pos = static_cast<size_t>(hit.node);
            scored.push_back({to_similarity(*snap, q, snap->normalized[pos]), pos});
        }
    }

    std::sort(scored.begin(), scored.end(),
              [](const std::pair<float, size_t>& a, const std::pair<float, size_t>& b) {
                  if (a.first != b.first) return a.first > b.first;
                  return a.second < b.second;
              });

    std::vector<SearchResult> results;
    results.reserve(std::min(limit, scored.size()));
    for (size_t i = 0; i < scored.size() && i < limit; ++i) {
        results.push_back({snap->entries[scored[i].second].name, scored[i].first});
    }
    return results;
}

// ==================== MUTATIONS ====================

bool SimilarityIndex::insert(const std::string& name, const EmbeddingVector& vector) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto snap = snapshot();
    std::vector<IndexEntry> entries;
    Metric metric = config.metric;
    if (snap) {
        entries = snap->entries;
        metric = snap->metric;
    }

    for (const auto& entry : entries) {
        if (entry.name == name) {
            spdlog::warn("Index entry {} already exists, use update()", name);
            return false;
        }
    }

    entries.push_back({name, vector});
    rebuild_locked(entries, metric);
    return true;
}

bool SimilarityIndex::update(const std::string& name, const EmbeddingVector& vector) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto snap = snapshot();
    if (!snap) {
        return false;
    }

    std::vector<IndexEntry> entries = snap->entries;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&name](const IndexEntry& e) { return e.name == name; });
    if (it == entries.end()) {
        spdlog::warn("Index entry not found: {}", name);
        return false;
    }

    it->vector = vector;
    rebuild_locked(entries, snap->metric);
    return true;
}

bool SimilarityIndex::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto snap = snapshot();
    if (!snap) {
        return false;
    }

    std::vector<IndexEntry> entries = snap->entries;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&name](const IndexEntry& e) { return e.name == name; });
    if (it == entries.end()) {
        spdlog::warn("Index entry not found: {}", name);
        return false;
    }
    entries.erase(it);

    if (entries.empty()) {
        publish(nullptr);
        spdlog::debug("Index emptied, back to untrained");
        return true;
    }

    rebuild_locked(entries, snap->metric);
    return true;
}

void SimilarityIndex::clear() {
    std::lock_guard<std::mutex> lock(writer_mutex);
    publish(nullptr);
}

// ==================== STATS ====================

bool SimilarityIndex::contains(const std::string& name) const {
    auto snap = snapshot();
    if (!snap) return false;
    for (const auto& entry : snap->entries) {
        if (entry.name == name) return true;
    }
    return false;
}

size_t SimilarityIndex::size() const {
    auto snap = snapshot();
    return snap ? snap->entries.size() : 0;
}

size_t SimilarityIndex::dimension() const {
    auto snap = snapshot();
    return snap ? snap->dim : 0;
}

bool SimilarityIndex::is_trained() const {
    return snapshot() != nullptr;
}

IndexBackend SimilarityIndex::backend() const {
    auto snap = snapshot();
    return snap ? snap->backend : IndexBackend::None;
}

Metric SimilarityIndex::metric() const {
    auto snap = snapshot();
    return snap ? snap->metric : config.metric;
}

std::vector<IndexEntry> SimilarityIndex::entries() const {
    auto snap = snapshot();
    return snap ? snap->entries : std::vector<IndexEntry>{};
}

size_t SimilarityIndex::memory_usage() const {
    auto snap = snapshot();
    if (!snap) return 0;

    size_t total = 0;
    for (const auto& entry : snap->entries) {
        total += entry.name.size() + 2 * entry.vector.size() * sizeof(float);
    }
    if (snap->hnsw) {
        total += snap->hnsw->memory_usage();
    }
    return total;
}

void SimilarityIndex::print_stats() const {
    spdlog::info("=== Similarity Index Stats ===");
    spdlog::info("  Entries: {}", size());
    spdlog::info("  Backend: {} ({})", to_string(backend()), to_string(metric()));
    spdlog::info("  Memory: {:.2f} MB", memory_usage() / 1024.0 / 1024.0);
}

} // namespace facewatch
