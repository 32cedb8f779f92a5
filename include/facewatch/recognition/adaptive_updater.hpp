// ============= include/facewatch/recognition/adaptive_updater.hpp =============
/*
 * Adaptive Updater - EMA drift of enrolled embeddings
 *
 * Every update_frequency-th match of an identity:
 *   new = normalize(old * (1 - alpha) + observed * alpha)
 *
 * - catalog + similarity index are updated synchronously
 * - the store write runs on the writer pool (high priority);
 *   TransientIOError is logged, the in-memory update stays
 * - each write saves the catalog's state at the time it runs, one write
 *   at a time, so the store never ends up behind a later update
 */

#pragma once
#include "facewatch/core/types.hpp"
#include "facewatch/database/thread_pool.hpp"
#include "facewatch/recognition/identity_catalog.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace facewatch {

class AdaptiveUpdater {
public:
    struct Config {
        bool enabled;
        float alpha;
        int update_frequency;

        Config() : enabled(true), alpha(0.1f), update_frequency(10) {}
    };

    // writer == nullptr: store writes happen in the caller's thread
    AdaptiveUpdater(IdentityCatalog& catalog, ThreadPool* writer, const Config& config = Config());

    // Counts the match; returns true if the embedding was updated
    bool on_match(const std::string& name, const EmbeddingVector& observed);

    int64_t recognition_count(const std::string& name) const;
    size_t updates_applied() const { return updates; }
    size_t write_failures() const { return failures; }

    const Config& get_config() const { return config; }

    static EmbeddingVector blend(const EmbeddingVector& old_vec,
                                 const EmbeddingVector& observed,
                                 float alpha);

private:
    IdentityCatalog& catalog;
    ThreadPool* writer;
    Config config;

    std::atomic<size_t> updates{0};
    std::atomic<size_t> failures{0};
    std::mutex write_mutex;

    void write_through(const std::string& name);
};

} // namespace facewatch
