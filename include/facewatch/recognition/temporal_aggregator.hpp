// ============= include/facewatch/recognition/temporal_aggregator.hpp =============
/*
 * Temporal Aggregator - multi-frame smoothing per tracked face
 *
 * - Bounded FIFO of the last `window` embeddings per tracking key
 * - observe() returns the re-normalized mean of the buffer
 * - One mutex per key; the key map itself is behind a shared_mutex
 *
 * EVICTION:
 * - advance_cycle() closes a frame cycle; keys not observed for
 *   max_idle_cycles cycles are dropped
 * - evict(key) drops a key at once (track retired by the tracker)
 */

#pragma once
#include "facewatch/core/types.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace facewatch {

class TemporalAggregator {
public:
    struct Config {
        size_t window;
        uint64_t max_idle_cycles;

        Config() : window(3), max_idle_cycles(30) {}
    };

    explicit TemporalAggregator(const Config& config = Config());

    // Throws std::invalid_argument on a dimension change within a key
    EmbeddingVector observe(TrackingKey key, const EmbeddingVector& vector);

    // Returns the number of keys dropped
    size_t advance_cycle();
    bool evict(TrackingKey key);
    void clear();

    size_t tracked_keys() const;
    size_t buffered(TrackingKey key) const;
    uint64_t cycle() const;

    const Config& get_config() const { return config; }

private:
    struct Track {
        std::mutex mutex;
        std::deque<EmbeddingVector> buffer;
        uint64_t last_seen = 0;
    };

    Config config;

    std::unordered_map<TrackingKey, std::shared_ptr<Track>> tracks;
    mutable std::shared_mutex tracks_mutex;
    uint64_t current_cycle = 0;   // guarded by tracks_mutex

    std::shared_ptr<Track> find_or_create(TrackingKey key);
};

} // namespace facewatch
