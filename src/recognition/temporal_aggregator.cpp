#include "facewatch/recognition/temporal_aggregator.hpp"
#include "facewatch/core/vector_math.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace facewatch {

TemporalAggregator::TemporalAggregator(const Config& config)
    : config(config)
{
    if (config.window == 0) {
        throw std::invalid_argument("TemporalAggregator: window must be at least 1");
    }
}

std::shared_ptr<TemporalAggregator::Track> TemporalAggregator::find_or_create(TrackingKey key) {
    {
        std::shared_lock<std::shared_mutex> lock(tracks_mutex);
        auto it = tracks.find(key);
        if (it != tracks.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(tracks_mutex);
    auto& slot = tracks[key];
    if (!slot) {
        slot = std::make_shared<Track>();
        slot->last_seen = current_cycle;
        spdlog::debug("Aggregator: new track {}", key);
    }
    return slot;
}

EmbeddingVector TemporalAggregator::observe(TrackingKey key, const EmbeddingVector& vector) {
    if (vector.empty()) {
        throw std::invalid_argument("TemporalAggregator: empty embedding");
    }

    auto track = find_or_create(key);

    uint64_t now;
    {
        std::shared_lock<std::shared_mutex> lock(tracks_mutex);
        now = current_cycle;
    }

    std::vector<EmbeddingVector> window;
    {
        std::lock_guard<std::mutex> lock(track->mutex);

        if (!track->buffer.empty() && track->buffer.front().size() != vector.size()) {
            throw std::invalid_argument("TemporalAggregator: track " + std::to_string(key) +
                                        " holds " + std::to_string(track->buffer.front().size()) +
                                        "D vectors, got " + std::to_string(vector.size()));
        }

        track->buffer.push_back(vector);
        while (track->buffer.size() > config.window) {
            track->buffer.pop_front();
        }
        track->last_seen = now;

        window.assign(track->buffer.begin(), track->buffer.end());
    }

    return normalize(mean(window));
}

size_t TemporalAggregator::advance_cycle() {
    std::unique_lock<std::shared_mutex> lock(tracks_mutex);
    ++current_cycle;

    size_t dropped = 0;
    for (auto it = tracks.begin(); it != tracks.end();) {
        uint64_t last_seen;
        {
            std::lock_guard<std::mutex> track_lock(it->second->mutex);
            last_seen = it->second->last_seen;
        }

        if (current_cycle - last_seen > config.max_idle_cycles) {
            it = tracks.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        spdlog::debug("Aggregator: dropped {} idle tracks (cycle {})", dropped, current_cycle);
    }
    return dropped;
}

bool TemporalAggregator::evict(TrackingKey key) {
    std::unique_lock<std::shared_mutex> lock(tracks_mutex);
    return tracks.erase(key) > 0;
}

void TemporalAggregator::clear() {
    std::unique_lock<std::shared_mutex> lock(tracks_mutex);
    tracks.clear();
}

size_t TemporalAggregator::tracked_keys() const {
    std::shared_lock<std::shared_mutex> lock(tracks_mutex);
    return tracks.size();
}

size_t TemporalAggregator::buffered(TrackingKey key) const {
    std::shared_ptr<Track> track;
    {
        std::shared_lock<std::shared_mutex> lock(tracks_mutex);
        auto it = tracks.find(key);
        if (it == tracks.end()) return 0;
        track = it->second;
    }
    std::lock_guard<std::mutex> lock(track->mutex);
    return track->buffer.size();
}

uint64_t TemporalAggregator::cycle() const {
    std::shared_lock<std::shared_mutex> lock(tracks_mutex);
    return current_cycle;
}

} // namespace facewatch
