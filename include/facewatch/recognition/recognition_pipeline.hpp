// ============= include/facewatch/recognition/recognition_pipeline.hpp =============
/*
 * Recognition Pipeline - per-face entry point
 *
 * FLOW (one call per tracked face per frame):
 *   embedding -> TemporalAggregator -> IdentityMatcher
 *     matched:  AdaptiveUpdater with this frame's embedding (+ audit log entry)
 *     U <= conf < M: UnknownReviewQueue entry + unknown listener
 *     conf < U: dropped
 *
 * Detection logging, image storage and identity write-through run on the
 * writer pool; process_face() never waits for the store.
 * flush() blocks until every pending write is done.
 *
 * Owns its index, catalog and queues; the store is borrowed.
 */

#pragma once
#include "facewatch/core/pipeline_config.hpp"
#include "facewatch/database/face_store.hpp"
#include "facewatch/database/similarity_index.hpp"
#include "facewatch/database/thread_pool.hpp"
#include "facewatch/recognition/adaptive_updater.hpp"
#include "facewatch/recognition/identity_catalog.hpp"
#include "facewatch/recognition/identity_matcher.hpp"
#include "facewatch/recognition/temporal_aggregator.hpp"
#include "facewatch/review/unknown_review_queue.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace facewatch {

struct FaceResult {
    TrackingKey key = -1;
    MatchDecision decision = MatchDecision::Discard;
    std::string name;           // empty unless matched
    float confidence = 0.0f;
    bool near_match = false;
    bool adapted = false;       // embedding updated by this match
};

// Called from a writer thread with the stored queue entry (id assigned)
using UnknownCallback = std::function<void(const Detection&)>;

class RecognitionPipeline {
public:
    RecognitionPipeline(FaceStore& store, const PipelineConfig& config = PipelineConfig());
    ~RecognitionPipeline();

    RecognitionPipeline(const RecognitionPipeline&) = delete;
    RecognitionPipeline& operator=(const RecognitionPipeline&) = delete;

    // Rebuild catalog + index from the store. Returns identity count.
    size_t reload();

    FaceResult process_face(TrackingKey key,
                            const EmbeddingVector& embedding,
                            const ImageBytes& face_image = {});

    // Close the frame cycle (idle track eviction)
    void end_cycle();
    void forget_track(TrackingKey key);

    void flush();

    void set_unknown_listener(UnknownCallback callback);

    IdentityCatalog& catalog() { return identity_catalog; }
    SimilarityIndex& index() { return similarity_index; }
    UnknownReviewQueue& review_queue() { return queue; }
    TemporalAggregator& aggregator() { return temporal_aggregator; }
    AdaptiveUpdater& updater() { return adaptive_updater; }
    const IdentityMatcher& matcher() const { return identity_matcher; }
    const PipelineConfig& get_config() const { return config; }

    void print_stats() const;

private:
    PipelineConfig config;
    FaceStore& store;

    ThreadPool writer_pool;
    SimilarityIndex similarity_index;
    IdentityCatalog identity_catalog;
    TemporalAggregator temporal_aggregator;
    IdentityMatcher identity_matcher;
    AdaptiveUpdater adaptive_updater;
    UnknownReviewQueue queue;

    UnknownCallback unknown_listener;
    std::mutex listener_mutex;

    std::atomic<size_t> faces_processed{0};
    std::atomic<size_t> faces_matched{0};
    std::atomic<size_t> faces_queued{0};
    std::atomic<size_t> faces_dropped{0};

    void log_match(TrackingKey key, const EmbeddingVector& embedding, const MatchResult& match);
    void queue_unknown(TrackingKey key, const EmbeddingVector& embedding,
                       const MatchResult& match, const ImageBytes& face_image);
    void notify_unknown(const Detection& detection);
};

} // namespace facewatch
