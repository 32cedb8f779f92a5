#include "facewatch/recognition/recognition_pipeline.hpp"
#include "facewatch/core/errors.hpp"
#include "facewatch/core/vector_math.hpp"
#include <spdlog/spdlog.h>

namespace facewatch {

RecognitionPipeline::RecognitionPipeline(FaceStore& store, const PipelineConfig& config)
    : config(config),
      store(store),
      writer_pool(config.writer_threads),
      similarity_index(config.index),
      identity_catalog(store, similarity_index),
      temporal_aggregator(config.aggregator),
      identity_matcher(similarity_index, config.matcher),
      adaptive_updater(identity_catalog, &writer_pool, config.adaptive),
      queue(store, identity_catalog, config.review)
{
    config.validate();
    spdlog::info("✓ Recognition pipeline ready (camera {})", config.camera_id);
}

RecognitionPipeline::~RecognitionPipeline() {
    // Drain pending writes while the components they touch still exist
    writer_pool.stop();
}

size_t RecognitionPipeline::reload() {
    return identity_catalog.reload();
}

// ==================== PER FACE ====================

FaceResult RecognitionPipeline::process_face(TrackingKey key,
                                             const EmbeddingVector& embedding,
                                             const ImageBytes& face_image) {
    faces_processed++;

    EmbeddingVector smoothed = temporal_aggregator.observe(key, embedding);
    MatchResult match = identity_matcher.classify(smoothed);

    FaceResult result;
    result.key = key;
    result.confidence = match.confidence;
    result.decision = identity_matcher.decide(match);

    switch (result.decision) {
        case MatchDecision::Matched:
            faces_matched++;
            result.name = match.name;
            // Drift toward this frame's face, not the track average
            result.adapted = adaptive_updater.on_match(match.name, normalize(embedding));
            if (config.log_matches) {
                log_match(key, smoothed, match);
            }
            break;

        case MatchDecision::Queue:
            faces_queued++;
            result.near_match = identity_matcher.is_near_match(match.confidence);
            queue_unknown(key, smoothed, match, face_image);
            break;

        case MatchDecision::Discard:
            faces_dropped++;
            break;
    }

    return result;
}

void RecognitionPipeline::log_match(TrackingKey key, const EmbeddingVector& embedding,
                                    const MatchResult& match) {
    Detection detection;
    detection.embedding = embedding;
    detection.matched_identity = match.name;
    detection.confidence = match.confidence;
    detection.tracking_key = key;
    detection.review_flag = false;
    detection.camera_id = config.camera_id;
    detection.timestamp = now_ms();

    writer_pool.submit_low_priority([this, detection]() {
        try {
            store.append_detection_log(detection);
        } catch (const TransientIOError& e) {
            spdlog::warn("Detection log write failed: {}", e.what());
        }
    });
}

void RecognitionPipeline::queue_unknown(TrackingKey key, const EmbeddingVector& embedding,
                                        const MatchResult& match, const ImageBytes& face_image) {
    Detection detection;
    detection.embedding = embedding;
    detection.confidence = match.confidence;
    detection.tracking_key = key;
    detection.near_match = identity_matcher.is_near_match(match.confidence);
    detection.camera_id = config.camera_id;
    detection.timestamp = now_ms();

    writer_pool.submit_low_priority([this, detection, face_image]() mutable {
        try {
            detection.id = queue.submit(detection, face_image);
        } catch (const TransientIOError& e) {
            spdlog::warn("Unknown face could not be queued: {}", e.what());
            return;
        }
        detection.review_flag = true;
        notify_unknown(detection);
    });
}

void RecognitionPipeline::notify_unknown(const Detection& detection) {
    UnknownCallback callback;
    {
        std::lock_guard<std::mutex> lock(listener_mutex);
        callback = unknown_listener;
    }
    if (!callback) return;

    try {
        callback(detection);
    } catch (const std::exception& e) {
        spdlog::error("Unknown-face listener failed for {}: {}", detection.id, e.what());
    }
}

void RecognitionPipeline::set_unknown_listener(UnknownCallback callback) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    unknown_listener = std::move(callback);
}

// ==================== CYCLE ====================

void RecognitionPipeline::end_cycle() {
    temporal_aggregator.advance_cycle();
}

void RecognitionPipeline::forget_track(TrackingKey key) {
    temporal_aggregator.evict(key);
}

void RecognitionPipeline::flush() {
    writer_pool.wait_all();
}

void RecognitionPipeline::print_stats() const {
    spdlog::info("=== Recognition Stats ===");
    spdlog::info("  Faces: {} (matched {}, queued {}, dropped {})",
                 faces_processed.load(), faces_matched.load(),
                 faces_queued.load(), faces_dropped.load());
    spdlog::info("  Identities: {}", similarity_index.size());
    spdlog::info("  Adaptive updates: {} ({} write failures)",
                 adaptive_updater.updates_applied(), adaptive_updater.write_failures());
    similarity_index.print_stats();
}

} // namespace facewatch
