// ============= include/facewatch/tracking/face_tracker.hpp =============
/*
 * Face Tracking - ByteTrack style IoU association
 *
 * FEATURES:
 * - Multi-face tracking by IoU
 * - Kalman filter for motion prediction (constant velocity)
 * - Two-stage association (high / low detection score)
 * - Stable track ids across short occlusions
 *
 * The track id is the tracking key of the temporal aggregator.
 * Tracks dropped after max_age frames without a detection are reported
 * in TrackerUpdate::retired so their buffers can be released.
 */

#pragma once
#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>
#include <vector>

namespace facewatch {

struct TrackedFace {
    int id;
    cv::Rect box;
    float score;

    int age;
    int hits;
    int time_since_update;

    cv::KalmanFilter kf;
    bool kf_initialized;

    TrackedFace();
    void init_kalman();
    void predict();
    void update(const cv::Rect& measurement);
};

struct TrackInput {
    cv::Rect box;
    float score;
};

struct TrackAssignment {
    size_t detection_index;   // position in the update() input
    int track_id;
    bool confirmed;           // hits >= min_hits
};

struct TrackerUpdate {
    std::vector<TrackAssignment> assignments;
    std::vector<int> retired;
};

class FaceTracker {
public:
    struct Config {
        float iou_threshold;
        int max_age;          // frames without detection before removal
        int min_hits;         // detections needed to confirm a track
        float high_score;
        float low_score;

        Config()
            : iou_threshold(0.3f), max_age(30), min_hits(3),
              high_score(0.5f), low_score(0.3f) {}
    };

    explicit FaceTracker(const Config& config = Config());

    TrackerUpdate update(const std::vector<TrackInput>& detections);

    int get_total_tracks() const { return next_id - 1; }
    size_t get_track_count() const { return tracks.size(); }

    static float calculate_iou(const cv::Rect& a, const cv::Rect& b);

private:
    Config config;
    int next_id;
    std::vector<TrackedFace> tracks;

    // (input index, track index) pairs
    void associate(const std::vector<TrackInput>& detections,
                   const std::vector<size_t>& detection_indices,
                   const std::vector<size_t>& track_indices,
                   std::vector<std::pair<size_t, size_t>>& matches,
                   std::vector<size_t>& unmatched_dets,
                   std::vector<size_t>& unmatched_tracks) const;
};

} // namespace facewatch
