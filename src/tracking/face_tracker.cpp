#include "facewatch/tracking/face_tracker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace facewatch {

TrackedFace::TrackedFace()
    : id(-1), score(0.0f), age(0), hits(0),
      time_since_update(0), kf_initialized(false) {}

void TrackedFace::init_kalman() {
    // State: [cx, cy, w, h, dx, dy, dw, dh]
    // Measurement: [cx, cy, w, h]
    kf.init(8, 4, 0);

    kf.transitionMatrix = (cv::Mat_<float>(8, 8) <<
        1, 0, 0, 0, 1, 0, 0, 0,
        0, 1, 0, 0, 0, 1, 0, 0,
        0, 0, 1, 0, 0, 0, 1, 0,
        0, 0, 0, 1, 0, 0, 0, 1,
        0, 0, 0, 0, 1, 0, 0, 0,
        0, 0, 0, 0, 0, 1, 0, 0,
        0, 0, 0, 0, 0, 0, 1, 0,
        0, 0, 0, 0, 0, 0, 0, 1
    );

    kf.measurementMatrix = (cv::Mat_<float>(4, 8) <<
        1, 0, 0, 0, 0, 0, 0, 0,
        0, 1, 0, 0, 0, 0, 0, 0,
        0, 0, 1, 0, 0, 0, 0, 0,
        0, 0, 0, 1, 0, 0, 0, 0
    );

    cv::setIdentity(kf.processNoiseCov, cv::Scalar::all(1e-2));
    cv::setIdentity(kf.measurementNoiseCov, cv::Scalar::all(1e-1));
    cv::setIdentity(kf.errorCovPost, cv::Scalar::all(1));

    kf.statePost = cv::Mat::zeros(8, 1, CV_32F);
    kf.statePost.at<float>(0) = box.x + box.width / 2.0f;
    kf.statePost.at<float>(1) = box.y + box.height / 2.0f;
    kf.statePost.at<float>(2) = static_cast<float>(box.width);
    kf.statePost.at<float>(3) = static_cast<float>(box.height);

    kf_initialized = true;
}

void TrackedFace::predict() {
    if (!kf_initialized) {
        init_kalman();
        return;
    }

    cv::Mat prediction = kf.predict();

    float cx = prediction.at<float>(0);
    float cy = prediction.at<float>(1);
    float w = std::max(1.0f, prediction.at<float>(2));
    float h = std::max(1.0f, prediction.at<float>(3));

    box.x = static_cast<int>(cx - w / 2.0f);
    box.y = static_cast<int>(cy - h / 2.0f);
    box.width = static_cast<int>(w);
    box.height = static_cast<int>(h);
}

void TrackedFace::update(const cv::Rect& measurement) {
    box = measurement;
    if (!kf_initialized) {
        init_kalman();
        return;
    }

    cv::Mat m = (cv::Mat_<float>(4, 1) <<
        measurement.x + measurement.width / 2.0f,
        measurement.y + measurement.height / 2.0f,
        static_cast<float>(measurement.width),
        static_cast<float>(measurement.height)
    );
    kf.correct(m);
}

// ==================== FaceTracker ====================

FaceTracker::FaceTracker(const Config& config)
    : config(config), next_id(1)
{
    spdlog::info("🎯 Face Tracker initialized");
    spdlog::info("   IoU threshold: {}", config.iou_threshold);
    spdlog::info("   Max age: {} frames", config.max_age);
    spdlog::info("   Min hits: {}", config.min_hits);
}

float FaceTracker::calculate_iou(const cv::Rect& a, const cv::Rect& b) {
    float intersection = static_cast<float>((a & b).area());
    float union_area = static_cast<float>(a.area() + b.area()) - intersection;

    if (union_area <= 0) return 0.0f;
    return intersection / union_area;
}

void FaceTracker::associate(const std::vector<TrackInput>& detections,
                            const std::vector<size_t>& detection_indices,
                            const std::vector<size_t>& track_indices,
                            std::vector<std::pair<size_t, size_t>>& matches,
                            std::vector<size_t>& unmatched_dets,
                            std::vector<size_t>& unmatched_tracks) const
{
    matches.clear();
    unmatched_dets.clear();
    unmatched_tracks.clear();

    if (detection_indices.empty() || track_indices.empty()) {
        unmatched_dets = detection_indices;
        unmatched_tracks = track_indices;
        return;
    }

    // Greedy: each track takes its best free detection above the IoU threshold
    std::vector<bool> det_matched(detection_indices.size(), false);

    for (size_t t = 0; t < track_indices.size(); t++) {
        float max_iou = config.iou_threshold;
        int best_det = -1;

        for (size_t d = 0; d < detection_indices.size(); d++) {
            if (det_matched[d]) continue;

            float iou = calculate_iou(detections[detection_indices[d]].box,
                                      tracks[track_indices[t]].box);
            if (iou > max_iou) {
                max_iou = iou;
                best_det = static_cast<int>(d);
            }
        }

        if (best_det >= 0) {
            matches.push_back({detection_indices[best_det], track_indices[t]});
            det_matched[best_det] = true;
        } else {
            unmatched_tracks.push_back(track_indices[t]);
        }
    }

    for (size_t d = 0; d < detection_indices.size(); d++) {
        if (!det_matched[d]) {
            unmatched_dets.push_back(detection_indices[d]);
        }
    }
}

TrackerUpdate FaceTracker::update(const std::vector<TrackInput>& detections) {
    TrackerUpdate result;

    // 1. Split detections by score
    std::vector<size_t> high_conf, low_conf;
    for (size_t i = 0; i < detections.size(); i++) {
        if (detections[i].score >= config.high_score) {
            high_conf.push_back(i);
        } else if (detections[i].score >= config.low_score) {
            low_conf.push_back(i);
        }
    }

    // 2. Predict every track
    for (auto& track : tracks) {
        track.predict();
    }

    auto apply = [&](size_t det_idx, size_t track_idx) {
        TrackedFace& track = tracks[track_idx];
        track.update(detections[det_idx].box);
        track.score = detections[det_idx].score;
        track.hits++;
        track.time_since_update = 0;
        track.age++;
        result.assignments.push_back({det_idx, track.id, track.hits >= config.min_hits});
    };

    // 3. First association: high score detections
    std::vector<size_t> all_tracks(tracks.size());
    for (size_t i = 0; i < tracks.size(); i++) all_tracks[i] = i;

    std::vector<std::pair<size_t, size_t>> matches;
    std::vector<size_t> unmatched_dets, unmatched_tracks;
    associate(detections, high_conf, all_tracks, matches, unmatched_dets, unmatched_tracks);

    for (const auto& [det_idx, track_idx] : matches) {
        apply(det_idx, track_idx);
    }

    // 4. Second association: low score detections with the leftover tracks
    if (!low_conf.empty() && !unmatched_tracks.empty()) {
        std::vector<std::pair<size_t, size_t>> matches2;
        std::vector<size_t> unmatched_low, unmatched_tracks2;
        associate(detections, low_conf, unmatched_tracks, matches2, unmatched_low, unmatched_tracks2);

        for (const auto& [det_idx, track_idx] : matches2) {
            apply(det_idx, track_idx);
        }
        unmatched_tracks = unmatched_tracks2;
    }

    // 5. Age unmatched tracks (before new ones are appended)
    for (size_t track_idx : unmatched_tracks) {
        tracks[track_idx].time_since_update++;
        tracks[track_idx].age++;
    }

    // 6. New tracks for unmatched high score detections
    for (size_t det_idx : unmatched_dets) {
        TrackedFace new_track;
        new_track.id = next_id++;
        new_track.box = detections[det_idx].box;
        new_track.score = detections[det_idx].score;
        new_track.age = 1;
        new_track.hits = 1;
        new_track.time_since_update = 0;
        new_track.init_kalman();

        result.assignments.push_back({det_idx, new_track.id, new_track.hits >= config.min_hits});
        tracks.push_back(new_track);
    }

    // 7. Retire stale tracks
    auto is_stale = [this](const TrackedFace& t) {
        return t.time_since_update > config.max_age;
    };
    for (const auto& track : tracks) {
        if (is_stale(track)) {
            result.retired.push_back(track.id);
        }
    }
    tracks.erase(std::remove_if(tracks.begin(), tracks.end(), is_stale), tracks.end());

    std::sort(result.assignments.begin(), result.assignments.end(),
              [](const TrackAssignment& a, const TrackAssignment& b) {
                  return a.detection_index < b.detection_index;
              });
    return result;
}

} // namespace facewatch
