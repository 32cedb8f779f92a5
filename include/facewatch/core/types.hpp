// ============= include/facewatch/core/types.hpp =============
/*
 * Shared data model
 *
 * - EmbeddingVector: float descriptor from the external extractor (512D ArcFace)
 * - Identity:        enrolled person (unique name + reference vector)
 * - Detection:       one processed face in one frame cycle
 * - ReviewState:     lifecycle of unmatched detections
 *
 * Vectors are always copied into the entity that owns them.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace facewatch {

using EmbeddingVector = std::vector<float>;
using TrackingKey = int;

enum class ReviewState {
    Unreviewed,
    Dismissed,
    Enrolled,
    Deleted
};

const char* to_string(ReviewState state);

// Throws std::invalid_argument for unknown names
ReviewState review_state_from_string(const std::string& name);

inline bool is_terminal(ReviewState state) {
    return state != ReviewState::Unreviewed;
}

struct Identity {
    std::string name;
    EmbeddingVector embedding;
    int64_t enrolled_at = 0;          // unix ms
    int64_t updated_at = 0;           // unix ms
    int64_t recognition_count = 0;
    std::string image_id;             // may be empty
};

struct Detection {
    std::string id;                   // assigned by the store
    EmbeddingVector embedding;
    std::string matched_identity;     // empty = unmatched
    float confidence = 0.0f;
    TrackingKey tracking_key = -1;
    ReviewState review_state = ReviewState::Unreviewed;
    bool review_flag = false;         // true = entry of the review queue
    bool near_match = false;          // confidence >= auto-review threshold
    std::string enrolled_as;
    std::string image_id;
    std::string camera_id;
    int64_t timestamp = 0;            // unix ms

    bool is_matched() const { return !matched_identity.empty(); }
};

int64_t now_ms();

} // namespace facewatch
