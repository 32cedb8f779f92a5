#include "facewatch/review/unknown_review_queue.hpp"
#include "facewatch/core/errors.hpp"
#include "facewatch/core/vector_math.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace facewatch {

UnknownReviewQueue::UnknownReviewQueue(FaceStore& store, IdentityCatalog& catalog, const Config& config)
    : store(store), catalog(catalog), config(config) {}

// ==================== QUEUE ====================

std::string UnknownReviewQueue::submit(Detection detection, const ImageBytes& image) {
    if (!image.empty()) {
        detection.image_id = store.store_image(image);
    }

    detection.review_state = ReviewState::Unreviewed;
    detection.review_flag = true;
    detection.matched_identity.clear();
    detection.enrolled_as.clear();
    if (detection.timestamp == 0) {
        detection.timestamp = now_ms();
    }

    std::string id = store.append_detection_log(detection);
    spdlog::info("❓ Unknown face queued: {} (conf={:.3f}{})", id, detection.confidence,
                 detection.near_match ? ", near match" : "");
    return id;
}

std::vector<Detection> UnknownReviewQueue::pending(int limit) {
    return store.load_unreviewed_detections(limit);
}

bool UnknownReviewQueue::get(const std::string& id, Detection& out) {
    return store.get_detection(id, out);
}

// ==================== TRANSITIONS ====================

bool UnknownReviewQueue::dismiss(const std::string& id) {
    std::lock_guard<std::mutex> lock(transition_mutex);

    Detection detection;
    if (!store.get_detection(id, detection) || detection.review_state != ReviewState::Unreviewed) {
        return false;
    }

    bool ok = store.update_detection_review_state(id, ReviewState::Dismissed);
    if (ok) {
        spdlog::info("Dismissed detection {}", id);
    }
    return ok;
}

bool UnknownReviewQueue::enroll(const std::string& id, const std::string& name) {
    std::lock_guard<std::mutex> lock(transition_mutex);

    Detection detection;
    if (!store.get_detection(id, detection) || detection.review_state != ReviewState::Unreviewed) {
        return false;
    }
    if (catalog.contains(name)) {
        throw NameConflict(name);
    }

    // The identity gets its own copy; deleting the detection later keeps it
    std::string image_copy;
    if (!detection.image_id.empty()) {
        ImageBytes bytes = store.fetch_image(detection.image_id);
        if (!bytes.empty()) {
            image_copy = store.store_image(bytes);
        }
    }

    try {
        catalog.enroll(name, detection.embedding, image_copy);
    } catch (const std::exception& e) {
        spdlog::error("Enrollment of {} as {} failed: {}", id, name, e.what());
        if (!image_copy.empty()) {
            store.delete_image(image_copy);
        }
        throw;
    }

    store.update_detection_review_state(id, ReviewState::Enrolled, name);
    spdlog::info("✓ Detection {} enrolled as {}", id, name);
    return true;
}

bool UnknownReviewQueue::delete_detection(const std::string& id) {
    std::lock_guard<std::mutex> lock(transition_mutex);

    Detection detection;
    if (!store.get_detection(id, detection)) {
        return false;
    }

    if (!detection.image_id.empty()) {
        store.delete_image(detection.image_id);
    }
    bool ok = store.delete_detection(id);
    if (ok) {
        spdlog::info("Deleted detection {}", id);
    }
    return ok;
}

// ==================== DUPLICATES ====================

std::vector<SimilarDetection> UnknownReviewQueue::find_similar(const std::string& id,
                                                               float threshold,
                                                               int limit) {
    std::vector<SimilarDetection> results;

    Detection target;
    if (limit <= 0 || !store.get_detection(id, target)) {
        return results;
    }

    for (auto& candidate : store.load_unreviewed_detections(config.scan_limit)) {
        if (candidate.id == id || candidate.embedding.size() != target.embedding.size()) {
            continue;
        }
        float sim = cosine_similarity(target.embedding, candidate.embedding);
        if (sim >= threshold) {
            results.push_back({std::move(candidate), sim});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SimilarDetection& a, const SimilarDetection& b) {
                         return a.similarity > b.similarity;
                     });

    if (results.size() > static_cast<size_t>(limit)) {
        results.resize(limit);
    }
    return results;
}

std::vector<SimilarDetection> UnknownReviewQueue::find_similar(const std::string& id) {
    return find_similar(id, config.similar_threshold, config.similar_limit);
}

} // namespace facewatch
