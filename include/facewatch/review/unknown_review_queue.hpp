// ============= include/facewatch/review/unknown_review_queue.hpp =============
/*
 * Unknown Review Queue - human disposition of unmatched detections
 *
 * STATES:
 *   Unreviewed ──dismiss──> Dismissed
 *              ──enroll───> Enrolled  (new Identity, enrolled_as = name)
 *   any        ──delete───> record + image removed
 * Dismissed / Enrolled are terminal.
 *
 * DUPLICATES:
 * find_similar() scans up to scan_limit queue entries and returns the ones
 * within cosine threshold of the given detection (self excluded).
 *
 * Transitions are serialized by one mutex; all state lives in the store.
 */

#pragma once
#include "facewatch/core/types.hpp"
#include "facewatch/database/face_store.hpp"
#include "facewatch/recognition/identity_catalog.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace facewatch {

struct SimilarDetection {
    Detection detection;
    float similarity;
};

class UnknownReviewQueue {
public:
    struct Config {
        float similar_threshold;
        int similar_limit;
        int scan_limit;

        Config() : similar_threshold(0.8f), similar_limit(10), scan_limit(1000) {}
    };

    UnknownReviewQueue(FaceStore& store, IdentityCatalog& catalog, const Config& config = Config());

    // Stores the image (if any) and appends the detection as an Unreviewed
    // queue entry. Returns the detection id. Throws TransientIOError.
    std::string submit(Detection detection, const ImageBytes& image = {});

    std::vector<Detection> pending(int limit = 100);
    bool get(const std::string& id, Detection& out);

    bool dismiss(const std::string& id);

    // false if not found / not Unreviewed; throws NameConflict if the
    // name is already enrolled
    bool enroll(const std::string& id, const std::string& name);

    bool delete_detection(const std::string& id);

    std::vector<SimilarDetection> find_similar(const std::string& id,
                                               float threshold,
                                               int limit);
    std::vector<SimilarDetection> find_similar(const std::string& id);

    const Config& get_config() const { return config; }

private:
    FaceStore& store;
    IdentityCatalog& catalog;
    Config config;

    std::mutex transition_mutex;
};

} // namespace facewatch
