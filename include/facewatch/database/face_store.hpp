// ============= include/facewatch/database/face_store.hpp =============
/*
 * Persistent store interface
 *
 * Durable home of identities, the detection log and face images.
 * The in-memory catalog and the similarity index are caches of it.
 *
 * ERRORS:
 * - write failures throw TransientIOError
 * - missing records are reported with false / empty results
 */

#pragma once
#include "facewatch/core/types.hpp"
#include <string>
#include <vector>

namespace facewatch {

using ImageBytes = std::vector<unsigned char>;

struct StoreStats {
    size_t identities = 0;
    size_t detections = 0;
    size_t matched_detections = 0;
    size_t pending_review = 0;
    size_t images = 0;
};

class FaceStore {
public:
    virtual ~FaceStore() = default;

    // ===== IDENTITIES =====
    virtual std::vector<Identity> load_all_identities() = 0;
    virtual void save_identity(const Identity& identity) = 0;      // insert or replace
    virtual bool delete_identity(const std::string& name) = 0;

    // ===== DETECTION LOG =====
    virtual std::string append_detection_log(const Detection& detection) = 0;
    virtual bool update_detection_review_state(const std::string& id,
                                               ReviewState state,
                                               const std::string& enrolled_as = "") = 0;
    // review_flag set and state Unreviewed, newest first
    virtual std::vector<Detection> load_unreviewed_detections(int limit) = 0;
    virtual bool get_detection(const std::string& id, Detection& out) = 0;
    virtual bool delete_detection(const std::string& id) = 0;

    // ===== IMAGES =====
    virtual std::string store_image(const ImageBytes& bytes) = 0;
    virtual ImageBytes fetch_image(const std::string& image_id) = 0;   // empty if missing
    virtual bool delete_image(const std::string& image_id) = 0;

    virtual StoreStats stats() = 0;
};

} // namespace facewatch
