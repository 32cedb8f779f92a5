// ============= include/facewatch/database/sqlite_face_store.hpp =============
/*
 * Face Store - SQLite Backend
 *
 * TABLES:
 * identities
 * ├── name (TEXT PRIMARY KEY)
 * ├── embedding (BLOB) - dim floats
 * ├── enrolled_at / updated_at (INTEGER, unix ms)
 * ├── recognition_count (INTEGER)
 * └── image_id (TEXT)
 *
 * detections
 * ├── id (TEXT PRIMARY KEY) - random 12 chars
 * ├── embedding (BLOB), matched_identity, confidence, track_id
 * ├── review_state (TEXT), review_flag, near_match, enrolled_as
 * └── image_id, camera_id, timestamp
 *
 * images
 * ├── id (TEXT PRIMARY KEY)
 * └── data (BLOB) - JPEG bytes
 *
 * - WAL mode, one connection guarded by a mutex
 * - ":memory:" gives a throwaway database (tests)
 */

#pragma once
#include "facewatch/database/face_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace facewatch {

class SqliteFaceStore : public FaceStore {
public:
    // Throws std::runtime_error if the database cannot be opened
    explicit SqliteFaceStore(const std::string& db_path);
    ~SqliteFaceStore() override;

    SqliteFaceStore(const SqliteFaceStore&) = delete;
    SqliteFaceStore& operator=(const SqliteFaceStore&) = delete;

    std::vector<Identity> load_all_identities() override;
    void save_identity(const Identity& identity) override;
    bool delete_identity(const std::string& name) override;

    std::string append_detection_log(const Detection& detection) override;
    bool update_detection_review_state(const std::string& id,
                                       ReviewState state,
                                       const std::string& enrolled_as = "") override;
    std::vector<Detection> load_unreviewed_detections(int limit) override;
    bool get_detection(const std::string& id, Detection& out) override;
    bool delete_detection(const std::string& id) override;

    std::string store_image(const ImageBytes& bytes) override;
    ImageBytes fetch_image(const std::string& image_id) override;
    bool delete_image(const std::string& image_id) override;

    StoreStats stats() override;

    // Detections of any state, newest first (review tooling)
    std::vector<Detection> list_detections(int limit, bool review_only = true);

    const std::string& path() const { return db_path; }
    bool is_open() const { return db != nullptr; }

    static std::string generate_id(int length = 12);

private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;

    bool init_database();
    bool create_tables();

    sqlite3_stmt* prepare(const char* sql);
    Detection read_detection(sqlite3_stmt* stmt);
    size_t count(const char* sql);

    static std::vector<unsigned char> serialize_embedding(const EmbeddingVector& emb);
    static EmbeddingVector deserialize_embedding(const void* data, int size);
};

} // namespace facewatch
