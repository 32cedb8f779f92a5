#include "facewatch/database/sqlite_face_store.hpp"
#include "facewatch/core/errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <random>
#include <stdexcept>

namespace facewatch {

namespace {

// Finalizes on scope exit so a throwing bind/step never leaks the statement
class StatementGuard {
public:
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt(stmt) {}
    ~StatementGuard() { if (stmt) sqlite3_finalize(stmt); }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    sqlite3_stmt* get() const { return stmt; }

private:
    sqlite3_stmt* stmt;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

const char* kDetectionColumns =
    "id, embedding, matched_identity, confidence, track_id, review_state, "
    "review_flag, near_match, enrolled_as, image_id, camera_id, timestamp";

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteFaceStore::SqliteFaceStore(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    if (!init_database()) {
        std::string reason = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw std::runtime_error("Cannot initialize face store at " + db_path + ": " + reason);
    }

    spdlog::info("📦 Face store ready: {} ({} identities)", db_path, stats().identities);
}

SqliteFaceStore::~SqliteFaceStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool SqliteFaceStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", db ? sqlite3_errmsg(db) : "unknown");
        return false;
    }

    char* err = nullptr;
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("WAL mode unavailable: {}", err ? err : "unknown");
        sqlite3_free(err);
        err = nullptr;
    }
    if (sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("PRAGMA synchronous failed: {}", err ? err : "unknown");
        sqlite3_free(err);
    }

    return create_tables();
}

bool SqliteFaceStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS identities (
            name TEXT PRIMARY KEY,
            embedding BLOB NOT NULL,
            enrolled_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            recognition_count INTEGER DEFAULT 0,
            image_id TEXT
        );

        CREATE TABLE IF NOT EXISTS detections (
            id TEXT PRIMARY KEY,
            embedding BLOB NOT NULL,
            matched_identity TEXT,
            confidence REAL NOT NULL,
            track_id INTEGER,
            review_state TEXT NOT NULL DEFAULT 'unreviewed',
            review_flag INTEGER NOT NULL DEFAULT 0,
            near_match INTEGER NOT NULL DEFAULT 0,
            enrolled_as TEXT,
            image_id TEXT,
            camera_id TEXT,
            timestamp INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS images (
            id TEXT PRIMARY KEY,
            data BLOB NOT NULL,
            created_at INTEGER DEFAULT (strftime('%s', 'now'))
        );

        CREATE INDEX IF NOT EXISTS idx_detections_review ON detections(review_flag, review_state);
        CREATE INDEX IF NOT EXISTS idx_detections_timestamp ON detections(timestamp DESC);
        CREATE INDEX IF NOT EXISTS idx_detections_identity ON detections(matched_identity);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }

    return true;
}

// ==================== HELPERS ====================

std::string SqliteFaceStore::generate_id(int length) {
    static const char chars[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

    std::string id;
    id.reserve(length);
    for (int i = 0; i < length; ++i) {
        id += chars[dis(gen)];
    }
    return id;
}

std::vector<unsigned char> SqliteFaceStore::serialize_embedding(const EmbeddingVector& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

EmbeddingVector SqliteFaceStore::deserialize_embedding(const void* data, int size) {
    EmbeddingVector emb(size / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

sqlite3_stmt* SqliteFaceStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw TransientIOError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

size_t SqliteFaceStore::count(const char* sql) {
    StatementGuard stmt(prepare(sql));
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return 0;
}

Detection SqliteFaceStore::read_detection(sqlite3_stmt* stmt) {
    Detection d;
    d.id = column_text(stmt, 0);
    d.embedding = deserialize_embedding(sqlite3_column_blob(stmt, 1), sqlite3_column_bytes(stmt, 1));
    d.matched_identity = column_text(stmt, 2);
    d.confidence = static_cast<float>(sqlite3_column_double(stmt, 3));
    d.tracking_key = sqlite3_column_int(stmt, 4);
    d.review_state = review_state_from_string(column_text(stmt, 5));
    d.review_flag = sqlite3_column_int(stmt, 6) != 0;
    d.near_match = sqlite3_column_int(stmt, 7) != 0;
    d.enrolled_as = column_text(stmt, 8);
    d.image_id = column_text(stmt, 9);
    d.camera_id = column_text(stmt, 10);
    d.timestamp = sqlite3_column_int64(stmt, 11);
    return d;
}

// ==================== IDENTITIES ====================

std::vector<Identity> SqliteFaceStore::load_all_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT name, embedding, enrolled_at, updated_at, recognition_count, image_id "
                      "FROM identities ORDER BY enrolled_at, name";
    StatementGuard stmt(prepare(sql));

    std::vector<Identity> identities;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        Identity identity;
        identity.name = column_text(stmt.get(), 0);
        identity.embedding = deserialize_embedding(sqlite3_column_blob(stmt.get(), 1),
                                                   sqlite3_column_bytes(stmt.get(), 1));
        identity.enrolled_at = sqlite3_column_int64(stmt.get(), 2);
        identity.updated_at = sqlite3_column_int64(stmt.get(), 3);
        identity.recognition_count = sqlite3_column_int64(stmt.get(), 4);
        identity.image_id = column_text(stmt.get(), 5);
        identities.push_back(std::move(identity));
    }

    return identities;
}

void SqliteFaceStore::save_identity(const Identity& identity) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "INSERT OR REPLACE INTO identities "
                      "(name, embedding, enrolled_at, updated_at, recognition_count, image_id) "
                      "VALUES (?, ?, ?, ?, ?, ?)";
    StatementGuard stmt(prepare(sql));

    auto blob = serialize_embedding(identity.embedding);
    sqlite3_bind_text(stmt.get(), 1, identity.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 3, identity.enrolled_at);
    sqlite3_bind_int64(stmt.get(), 4, identity.updated_at);
    sqlite3_bind_int64(stmt.get(), 5, identity.recognition_count);
    sqlite3_bind_text(stmt.get(), 6, identity.image_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError("Failed to save identity " + identity.name + ": " + sqlite3_errmsg(db));
    }
}

bool SqliteFaceStore::delete_identity(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("DELETE FROM identities WHERE name=?"));
    sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError("Failed to delete identity " + name + ": " + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0;
}

// ==================== DETECTION LOG ====================

std::string SqliteFaceStore::append_detection_log(const Detection& detection) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = R"(
        INSERT INTO detections (id, embedding, matched_identity, confidence, track_id,
                                review_state, review_flag, near_match, enrolled_as,
                                image_id, camera_id, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";
    StatementGuard stmt(prepare(sql));

    std::string id = detection.id.empty() ? generate_id() : detection.id;
    auto blob = serialize_embedding(detection.embedding);

    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    if (detection.matched_identity.empty()) {
        sqlite3_bind_null(stmt.get(), 3);
    } else {
        sqlite3_bind_text(stmt.get(), 3, detection.matched_identity.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_double(stmt.get(), 4, detection.confidence);
    sqlite3_bind_int(stmt.get(), 5, detection.tracking_key);
    sqlite3_bind_text(stmt.get(), 6, to_string(detection.review_state), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt.get(), 7, detection.review_flag ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 8, detection.near_match ? 1 : 0);
    sqlite3_bind_text(stmt.get(), 9, detection.enrolled_as.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 10, detection.image_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 11, detection.camera_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 12, detection.timestamp != 0 ? detection.timestamp : now_ms());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError(std::string("Failed to append detection: ") + sqlite3_errmsg(db));
    }

    return id;
}

bool SqliteFaceStore::update_detection_review_state(const std::string& id,
                                                    ReviewState state,
                                                    const std::string& enrolled_as) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("UPDATE detections SET review_state=?, enrolled_as=? WHERE id=?"));
    sqlite3_bind_text(stmt.get(), 1, to_string(state), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, enrolled_as.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError("Failed to update detection " + id + ": " + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0;
}

std::vector<Detection> SqliteFaceStore::load_unreviewed_detections(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex);

    std::string sql = std::string("SELECT ") + kDetectionColumns +
                      " FROM detections WHERE review_flag=1 AND review_state='unreviewed'"
                      " ORDER BY timestamp DESC, rowid DESC LIMIT ?";
    StatementGuard stmt(prepare(sql.c_str()));
    sqlite3_bind_int(stmt.get(), 1, limit);

    std::vector<Detection> detections;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        detections.push_back(read_detection(stmt.get()));
    }
    return detections;
}

std::vector<Detection> SqliteFaceStore::list_detections(int limit, bool review_only) {
    std::lock_guard<std::mutex> lock(db_mutex);

    std::string sql = std::string("SELECT ") + kDetectionColumns + " FROM detections" +
                      (review_only ? " WHERE review_flag=1" : "") +
                      " ORDER BY timestamp DESC, rowid DESC LIMIT ?";
    StatementGuard stmt(prepare(sql.c_str()));
    sqlite3_bind_int(stmt.get(), 1, limit);

    std::vector<Detection> detections;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        detections.push_back(read_detection(stmt.get()));
    }
    return detections;
}

bool SqliteFaceStore::get_detection(const std::string& id, Detection& out) {
    std::lock_guard<std::mutex> lock(db_mutex);

    std::string sql = std::string("SELECT ") + kDetectionColumns + " FROM detections WHERE id=?";
    StatementGuard stmt(prepare(sql.c_str()));
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return false;
    }
    out = read_detection(stmt.get());
    return true;
}

bool SqliteFaceStore::delete_detection(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("DELETE FROM detections WHERE id=?"));
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError("Failed to delete detection " + id + ": " + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0;
}

// ==================== IMAGES ====================

std::string SqliteFaceStore::store_image(const ImageBytes& bytes) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("INSERT INTO images (id, data) VALUES (?, ?)"));
    std::string id = generate_id();
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 2, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError(std::string("Failed to store image: ") + sqlite3_errmsg(db));
    }
    return id;
}

ImageBytes SqliteFaceStore::fetch_image(const std::string& image_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("SELECT data FROM images WHERE id=?"));
    sqlite3_bind_text(stmt.get(), 1, image_id.c_str(), -1, SQLITE_TRANSIENT);

    ImageBytes bytes;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt.get(), 0));
        int size = sqlite3_column_bytes(stmt.get(), 0);
        if (data && size > 0) {
            bytes.assign(data, data + size);
        }
    }
    return bytes;
}

bool SqliteFaceStore::delete_image(const std::string& image_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    StatementGuard stmt(prepare("DELETE FROM images WHERE id=?"));
    sqlite3_bind_text(stmt.get(), 1, image_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw TransientIOError("Failed to delete image " + image_id + ": " + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0;
}

// ==================== STATS ====================

StoreStats SqliteFaceStore::stats() {
    std::lock_guard<std::mutex> lock(db_mutex);

    StoreStats s;
    s.identities = count("SELECT COUNT(*) FROM identities");
    s.detections = count("SELECT COUNT(*) FROM detections");
    s.matched_detections = count("SELECT COUNT(*) FROM detections WHERE matched_identity IS NOT NULL");
    s.pending_review = count("SELECT COUNT(*) FROM detections WHERE review_flag=1 AND review_state='unreviewed'");
    s.images = count("SELECT COUNT(*) FROM images");
    return s;
}

} // namespace facewatch
