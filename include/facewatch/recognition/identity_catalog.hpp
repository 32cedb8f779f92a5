// ============= include/facewatch/recognition/identity_catalog.hpp =============
/*
 * Identity Catalog - enrolled identities, kept in step with the index
 *
 * - Owns the in-memory Identity set (name -> Identity)
 * - Every mutation goes to the FaceStore and the SimilarityIndex
 * - reload() rebuilds both caches from the store
 * - enroll() holds the lock only around its in-memory checks and insert,
 *   so lookups and counters are not blocked by the store write
 *
 * ORDER:
 * list() and the index share enrollment order, so index ties resolve
 * to the earliest enrolled identity.
 */

#pragma once
#include "facewatch/core/types.hpp"
#include "facewatch/database/face_store.hpp"
#include "facewatch/database/similarity_index.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace facewatch {

class IdentityCatalog {
public:
    IdentityCatalog(FaceStore& store, SimilarityIndex& index);

    // Loads every identity from the store and rebuilds the index.
    // Returns the number of identities loaded.
    size_t reload();

    // Throws NameConflict if the name exists, TransientIOError if the
    // store write fails (nothing is cached in that case).
    Identity enroll(const std::string& name,
                    const EmbeddingVector& embedding,
                    const std::string& image_id = "");

    bool remove(const std::string& name);

    // In-memory + index only; persistence is up to the caller
    bool update_embedding(const std::string& name, const EmbeddingVector& embedding);

    // Returns the new count, 0 if the name is unknown
    int64_t increment_recognition(const std::string& name);

    bool get(const std::string& name, Identity& out) const;
    bool contains(const std::string& name) const;
    std::vector<Identity> list() const;
    size_t size() const;

    FaceStore& get_store() { return store; }
    SimilarityIndex& get_index() { return index; }

private:
    FaceStore& store;
    SimilarityIndex& index;

    std::unordered_map<std::string, Identity> identities;
    std::vector<std::string> order;   // enrollment order
    std::unordered_set<std::string> reserved;   // enrollments in flight
    mutable std::mutex mutex;
};

} // namespace facewatch
