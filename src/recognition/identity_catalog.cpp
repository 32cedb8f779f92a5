#include "facewatch/recognition/identity_catalog.hpp"
#include "facewatch/core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace facewatch {

IdentityCatalog::IdentityCatalog(FaceStore& store, SimilarityIndex& index)
    : store(store), index(index) {}

size_t IdentityCatalog::reload() {
    std::lock_guard<std::mutex> lock(mutex);

    auto loaded = store.load_all_identities();

    std::vector<IndexEntry> entries;
    entries.reserve(loaded.size());
    for (const auto& identity : loaded) {
        entries.push_back({identity.name, identity.embedding});
    }

    // Index first: a BuildError leaves the catalog untouched
    if (entries.empty()) {
        index.clear();
    } else {
        index.build_index(entries);
    }

    identities.clear();
    order.clear();
    for (auto& identity : loaded) {
        order.push_back(identity.name);
        identities.emplace(identity.name, std::move(identity));
    }

    spdlog::info("📂 Catalog loaded: {} identities", identities.size());
    return identities.size();
}

Identity IdentityCatalog::enroll(const std::string& name,
                                 const EmbeddingVector& embedding,
                                 const std::string& image_id) {
    if (name.empty()) {
        throw std::invalid_argument("Identity name must not be empty");
    }
    if (embedding.empty()) {
        throw std::invalid_argument("Cannot enroll " + name + " with an empty embedding");
    }

    {
        std::lock_guard<std::mutex> lock(mutex);

        if (identities.count(name) || reserved.count(name)) {
            throw NameConflict(name);
        }
        if (index.is_trained() && index.dimension() != embedding.size()) {
            throw std::invalid_argument("Embedding of " + name + " has " +
                                        std::to_string(embedding.size()) + " dims, catalog uses " +
                                        std::to_string(index.dimension()));
        }
        reserved.insert(name);
    }

    Identity identity;
    identity.name = name;
    identity.embedding = embedding;
    identity.enrolled_at = now_ms();
    identity.updated_at = identity.enrolled_at;
    identity.image_id = image_id;

    // Store write and index rebuild run without the catalog lock;
    // the reservation keeps the name from being taken meanwhile
    try {
        store.save_identity(identity);
        index.insert(name, embedding);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex);
        reserved.erase(name);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex);
    reserved.erase(name);
    identities.emplace(name, identity);
    order.push_back(name);

    spdlog::info("✓ Enrolled identity: {}", name);
    return identity;
}

bool IdentityCatalog::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = identities.find(name);
    if (it == identities.end()) {
        return false;
    }

    store.delete_identity(name);
    index.remove(name);
    identities.erase(it);
    order.erase(std::remove(order.begin(), order.end(), name), order.end());

    spdlog::info("Removed identity: {}", name);
    return true;
}

bool IdentityCatalog::update_embedding(const std::string& name, const EmbeddingVector& embedding) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = identities.find(name);
    if (it == identities.end()) {
        return false;
    }
    if (embedding.size() != it->second.embedding.size()) {
        throw std::invalid_argument("Embedding update for " + name + " changes dimension");
    }

    it->second.embedding = embedding;
    it->second.updated_at = now_ms();
    return index.update(name, embedding);
}

int64_t IdentityCatalog::increment_recognition(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = identities.find(name);
    if (it == identities.end()) {
        return 0;
    }
    return ++it->second.recognition_count;
}

bool IdentityCatalog::get(const std::string& name, Identity& out) const {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = identities.find(name);
    if (it == identities.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool IdentityCatalog::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return identities.count(name) > 0;
}

std::vector<Identity> IdentityCatalog::list() const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<Identity> result;
    result.reserve(order.size());
    for (const auto& name : order) {
        result.push_back(identities.at(name));
    }
    return result;
}

size_t IdentityCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return identities.size();
}

} // namespace facewatch
