#include "facewatch/recognition/adaptive_updater.hpp"
#include "facewatch/core/errors.hpp"
#include "facewatch/core/vector_math.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace facewatch {

AdaptiveUpdater::AdaptiveUpdater(IdentityCatalog& catalog, ThreadPool* writer, const Config& config)
    : catalog(catalog), writer(writer), config(config)
{
    if (config.update_frequency < 1) {
        throw std::invalid_argument("Adaptive update frequency must be at least 1");
    }
    if (!(config.alpha > 0.0f && config.alpha < 1.0f)) {
        throw std::invalid_argument("Adaptive alpha must lie in (0, 1)");
    }
}

EmbeddingVector AdaptiveUpdater::blend(const EmbeddingVector& old_vec,
                                       const EmbeddingVector& observed,
                                       float alpha) {
    if (old_vec.size() != observed.size()) {
        throw std::invalid_argument("Cannot blend embeddings of different dimensions");
    }

    EmbeddingVector result(old_vec.size());
    for (size_t i = 0; i < old_vec.size(); ++i) {
        result[i] = old_vec[i] * (1.0f - alpha) + observed[i] * alpha;
    }
    return normalize(result);
}

bool AdaptiveUpdater::on_match(const std::string& name, const EmbeddingVector& observed) {
    int64_t count = catalog.increment_recognition(name);
    if (count == 0) {
        spdlog::warn("Adaptive update for unknown identity {}", name);
        return false;
    }

    if (!config.enabled || count % config.update_frequency != 0) {
        return false;
    }

    Identity identity;
    if (!catalog.get(name, identity)) {
        return false;
    }

    if (!catalog.update_embedding(name, blend(identity.embedding, observed, config.alpha))) {
        return false;
    }
    updates++;

    spdlog::debug("🔄 Adaptive update: {} (match #{})", name, count);

    write_through(name);
    return true;
}

void AdaptiveUpdater::write_through(const std::string& name) {
    auto task = [this, name]() {
        // Read and save under one lock: whichever write runs last stores
        // the newest catalog state, whatever order the workers pick them up
        std::lock_guard<std::mutex> lock(write_mutex);

        Identity current;
        if (!catalog.get(name, current)) {
            spdlog::debug("Write-through skipped, {} no longer enrolled", name);
            return;
        }
        try {
            catalog.get_store().save_identity(current);
        } catch (const TransientIOError& e) {
            failures++;
            spdlog::warn("Write-through failed for {}: {}", name, e.what());
        }
    };

    if (writer) {
        writer->submit_high_priority(task);
    } else {
        task();
    }
}

int64_t AdaptiveUpdater::recognition_count(const std::string& name) const {
    Identity identity;
    return catalog.get(name, identity) ? identity.recognition_count : 0;
}

} // namespace facewatch
