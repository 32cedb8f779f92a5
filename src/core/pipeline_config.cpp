#include "facewatch/core/pipeline_config.hpp"
#include "facewatch/core/logging.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace facewatch {

namespace {

int positive_int(const TomlConfig& toml, const std::string& key, int def) {
    int value = toml.get_int(key, def);
    if (value < 1) {
        throw std::invalid_argument("Config: " + key + " must be at least 1, got " +
                                    std::to_string(value));
    }
    return value;
}

} // namespace

void PipelineConfig::validate() const {
    IdentityMatcher::validate(matcher);

    if (aggregator.window < 1) {
        throw std::invalid_argument("Config: aggregator.window must be at least 1");
    }
    if (adaptive.update_frequency < 1) {
        throw std::invalid_argument("Config: adaptive.update_frequency must be at least 1");
    }
    if (!(adaptive.alpha > 0.0f && adaptive.alpha < 1.0f)) {
        throw std::invalid_argument("Config: adaptive.alpha must lie in (0, 1)");
    }
    if (review.similar_threshold < 0.0f || review.similar_threshold > 1.0f) {
        throw std::invalid_argument("Config: review.similar_threshold must lie in [0, 1]");
    }
    if (writer_threads < 1) {
        throw std::invalid_argument("Config: database.writer_threads must be at least 1");
    }
}

PipelineConfig pipeline_config_from_toml(const TomlConfig& toml) {
    PipelineConfig config;

    // Index
    config.index.approximate_threshold = positive_int(toml, "index.approximate_threshold",
        static_cast<int>(config.index.approximate_threshold));
    config.index.metric = metric_from_string(toml.get("index.metric", to_string(config.index.metric)));
    config.index.hnsw.M = positive_int(toml, "index.hnsw_m", config.index.hnsw.M);
    config.index.hnsw.ef_construction = positive_int(toml, "index.ef_construction",
                                                     config.index.hnsw.ef_construction);
    config.index.hnsw.ef_search = positive_int(toml, "index.ef_search", config.index.hnsw.ef_search);

    // Matcher
    config.matcher.match_threshold = toml.get_float("matcher.match_threshold",
                                                    config.matcher.match_threshold);
    config.matcher.auto_review_threshold = toml.get_float(
        "matcher.auto_review_threshold",
        std::max(0.0f, config.matcher.match_threshold - 0.1f));
    config.matcher.unknown_min_confidence = toml.get_float(
        "matcher.unknown_min_confidence",
        std::min(config.matcher.unknown_min_confidence, config.matcher.auto_review_threshold));

    // Aggregator
    config.aggregator.window = positive_int(toml, "aggregator.window",
                                            static_cast<int>(config.aggregator.window));
    config.aggregator.max_idle_cycles = positive_int(toml, "aggregator.max_idle_cycles",
                                                     static_cast<int>(config.aggregator.max_idle_cycles));

    // Adaptive
    config.adaptive.enabled = toml.get_bool("adaptive.enabled", config.adaptive.enabled);
    config.adaptive.alpha = toml.get_float("adaptive.alpha", config.adaptive.alpha);
    config.adaptive.update_frequency = positive_int(toml, "adaptive.update_frequency",
                                                    config.adaptive.update_frequency);

    // Review
    config.review.similar_threshold = toml.get_float("review.similar_threshold",
                                                     config.review.similar_threshold);
    config.review.similar_limit = positive_int(toml, "review.similar_limit", config.review.similar_limit);
    config.review.scan_limit = positive_int(toml, "review.scan_limit", config.review.scan_limit);

    // Database
    config.db_path = toml.get("database.path", config.db_path);
    config.writer_threads = positive_int(toml, "database.writer_threads",
                                         static_cast<int>(config.writer_threads));

    // Pipeline
    config.camera_id = toml.get("pipeline.camera_id", config.camera_id);
    config.log_matches = toml.get_bool("pipeline.log_matches", config.log_matches);

    // Logging
    config.log_level = toml.get("logging.level", config.log_level);
    config.log_file = toml.get("logging.file", config.log_file);

    config.validate();
    return config;
}

PipelineConfig load_pipeline_config(const std::string& path) {
    TomlConfig toml;
    if (!toml.load(path)) {
        throw std::runtime_error("Cannot read config file: " + path);
    }
    return pipeline_config_from_toml(toml);
}

void init_logging(const PipelineConfig& config) {
    init_logging(config.log_level, config.log_file);
}

void print_pipeline_config(const PipelineConfig& config) {
    spdlog::info("=== Configuration ===");
    spdlog::info("  Database: {} ({} writer threads)", config.db_path, config.writer_threads);
    spdlog::info("  Index: {} metric, HNSW from {} identities (M={}, ef_c={})",
                 to_string(config.index.metric), config.index.approximate_threshold,
                 config.index.hnsw.M, config.index.hnsw.ef_construction);
    spdlog::info("  Thresholds: match={:.2f} review={:.2f} unknown={:.2f}",
                 config.matcher.match_threshold, config.matcher.auto_review_threshold,
                 config.matcher.unknown_min_confidence);
    spdlog::info("  Aggregator: window={} idle={} cycles",
                 config.aggregator.window, config.aggregator.max_idle_cycles);
    spdlog::info("  Adaptive: {} (alpha={:.2f}, every {} matches)",
                 config.adaptive.enabled ? "on" : "off", config.adaptive.alpha,
                 config.adaptive.update_frequency);
    spdlog::info("  Logging: {}{}", config.log_level,
                 config.log_file.empty() ? "" : " -> " + config.log_file);
}

} // namespace facewatch
