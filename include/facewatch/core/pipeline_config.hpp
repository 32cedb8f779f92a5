// ============= include/facewatch/core/pipeline_config.hpp =============
/*
 * Pipeline configuration
 *
 * One struct per component (their own Config types) plus deployment
 * settings. Read from a TOML file:
 *
 *   [index]       approximate_threshold, metric ("ip" | "l2"), hnsw_m,
 *                 ef_construction, ef_search
 *   [matcher]     match_threshold, auto_review_threshold, unknown_min_confidence
 *   [aggregator]  window, max_idle_cycles
 *   [adaptive]    enabled, alpha, update_frequency
 *   [review]      similar_threshold, similar_limit, scan_limit
 *   [database]    path, writer_threads
 *   [pipeline]    camera_id, log_matches
 *   [logging]     level, file
 *
 * auto_review_threshold defaults to match_threshold - 0.1 when absent.
 */

#pragma once
#include "facewatch/core/toml_config.hpp"
#include "facewatch/database/similarity_index.hpp"
#include "facewatch/recognition/adaptive_updater.hpp"
#include "facewatch/recognition/identity_matcher.hpp"
#include "facewatch/recognition/temporal_aggregator.hpp"
#include "facewatch/review/unknown_review_queue.hpp"
#include <string>

namespace facewatch {

struct PipelineConfig {
    SimilarityIndex::Config index;
    IdentityMatcher::Config matcher;
    TemporalAggregator::Config aggregator;
    AdaptiveUpdater::Config adaptive;
    UnknownReviewQueue::Config review;

    std::string db_path = "data/facewatch.db";
    size_t writer_threads = 2;

    std::string camera_id = "cam0";
    bool log_matches = true;          // audit log entry for every matched face

    std::string log_level = "info";
    std::string log_file;             // empty = console only

    // Throws std::invalid_argument
    void validate() const;
};

// Missing keys keep their defaults. Throws std::invalid_argument.
PipelineConfig pipeline_config_from_toml(const TomlConfig& toml);

// Throws std::runtime_error if the file cannot be read
PipelineConfig load_pipeline_config(const std::string& path);

void print_pipeline_config(const PipelineConfig& config);

// init_logging() with the [logging] section
void init_logging(const PipelineConfig& config);

} // namespace facewatch
