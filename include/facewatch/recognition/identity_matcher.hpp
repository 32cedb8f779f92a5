// ============= include/facewatch/recognition/identity_matcher.hpp =============
/*
 * Identity Matcher - threshold policy on top of the similarity index
 *
 * THRESHOLDS (U <= R <= M):
 * - confidence >= M (match_threshold):       matched identity
 * - U <= confidence < M:                     unknown, queued for review
 *   (near match when confidence >= R, auto_review_threshold)
 * - confidence < U (unknown_min_confidence): unknown, not queued
 *
 * An empty catalog never matches (confidence 0).
 */

#pragma once
#include "facewatch/core/types.hpp"
#include "facewatch/database/similarity_index.hpp"
#include <string>

namespace facewatch {

struct MatchResult {
    std::string name;        // empty when unmatched
    float confidence = 0.0f; // best similarity seen
    bool matched = false;
};

enum class MatchDecision {
    Matched,
    Queue,
    Discard
};

const char* to_string(MatchDecision decision);

class IdentityMatcher {
public:
    struct Config {
        float match_threshold;         // M
        float auto_review_threshold;   // R
        float unknown_min_confidence;  // U

        Config()
            : match_threshold(0.40f),
              auto_review_threshold(0.30f),
              unknown_min_confidence(0.25f) {}
    };

    // Throws std::invalid_argument unless 0 <= U <= R <= M <= 1
    explicit IdentityMatcher(const SimilarityIndex& index, const Config& config = Config());

    MatchResult classify(const EmbeddingVector& smoothed) const;

    MatchDecision decide(const MatchResult& result) const;
    bool is_near_match(float confidence) const;

    const Config& get_config() const { return config; }

    static void validate(const Config& config);

private:
    const SimilarityIndex& index;
    Config config;
};

} // namespace facewatch
