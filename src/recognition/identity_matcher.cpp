#include "facewatch/recognition/identity_matcher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace facewatch {

const char* to_string(MatchDecision decision) {
    switch (decision) {
        case MatchDecision::Matched: return "matched";
        case MatchDecision::Queue:   return "queue";
        case MatchDecision::Discard: return "discard";
    }
    return "unknown";
}

void IdentityMatcher::validate(const Config& config) {
    auto in_unit = [](float v) { return v >= 0.0f && v <= 1.0f; };

    if (!in_unit(config.match_threshold) ||
        !in_unit(config.auto_review_threshold) ||
        !in_unit(config.unknown_min_confidence)) {
        throw std::invalid_argument("Matcher thresholds must lie in [0, 1]");
    }
    if (config.unknown_min_confidence > config.auto_review_threshold ||
        config.auto_review_threshold > config.match_threshold) {
        throw std::invalid_argument("Matcher thresholds must satisfy "
                                    "unknown_min_confidence <= auto_review_threshold <= match_threshold");
    }
}

IdentityMatcher::IdentityMatcher(const SimilarityIndex& index, const Config& config)
    : index(index), config(config)
{
    validate(config);
}

MatchResult IdentityMatcher::classify(const EmbeddingVector& smoothed) const {
    MatchResult result;

    auto hits = index.query(smoothed, 1);
    if (hits.empty()) {
        return result;
    }

    result.confidence = hits.front().similarity;
    if (result.confidence >= config.match_threshold) {
        result.name = hits.front().name;
        result.matched = true;
    }

    spdlog::debug("🔍 best={} sim={:.3f} -> {}", hits.front().name, result.confidence,
                  result.matched ? "match" : "unknown");
    return result;
}

MatchDecision IdentityMatcher::decide(const MatchResult& result) const {
    if (result.matched) {
        return MatchDecision::Matched;
    }
    if (result.confidence >= config.unknown_min_confidence) {
        return MatchDecision::Queue;
    }
    return MatchDecision::Discard;
}

bool IdentityMatcher::is_near_match(float confidence) const {
    return confidence >= config.auto_review_threshold;
}

} // namespace facewatch
