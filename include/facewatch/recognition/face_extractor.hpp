// ============= include/facewatch/recognition/face_extractor.hpp =============
/*
 * Detector + aligner + embedding model, seen as one black box.
 *
 * Implementations wrap the inference backend of the deployment
 * (RetinaFace + ArcFace, ...). They may throw on a bad frame;
 * FrameProcessor turns that into "no faces this cycle".
 */

#pragma once
#include "facewatch/core/types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace facewatch {

struct ExtractedFace {
    cv::Rect box;
    EmbeddingVector embedding;
    float score = 0.0f;   // detector confidence
};

class FaceExtractor {
public:
    virtual ~FaceExtractor() = default;

    virtual std::vector<ExtractedFace> detect_and_embed(const cv::Mat& frame) = 0;
};

} // namespace facewatch
