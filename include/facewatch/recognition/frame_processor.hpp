// ============= include/facewatch/recognition/frame_processor.hpp =============
/*
 * Frame Processor - one camera frame through the whole pipeline
 *
 * 1. FaceExtractor: boxes + embeddings (failure = empty frame)
 * 2. FaceTracker:   box -> stable track id (tracking key)
 * 3. RecognitionPipeline::process_face for every confirmed track,
 *    with the JPEG crop of the face for the review queue
 * 4. retired tracks are evicted, then the frame cycle is closed
 */

#pragma once
#include "facewatch/recognition/face_extractor.hpp"
#include "facewatch/recognition/recognition_pipeline.hpp"
#include "facewatch/tracking/face_tracker.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace facewatch {

struct FrameFace {
    int track_id;
    cv::Rect box;
    FaceResult result;
};

class FrameProcessor {
public:
    struct Config {
        bool store_images;
        int jpeg_quality;
        FaceTracker::Config tracker;

        Config() : store_images(true), jpeg_quality(90) {}
    };

    FrameProcessor(FaceExtractor& extractor, RecognitionPipeline& pipeline,
                   const Config& config = Config());

    std::vector<FrameFace> process(const cv::Mat& frame);

    size_t frames_processed() const { return frame_count; }
    size_t extractor_failures() const { return failure_count; }

    static ImageBytes encode_crop(const cv::Mat& frame, const cv::Rect& box, int quality);

private:
    FaceExtractor& extractor;
    RecognitionPipeline& pipeline;
    Config config;
    FaceTracker tracker;

    size_t frame_count = 0;
    size_t failure_count = 0;
};

} // namespace facewatch
