#include "facewatch/recognition/frame_processor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace facewatch {

FrameProcessor::FrameProcessor(FaceExtractor& extractor, RecognitionPipeline& pipeline,
                               const Config& config)
    : extractor(extractor), pipeline(pipeline), config(config), tracker(config.tracker) {}

ImageBytes FrameProcessor::encode_crop(const cv::Mat& frame, const cv::Rect& box, int quality) {
    ImageBytes bytes;
    cv::Rect roi = box & cv::Rect(0, 0, frame.cols, frame.rows);
    if (roi.area() <= 0) {
        return bytes;
    }

    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", frame(roi), bytes, params)) {
        spdlog::warn("JPEG encoding failed for face crop {}x{}", roi.width, roi.height);
        bytes.clear();
    }
    return bytes;
}

std::vector<FrameFace> FrameProcessor::process(const cv::Mat& frame) {
    frame_count++;
    std::vector<FrameFace> output;

    std::vector<ExtractedFace> faces;
    if (!frame.empty()) {
        try {
            faces = extractor.detect_and_embed(frame);
        } catch (const std::exception& e) {
            failure_count++;
            spdlog::warn("Face extraction failed on frame {}: {}", frame_count, e.what());
            faces.clear();
        }
    }

    std::vector<TrackInput> inputs;
    inputs.reserve(faces.size());
    for (const auto& face : faces) {
        inputs.push_back({face.box, face.score});
    }

    TrackerUpdate update = tracker.update(inputs);

    for (const auto& assignment : update.assignments) {
        if (!assignment.confirmed) continue;

        const ExtractedFace& face = faces[assignment.detection_index];
        if (face.embedding.empty()) continue;

        ImageBytes crop;
        if (config.store_images) {
            crop = encode_crop(frame, face.box, config.jpeg_quality);
        }

        try {
            FaceResult result = pipeline.process_face(assignment.track_id, face.embedding, crop);
            output.push_back({assignment.track_id, face.box, result});
        } catch (const std::invalid_argument& e) {
            spdlog::error("Track {}: embedding rejected: {}", assignment.track_id, e.what());
        }
    }

    for (int id : update.retired) {
        pipeline.forget_track(id);
    }
    pipeline.end_cycle();

    return output;
}

} // namespace facewatch
