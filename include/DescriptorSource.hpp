#pragma once

#include "FaceTypes.hpp"
#include "FrameBox.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief Model files for the OpenCV face stack
 */
struct ModelConfig {
    std::string detector_model = "models/face_detection_yunet_2023mar.onnx";
    std::string landmark_model = "models/lbfmodel.yaml";
    std::string recognizer_model = "models/face_recognition_sface_2021dec.onnx";

    float score_threshold = 0.6f;
    float nms_threshold = 0.3f;
    int top_k = 5000;
};

/**
 * @brief Abstract interface for face detection, landmarks and descriptors
 *
 * Returns zero or one face per frame. The pretrained models behind it are
 * treated as a black box; the liveness core only sees LandmarkSet and
 * Descriptor.
 */
class DescriptorSource {
public:
    virtual ~DescriptorSource() = default;

    /**
     * @brief Detect the dominant face in a frame
     * @return The detection, or std::nullopt if no face is visible
     * @throws PresenceError(ModelNotReady) if called before the models loaded
     */
    virtual std::optional<FaceDetection> detect(const FrameBox& frame) = 0;

    /**
     * @brief Get source name/type
     */
    virtual std::string name() const = 0;

    /**
     * @brief Check if the models are loaded
     */
    virtual bool is_ready() const = 0;
};

/**
 * @brief YuNet detection + LBF 68 landmarks + SFace 128-d descriptor
 *
 * - YuNet (cv::FaceDetectorYN) finds the face box and 5 key points
 * - FacemarkLBF fits the 68-point iBUG layout inside the box
 * - SFace (cv::FaceRecognizerSF) aligns the crop and extracts the descriptor
 */
class OpenCvDescriptorSource : public DescriptorSource {
public:
    explicit OpenCvDescriptorSource(const ModelConfig& config);
    ~OpenCvDescriptorSource() override;

    std::optional<FaceDetection> detect(const FrameBox& frame) override;
    std::string name() const override;
    bool is_ready() const override { return initialized_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_ = false;
};

/**
 * @brief Convert a 68-point iBUG landmark vector into the liveness groups
 *
 * Left eye 36-41, right eye 42-47, nose 27-35 (tip = nose[3] = point 30).
 * @throws PresenceError(InvalidInput) if fewer than 68 points are given
 */
LandmarkSet landmarks_from_ibug68(const std::vector<cv::Point2f>& points);

/**
 * @brief Factory: the OpenCV source, loaded from the configured models
 *
 * The returned source may report is_ready() == false if a model failed to
 * load; callers must check before the first attempt.
 */
std::unique_ptr<DescriptorSource> create_descriptor_source(const ModelConfig& config);

} // namespace presence
