#include "DescriptorSource.hpp"
#include "PresenceError.hpp"

#include <opencv2/face.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <iostream>

namespace presence {

LandmarkSet landmarks_from_ibug68(const std::vector<cv::Point2f>& points) {
    if (points.size() < 68) {
        throw PresenceError(ErrorKind::InvalidInput,
                            "Expected 68 landmarks, got " + std::to_string(points.size()));
    }

    LandmarkSet set;
    for (size_t i = 0; i < 6; ++i) {
        set.left_eye[i] = points[36 + i];
        set.right_eye[i] = points[42 + i];
    }
    set.nose.assign(points.begin() + 27, points.begin() + 36);
    return set;
}

// ============================================================================
// OpenCV face stack implementation
// ============================================================================

class OpenCvDescriptorSource::Impl {
public:
    explicit Impl(const ModelConfig& config) : config_(config) {
        try {
            detector_ = cv::FaceDetectorYN::create(
                config_.detector_model, /*config=*/"", cv::Size(320, 320),
                config_.score_threshold, config_.nms_threshold, config_.top_k);

            facemark_ = cv::face::FacemarkLBF::create();
            facemark_->loadModel(config_.landmark_model);

            recognizer_ = cv::FaceRecognizerSF::create(config_.recognizer_model, "");

        } catch (const cv::Exception& e) {
            std::cerr << "❌ Failed to load face models: " << e.what() << std::endl;
            std::cerr << "   Check the paths in the \"models\" config section" << std::endl;
            initialized_ = false;
            return;
        }

        initialized_ = detector_ && facemark_ && recognizer_;
        if (initialized_) {
            std::cout << "✓ Face models loaded (YuNet + LBF68 + SFace)" << std::endl;
        }
    }

    std::optional<FaceDetection> detect(const FrameBox& frame) {
        if (!initialized_) {
            throw PresenceError(ErrorKind::ModelNotReady, "Models not loaded");
        }

        cv::Mat bgr = frame.to_bgr();
        if (bgr.empty()) {
            return std::nullopt;
        }

        try {
            // YuNet input size must follow the frame size
            if (bgr.size() != input_size_) {
                detector_->setInputSize(bgr.size());
                input_size_ = bgr.size();
            }

            cv::Mat faces;
            detector_->detect(bgr, faces);
            if (faces.empty() || faces.rows == 0) {
                return std::nullopt;
            }

            // Largest face wins; rows are [x, y, w, h, 5x(lx, ly), score]
            int best = 0;
            float best_area = 0.0f;
            for (int i = 0; i < faces.rows; ++i) {
                const float area = faces.at<float>(i, 2) * faces.at<float>(i, 3);
                if (area > best_area) {
                    best_area = area;
                    best = i;
                }
            }

            FaceDetection detection;
            detection.bbox = cv::Rect(cv::Point(cvRound(faces.at<float>(best, 0)), cvRound(faces.at<float>(best, 1))),
                                      cv::Size(cvRound(faces.at<float>(best, 2)), cvRound(faces.at<float>(best, 3))));
            detection.bbox &= cv::Rect(0, 0, bgr.cols, bgr.rows);
            detection.confidence = faces.at<float>(best, 14);

            if (detection.bbox.width <= 0 || detection.bbox.height <= 0) {
                return std::nullopt;
            }

            cv::Mat gray;
            cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

            std::vector<cv::Rect> boxes = {detection.bbox};
            std::vector<std::vector<cv::Point2f>> landmarks;
            if (!facemark_->fit(gray, boxes, landmarks) || landmarks.empty() || landmarks[0].size() < 68) {
                return std::nullopt;
            }
            detection.landmarks = landmarks_from_ibug68(landmarks[0]);

            cv::Mat aligned;
            cv::Mat feature;
            recognizer_->alignCrop(bgr, faces.row(best), aligned);
            recognizer_->feature(aligned, feature);
            if (!feature.empty()) {
                cv::Mat flat = feature.reshape(1, 1);
                flat.convertTo(flat, CV_32F);
                detection.descriptor = Descriptor(flat.begin<float>(), flat.end<float>());
            }

            return detection;

        } catch (const cv::Exception& e) {
            // A failed inference on one frame counts as "no face", like a missed detection
            std::cerr << "⚠ Face inference failed on frame " << frame.sequence_id << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    bool is_initialized() const { return initialized_; }

private:
    ModelConfig config_;
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::face::Facemark> facemark_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
    cv::Size input_size_;
    bool initialized_ = false;
};

OpenCvDescriptorSource::OpenCvDescriptorSource(const ModelConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    initialized_ = impl_->is_initialized();
}

OpenCvDescriptorSource::~OpenCvDescriptorSource() = default;

std::optional<FaceDetection> OpenCvDescriptorSource::detect(const FrameBox& frame) {
    return impl_->detect(frame);
}

std::string OpenCvDescriptorSource::name() const {
    return "OpenCV YuNet/LBF68/SFace";
}

std::unique_ptr<DescriptorSource> create_descriptor_source(const ModelConfig& config) {
    auto source = std::make_unique<OpenCvDescriptorSource>(config);
    if (!source->is_ready()) {
        std::cerr << "⚠ Descriptor source not ready; attempts will fail with ModelNotReady" << std::endl;
    }
    return source;
}

} // namespace presence
