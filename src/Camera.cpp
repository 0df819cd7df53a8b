#include "Camera.hpp"
#include "PresenceError.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <iostream>

namespace presence {

namespace {

double now_ms() {
    return static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

// ============================================================================
// OpenCV (V4L2) webcam
// ============================================================================

OpenCvCamera::OpenCvCamera(const CameraConfig& config) : config_(config) {}

OpenCvCamera::~OpenCvCamera() {
    close();
}

void OpenCvCamera::open() {
    if (capture_.isOpened()) {
        return;
    }

    try {
        if (!capture_.open(config_.device_index, cv::CAP_ANY)) {
            throw PresenceError(ErrorKind::CameraUnavailable,
                                "Camera access denied: cannot open /dev/video" +
                                std::to_string(config_.device_index));
        }
        capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
        capture_.set(cv::CAP_PROP_FPS, config_.fps);
        // Keep only the newest frame so each tick sees the live image
        capture_.set(cv::CAP_PROP_BUFFERSIZE, 1);
    } catch (const cv::Exception& e) {
        capture_.release();
        throw PresenceError(ErrorKind::CameraUnavailable,
                            std::string("OpenCV camera error: ") + e.what());
    }

    sequence_id_ = 0;
    std::cout << "📹 Camera " << config_.device_index << " opened ("
              << capture_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << capture_.get(cv::CAP_PROP_FRAME_HEIGHT) << ")" << std::endl;
}

FrameBox OpenCvCamera::grab() {
    if (!capture_.isOpened()) {
        throw PresenceError(ErrorKind::CameraUnavailable, "Camera is not open");
    }

    cv::Mat image;
    try {
        if (!capture_.read(image) || image.empty()) {
            throw PresenceError(ErrorKind::CameraUnavailable,
                                "Camera stopped delivering frames");
        }
    } catch (const cv::Exception& e) {
        throw PresenceError(ErrorKind::CameraUnavailable,
                            std::string("Capture error: ") + e.what());
    }

    return FrameBox::from_mat(image, sequence_id_++, now_ms());
}

void OpenCvCamera::close() {
    if (capture_.isOpened()) {
        capture_.release();
        std::cout << "📹 Camera " << config_.device_index << " released" << std::endl;
    }
}

bool OpenCvCamera::is_open() const {
    return capture_.isOpened();
}

std::string OpenCvCamera::name() const {
    return "opencv:" + std::to_string(config_.device_index);
}

// ============================================================================
// Intel RealSense
// ============================================================================

RealSenseCamera::RealSenseCamera(const CameraConfig& config) : config_(config) {}

RealSenseCamera::~RealSenseCamera() {
    close();
}

void RealSenseCamera::open() {
    if (running_.load()) {
        return;
    }

    try {
        find_device();
        configure_pipeline();

        // Create fresh pipeline
        pipe_ = rs2::pipeline();
        profile_ = pipe_.start(rs_config_);

        configure_sensor_options();
        running_.store(true);
        sequence_id_ = 0;

        std::cout << "📹 RealSense " << config_.stream << " stream: " << config_.width << "x"
                  << config_.height << "@" << config_.fps << "fps" << std::endl;

    } catch (const rs2::error& e) {
        rs_config_ = rs2::config();
        throw PresenceError(ErrorKind::CameraUnavailable,
                            std::string("RealSense error: ") + e.what());
    }
}

FrameBox RealSenseCamera::grab() {
    if (!running_.load()) {
        throw PresenceError(ErrorKind::CameraUnavailable, "RealSense pipeline is not running");
    }

    try {
        rs2::frameset frames = pipe_.wait_for_frames(config_.grab_timeout_ms);
        rs2::video_frame frame = use_infrared() ? frames.get_infrared_frame(1)
                                                : frames.get_color_frame();
        if (!frame) {
            throw PresenceError(ErrorKind::CameraUnavailable, "RealSense frameset without video frame");
        }

        const int width = frame.get_width();
        const int height = frame.get_height();
        const int type = use_infrared() ? CV_8UC1 : CV_8UC3;
        cv::Mat view(height, width, type, const_cast<void*>(frame.get_data()),
                     static_cast<size_t>(frame.get_stride_in_bytes()));

        return FrameBox::from_mat(view, sequence_id_++, frame.get_timestamp());

    } catch (const rs2::error& e) {
        throw PresenceError(ErrorKind::CameraUnavailable,
                            std::string("RealSense capture error: ") + e.what());
    }
}

void RealSenseCamera::close() {
    if (!running_.load()) {
        return;
    }
    running_.store(false);

    try {
        pipe_.stop();
        std::cout << "📹 RealSense pipeline stopped" << std::endl;
    } catch (const rs2::error& e) {
        std::cerr << "⚠ Error stopping RealSense pipeline: " << e.what() << std::endl;
    }

    // Reset state for clean restart
    rs_config_ = rs2::config();
}

bool RealSenseCamera::is_open() const {
    return running_.load();
}

std::string RealSenseCamera::name() const {
    return "realsense:" + (config_.device_serial.empty() ? std::string("any") : config_.device_serial);
}

void RealSenseCamera::find_device() {
    rs2::context ctx;
    auto devices = ctx.query_devices();

    if (devices.size() == 0) {
        throw PresenceError(ErrorKind::CameraUnavailable, "No RealSense devices detected");
    }

    if (config_.device_serial.empty()) {
        return;
    }

    for (auto&& dev : devices) {
        if (!dev.supports(RS2_CAMERA_INFO_SERIAL_NUMBER)) continue;
        const char* serial = dev.get_info(RS2_CAMERA_INFO_SERIAL_NUMBER);
        if (serial && config_.device_serial == serial) {
            return;
        }
    }
    throw PresenceError(ErrorKind::CameraUnavailable,
                        "RealSense device " + config_.device_serial + " not found");
}

void RealSenseCamera::configure_pipeline() {
    if (use_infrared()) {
        // Left IR sensor (index 1), 8-bit grayscale
        rs_config_.enable_stream(RS2_STREAM_INFRARED, 1, config_.width, config_.height,
                                 RS2_FORMAT_Y8, config_.fps);
    } else {
        rs_config_.enable_stream(RS2_STREAM_COLOR, config_.width, config_.height,
                                 RS2_FORMAT_BGR8, config_.fps);
    }

    if (!config_.device_serial.empty()) {
        rs_config_.enable_device(config_.device_serial);
    }
}

void RealSenseCamera::configure_sensor_options() {
    try {
        auto device = profile_.get_device();

        for (auto& sensor : device.query_sensors()) {
            std::string sensor_name = sensor.get_info(RS2_CAMERA_INFO_NAME);
            const bool stereo = sensor_name.find("Stereo") != std::string::npos ||
                                sensor_name.find("Depth") != std::string::npos;
            const bool rgb = sensor_name.find("RGB") != std::string::npos;

            if (use_infrared() ? !stereo : !rgb) {
                continue;
            }

            if (use_infrared() && sensor.supports(RS2_OPTION_EMITTER_ENABLED)) {
                sensor.set_option(RS2_OPTION_EMITTER_ENABLED, 0);
            }

            if (config_.auto_exposure) {
                if (sensor.supports(RS2_OPTION_ENABLE_AUTO_EXPOSURE)) {
                    sensor.set_option(RS2_OPTION_ENABLE_AUTO_EXPOSURE, 1.0f);
                }
            } else {
                if (sensor.supports(RS2_OPTION_ENABLE_AUTO_EXPOSURE)) {
                    sensor.set_option(RS2_OPTION_ENABLE_AUTO_EXPOSURE, 0.0f);
                }
                if (sensor.supports(RS2_OPTION_EXPOSURE)) {
                    sensor.set_option(RS2_OPTION_EXPOSURE, config_.manual_exposure);
                }
                if (sensor.supports(RS2_OPTION_GAIN)) {
                    sensor.set_option(RS2_OPTION_GAIN, config_.manual_gain);
                }
            }
        }
    } catch (const rs2::error& e) {
        // Defaults still give a usable image
        std::cerr << "⚠ Error configuring RealSense sensor: " << e.what() << std::endl;
    }
}

// ============================================================================
// Factory and session
// ============================================================================

std::unique_ptr<Camera> create_camera(const CameraConfig& config) {
    if (config.backend == "realsense") {
        return std::make_unique<RealSenseCamera>(config);
    }
    if (config.backend == "opencv") {
        return std::make_unique<OpenCvCamera>(config);
    }
    throw PresenceError(ErrorKind::InvalidInput, "Unknown camera backend: " + config.backend);
}

CameraSession::CameraSession(std::unique_ptr<Camera> camera) : camera_(std::move(camera)) {
    if (!camera_) {
        throw PresenceError(ErrorKind::CameraUnavailable, "No camera configured");
    }
    camera_name_ = camera_->name();
    camera_->open();
}

CameraSession::~CameraSession() {
    release();
}

FrameBox CameraSession::grab() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!camera_ || !camera_->is_open()) {
        throw PresenceError(ErrorKind::CameraUnavailable, "Camera session already released");
    }
    return camera_->grab();
}

void CameraSession::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (camera_) {
        camera_->close();
        camera_.reset();
    }
}

bool CameraSession::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return camera_ && camera_->is_open();
}

} // namespace presence
