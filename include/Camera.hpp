#pragma once

/**
 * @file Camera.hpp
 * @brief Camera backends and the per-attempt camera session
 *
 * A camera is an exclusively-owned resource: exactly one CameraSession
 * holds it open for the duration of an attempt and stops it on every
 * exit path.
 */

#include "FrameBox.hpp"

#include <librealsense2/rs.hpp>
#include <opencv2/videoio.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace presence {

/**
 * @brief Camera configuration
 */
struct CameraConfig {
    std::string backend = "opencv";  // "opencv" or "realsense"

    // OpenCV backend: V4L2 device index
    int device_index = 0;

    // RealSense backend: empty = use any device
    std::string device_serial = "";
    std::string stream = "color";    // "color" or "infrared"

    int width = 640;
    int height = 480;
    int fps = 30;

    // Sensor options (RealSense only)
    bool auto_exposure = true;
    float manual_exposure = 8000.0f;
    float manual_gain = 32.0f;

    int grab_timeout_ms = 1000;
};

/**
 * @brief Abstract camera interface
 */
class Camera {
public:
    virtual ~Camera() = default;

    /**
     * @brief Acquire the device and start streaming
     * @throws PresenceError(CameraUnavailable)
     */
    virtual void open() = 0;

    /**
     * @brief Grab the most recent frame
     * @throws PresenceError(CameraUnavailable) if no frame can be read
     */
    virtual FrameBox grab() = 0;

    /**
     * @brief Stop streaming and release the device. Safe to call twice.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief USB / V4L2 webcam through cv::VideoCapture
 */
class OpenCvCamera : public Camera {
public:
    explicit OpenCvCamera(const CameraConfig& config);
    ~OpenCvCamera() override;

    void open() override;
    FrameBox grab() override;
    void close() override;
    bool is_open() const override;
    std::string name() const override;

private:
    CameraConfig config_;
    cv::VideoCapture capture_;
    uint64_t sequence_id_ = 0;
};

/**
 * @brief Intel RealSense capture of one video stream
 *
 * Color stream (BGR8) or left IR stream (Y8). For IR the laser emitter is
 * disabled so the image is passive IR.
 */
class RealSenseCamera : public Camera {
public:
    explicit RealSenseCamera(const CameraConfig& config);
    ~RealSenseCamera() override;

    void open() override;
    FrameBox grab() override;
    void close() override;
    bool is_open() const override;
    std::string name() const override;

private:
    CameraConfig config_;

    rs2::pipeline pipe_;
    rs2::config rs_config_;
    rs2::pipeline_profile profile_;

    std::atomic<bool> running_{false};
    uint64_t sequence_id_ = 0;

    bool use_infrared() const { return config_.stream == "infrared"; }

    /**
     * @brief Make sure a device is attached (and the requested serial exists)
     */
    void find_device();

    void configure_pipeline();
    void configure_sensor_options();
};

/**
 * @brief Create the backend named in the configuration
 */
std::unique_ptr<Camera> create_camera(const CameraConfig& config);

using CameraFactory = std::function<std::unique_ptr<Camera>()>;

/**
 * @brief RAII owner of one opened camera for one attempt
 *
 * Opens in the constructor, closes in the destructor, so the camera is
 * released on pass, fail, error and cancellation alike.
 */
class CameraSession {
public:
    explicit CameraSession(std::unique_ptr<Camera> camera);
    ~CameraSession();

    CameraSession(const CameraSession&) = delete;
    CameraSession& operator=(const CameraSession&) = delete;

    FrameBox grab();

    /**
     * @brief Release the camera early (e.g. before a network call)
     */
    void release();

    bool is_open() const;
    const std::string& camera_name() const { return camera_name_; }

private:
    std::unique_ptr<Camera> camera_;
    std::string camera_name_;
    mutable std::mutex mutex_;
};

} // namespace presence
