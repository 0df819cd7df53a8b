#pragma once

/**
 * @file FrameBox.hpp
 * @brief One captured camera image
 *
 * Owned by the sampler tick that grabbed it and dropped right after the
 * Descriptor Source has looked at it.
 */

#include <opencv2/core.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace presence {

class FrameBox {
public:
    uint64_t sequence_id = 0;

    // Timestamp (hardware or system time in milliseconds)
    double timestamp = 0.0;

    // Pixel data, row-major, no padding. 1 channel = Y8 (IR), 3 channels = BGR
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;

    FrameBox() = default;

    /**
     * @brief Copy pixels out of an OpenCV image
     */
    static FrameBox from_mat(const cv::Mat& image, uint64_t sequence_id, double timestamp);

    /**
     * @brief Get frame dimensions
     */
    std::pair<int, int> get_dimensions() const { return {width, height}; }

    /**
     * @brief Check if this FrameBox has valid frame data
     */
    bool is_valid() const;

    /**
     * @brief View the pixels as an OpenCV Mat (no copy)
     */
    cv::Mat to_mat() const;

    /**
     * @brief Image converted to 3-channel BGR (the models expect color input)
     */
    cv::Mat to_bgr() const;
};

} // namespace presence
