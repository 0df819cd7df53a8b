#include "FrameBox.hpp"

#include <opencv2/imgproc.hpp>

namespace presence {

FrameBox FrameBox::from_mat(const cv::Mat& image, uint64_t sequence_id, double timestamp) {
    FrameBox fb;
    fb.sequence_id = sequence_id;
    fb.timestamp = timestamp;

    if (image.empty()) {
        return fb;
    }

    cv::Mat packed = image.isContinuous() ? image : image.clone();
    fb.width = packed.cols;
    fb.height = packed.rows;
    fb.channels = packed.channels();

    const size_t size = packed.total() * packed.elemSize();
    fb.pixels.assign(packed.data, packed.data + size);
    return fb;
}

bool FrameBox::is_valid() const {
    if (width <= 0 || height <= 0) return false;
    if (channels != 1 && channels != 3) return false;
    return pixels.size() == static_cast<size_t>(width) * height * channels;
}

cv::Mat FrameBox::to_mat() const {
    if (!is_valid()) {
        return cv::Mat();
    }
    const int type = (channels == 1) ? CV_8UC1 : CV_8UC3;
    return cv::Mat(height, width, type, const_cast<uint8_t*>(pixels.data()));
}

cv::Mat FrameBox::to_bgr() const {
    cv::Mat mat = to_mat();
    if (mat.empty() || channels == 3) {
        return mat;
    }
    // Simple grayscale->BGR conversion for IR frames
    cv::Mat bgr;
    cv::cvtColor(mat, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

} // namespace presence
