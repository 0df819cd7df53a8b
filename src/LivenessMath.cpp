#include "LivenessMath.hpp"
#include "PresenceError.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace presence {

namespace {

float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

std::string format_px(float value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "px";
    return ss.str();
}

} // namespace

float euclidean_distance(const cv::Point2f& a, const cv::Point2f& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

float eye_aspect_ratio(const std::array<cv::Point2f, 6>& eye) {
    const float v1 = euclidean_distance(eye[2], eye[4]);
    const float v2 = euclidean_distance(eye[3], eye[5]);
    const float h = euclidean_distance(eye[1], eye[0]);

    if (h <= 0.0f) {
        return 0.0f;
    }
    return (v1 + v2) / (2.0f * h);
}

float average_eye_aspect_ratio(const LandmarkSet& landmarks) {
    return (eye_aspect_ratio(landmarks.left_eye) + eye_aspect_ratio(landmarks.right_eye)) / 2.0f;
}

float mean_consecutive_displacement(const std::vector<cv::Point2f>& positions) {
    if (positions.size() < 2) {
        return 0.0f;
    }

    float total = 0.0f;
    for (size_t i = 1; i < positions.size(); ++i) {
        total += euclidean_distance(positions[i], positions[i - 1]);
    }
    return total / static_cast<float>(positions.size() - 1);
}

CheckResult evaluate_motion(const std::vector<cv::Point2f>& nose_positions,
                            const CheckThresholds& thresholds) {
    CheckResult result;
    result.measured = mean_consecutive_displacement(nose_positions);

    if (result.measured < thresholds.motion_min_mean_px) {
        result.reason = "static image detected (mean motion " + format_px(result.measured) + ")";
        return result;
    }

    result.passed = true;
    result.margin = clamp01((result.measured - thresholds.motion_min_mean_px) / thresholds.motion_min_mean_px);
    return result;
}

CheckResult evaluate_blink(const std::vector<float>& ear_values, const CheckThresholds& thresholds) {
    CheckResult result;
    if (ear_values.empty()) {
        result.reason = "no blink detected";
        return result;
    }

    auto [min_it, max_it] = std::minmax_element(ear_values.begin(), ear_values.end());
    const float min_ear = *min_it;
    const float range = *max_it - *min_it;
    result.measured = range;

    // An eye closure drops the EAR low AND swings it; noise does neither
    if (min_ear < thresholds.blink_max_min_ear && range > thresholds.blink_min_ear_range) {
        result.passed = true;
        result.margin = clamp01((range - thresholds.blink_min_ear_range) / thresholds.blink_min_ear_range);
        return result;
    }

    result.reason = "no blink detected";
    return result;
}

CheckResult evaluate_head_turn(const std::vector<float>& nose_x, ChallengeKind kind,
                               const CheckThresholds& thresholds) {
    if (kind == ChallengeKind::BLINK) {
        throw PresenceError(ErrorKind::InvalidInput, "Head turn evaluated with blink challenge");
    }

    CheckResult result;
    const bool left = (kind == ChallengeKind::TURN_LEFT);
    const char* direction = left ? "left" : "right";

    if (nose_x.size() < 2) {
        result.reason = std::string("insufficient ") + direction + " turn (moved " + format_px(0.0f) + ")";
        return result;
    }

    const float displacement = nose_x.back() - nose_x.front();
    result.measured = displacement;

    const bool turned = left ? (displacement < -thresholds.turn_min_px)
                             : (displacement > thresholds.turn_min_px);
    if (turned) {
        result.passed = true;
        result.margin = clamp01((std::fabs(displacement) - thresholds.turn_min_px) / thresholds.turn_min_px);
        return result;
    }

    result.reason = std::string("insufficient ") + direction + " turn (moved " + format_px(displacement) + ")";
    return result;
}

} // namespace presence
