#pragma once

/**
 * @file LivenessMath.hpp
 * @brief Pure signal analysis used by the liveness checks
 *
 * No state, no I/O. Every function here is safe to call from any thread.
 */

#include "FaceTypes.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief Verdict of one check on its collected samples
 */
struct CheckResult {
    bool passed = false;
    std::string reason;
    float measured = 0.0f;  // mean displacement, EAR range or net turn, per check
    float margin = 0.0f;    // relative excess over the threshold, clamped to [0, 1]
};

/**
 * @brief Thresholds for the three checks
 */
struct CheckThresholds {
    float motion_min_mean_px = 3.0f;
    float blink_max_min_ear = 0.25f;
    float blink_min_ear_range = 0.12f;
    float turn_min_px = 12.0f;
};

float euclidean_distance(const cv::Point2f& a, const cv::Point2f& b);

/**
 * @brief Eye-Aspect-Ratio of one eye
 *
 * (|p2-p4| + |p3-p5|) / (2 |p1-p0|). Dimensionless, so scaling all points
 * by a positive factor leaves it unchanged. Returns 0 for a degenerate eye
 * (coincident corner points).
 */
float eye_aspect_ratio(const std::array<cv::Point2f, 6>& eye);

/**
 * @brief Mean of the left and right eye EAR
 */
float average_eye_aspect_ratio(const LandmarkSet& landmarks);

/**
 * @brief Mean Euclidean distance between consecutive positions
 *
 * Returns 0 with fewer than two positions.
 */
float mean_consecutive_displacement(const std::vector<cv::Point2f>& positions);

/**
 * @brief Static-image rejection on a nose-tip track
 */
CheckResult evaluate_motion(const std::vector<cv::Point2f>& nose_positions,
                            const CheckThresholds& thresholds = CheckThresholds());

/**
 * @brief Blink = min EAR below threshold AND EAR range above threshold
 */
CheckResult evaluate_blink(const std::vector<float>& ear_values,
                           const CheckThresholds& thresholds = CheckThresholds());

/**
 * @brief Net horizontal nose displacement (last - first) against the direction
 *
 * turnLeft needs displacement < -threshold, turnRight > +threshold.
 * kind must be TURN_LEFT or TURN_RIGHT.
 */
CheckResult evaluate_head_turn(const std::vector<float>& nose_x, ChallengeKind kind,
                               const CheckThresholds& thresholds = CheckThresholds());

} // namespace presence
