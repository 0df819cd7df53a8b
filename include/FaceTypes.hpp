#pragma once

/**
 * @file FaceTypes.hpp
 * @brief Value types shared by the liveness, enrollment and matching stages
 */

#include "PresenceError.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief Fixed-length face appearance vector (128 floats for SFace)
 *
 * Identifies how a face looks, not who it is. Identity is only resolved
 * by the Match Gateway.
 */
using Descriptor = std::vector<float>;

/**
 * @brief Landmark groups used by the liveness checks
 *
 * Eye points follow the iBUG anatomical order: index 0 and 3 are the
 * corners, 1/2 the upper lid, 4/5 the lower lid. Valid only for the
 * frame that produced it.
 */
struct LandmarkSet {
    static constexpr size_t NOSE_TIP_INDEX = 3;

    std::array<cv::Point2f, 6> left_eye;
    std::array<cv::Point2f, 6> right_eye;
    std::vector<cv::Point2f> nose;  // >= 4 points, tip at NOSE_TIP_INDEX

    bool has_nose_tip() const { return nose.size() > NOSE_TIP_INDEX; }
    cv::Point2f nose_tip() const { return nose.at(NOSE_TIP_INDEX); }
};

/**
 * @brief What the Descriptor Source returns for one frame with a face
 */
struct FaceDetection {
    cv::Rect bbox;
    float confidence = 0.0f;
    LandmarkSet landmarks;
    std::optional<Descriptor> descriptor;  // empty if feature extraction failed
};

/**
 * @brief One tick of the Frame Sampler
 *
 * Absent members mean "no face on this frame", which checks tolerate.
 */
struct FaceSample {
    uint64_t sequence_id = 0;
    std::optional<LandmarkSet> landmarks;
    std::optional<Descriptor> descriptor;

    bool has_face() const { return landmarks.has_value(); }
};

enum class ChallengeKind {
    BLINK,
    TURN_LEFT,
    TURN_RIGHT
};

const char* to_string(ChallengeKind kind);

/**
 * @brief Result of one liveness attempt
 *
 * The score is advisory confidence for the matching service; pass/fail
 * is decided by the verifier state machine only.
 */
struct LivenessOutcome {
    bool passed = false;
    float score = 0.0f;
    std::optional<std::string> reason;
    std::optional<ChallengeKind> challenge;
    std::optional<ErrorKind> failure;  // TrackingLost, MotionCheckFailed or ChallengeFailed
    std::optional<float> measured;     // px of motion or turn, or EAR range, of the deciding check
};

/**
 * @brief Candidate identity returned by the Match Gateway
 */
struct MatchCandidate {
    std::string identity_id;
    std::string display_name;
    float confidence = 0.0f;  // [0, 1]
    float distance = 0.0f;    // >= 0
};

/**
 * @brief Gateway answer: a candidate or an explicit no-match
 */
struct MatchResult {
    std::optional<MatchCandidate> candidate;
    std::string no_match_reason;

    bool matched() const { return candidate.has_value(); }
};

/**
 * @brief Finalized attendance event, built only from a confirmed snapshot
 */
struct AttendanceRecord {
    std::string identity_id;
    std::string display_name;
    float confidence = 0.0f;
    float distance = 0.0f;
    float liveness_score = 0.0f;
    std::string recorded_at;  // ISO-8601 local time
};

struct EnrollmentRequest {
    std::string identity_id;
    std::string display_name;
    Descriptor descriptor;
};

} // namespace presence
