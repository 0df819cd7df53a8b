#pragma once

/**
 * @file LivenessVerifier.hpp
 * @brief Motion check followed by one randomly chosen challenge
 *
 *   IDLE -> MOTION_CHECK -> CHALLENGE_CHECK{kind} -> PASSED | FAILED
 */

#include "FaceTypes.hpp"
#include "FrameSampler.hpp"
#include "LivenessMath.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief Configuration for the liveness checks
 */
struct LivenessConfig {
    // Motion check (static photo rejection)
    int motion_frames = 8;
    int motion_interval_ms = 60;

    // Blink challenge
    int blink_frames = 12;
    int blink_interval_ms = 50;

    // Head-turn challenge
    int turn_frames = 15;
    int turn_interval_ms = 60;

    CheckThresholds thresholds;

    // Outcome scores
    float motion_fail_score = 0.2f;
    float challenge_fail_score = 0.4f;
    float pass_score_min = 0.7f;
    float pass_score_max = 1.0f;

    // "random": uniform in [pass_score_min, pass_score_max]
    // "margin": derived from how far the challenge cleared its threshold
    std::string score_mode = "random";

    // Single-frame presence check instead of motion + challenge (bench testing)
    bool quick_mode = false;
    int quick_pause_ms = 500;
    float quick_pass_score = 0.8f;
};

enum class LivenessState {
    IDLE,
    MOTION_CHECK,
    CHALLENGE_CHECK,
    PASSED,
    FAILED
};

const char* to_string(LivenessState state);

/**
 * @brief Per-attempt mutable state, owned by exactly one verification
 *
 * Holds the samples of the stage currently running and the drawn
 * challenge. Discarded when the attempt ends.
 */
struct LivenessSession {
    LivenessState state = LivenessState::IDLE;
    std::optional<ChallengeKind> challenge;

    // Samples of the current stage only
    std::vector<cv::Point2f> nose_track;
    std::vector<float> ear_track;
    int frames_requested = 0;

    std::optional<LivenessOutcome> outcome;

    void begin_stage(LivenessState next, int frames);
};

/**
 * @brief Uniform [0, 1) source for the challenge draw and the pass score
 */
using RandomSource = std::function<double()>;

/**
 * @brief Unpredictable per-attempt challenge selection
 */
class ChallengeSelector {
public:
    /**
     * @brief Seeded from std::random_device
     */
    ChallengeSelector();

    explicit ChallengeSelector(RandomSource random);

    /**
     * @brief Always return the same kind (tests, forced bench runs)
     */
    static ChallengeSelector fixed(ChallengeKind kind);

    ChallengeKind pick();

    /**
     * @brief Uniform value in [lo, hi]
     */
    float uniform(float lo, float hi);

private:
    RandomSource random_;
    std::optional<ChallengeKind> fixed_;
};

class LivenessVerifier {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    explicit LivenessVerifier(const LivenessConfig& config,
                              ChallengeSelector selector = ChallengeSelector());

    /**
     * @brief Run the whole state machine with a fresh session
     * @throws PresenceError(CameraUnavailable | Cancelled | ModelNotReady)
     */
    LivenessOutcome verify(FrameSampler& sampler);

    /**
     * @brief Run the state machine on a caller-owned session
     *
     * The session must be IDLE. On return it is PASSED or FAILED and holds
     * the outcome. Exceptions leave it in the stage that was running.
     */
    LivenessOutcome verify(FrameSampler& sampler, LivenessSession& session);

    /**
     * @brief MOTION_CHECK stage. Returns the failure outcome, or nullopt to advance.
     */
    std::optional<LivenessOutcome> run_motion_check(FrameSampler& sampler, LivenessSession& session);

    /**
     * @brief Draw the challenge and enter CHALLENGE_CHECK
     */
    ChallengeKind enter_challenge(LivenessSession& session);

    /**
     * @brief CHALLENGE_CHECK stage. Always concludes the session.
     */
    LivenessOutcome run_challenge(FrameSampler& sampler, LivenessSession& session);

    void set_status_callback(StatusCallback callback);

    const LivenessConfig& get_config() const { return config_; }

private:
    LivenessConfig config_;
    ChallengeSelector selector_;

    StatusCallback status_callback_;
    std::mutex callback_mutex_;
    std::mutex selector_mutex_;

    LivenessOutcome run_quick_check(FrameSampler& sampler, LivenessSession& session);
    LivenessOutcome run_blink(FrameSampler& sampler, LivenessSession& session);
    LivenessOutcome run_head_turn(FrameSampler& sampler, LivenessSession& session, ChallengeKind kind);

    LivenessOutcome conclude(LivenessSession& session, LivenessOutcome outcome);
    LivenessOutcome fail(LivenessSession& session, float score, ErrorKind kind, const std::string& reason,
                         std::optional<float> measured = std::nullopt);
    float pass_score(const CheckResult& challenge_result);

    void report_status(const std::string& status);
};

} // namespace presence
