#include "LivenessVerifier.hpp"
#include "PresenceError.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace presence {

const char* to_string(LivenessState state) {
    switch (state) {
        case LivenessState::IDLE:            return "IDLE";
        case LivenessState::MOTION_CHECK:    return "MOTION_CHECK";
        case LivenessState::CHALLENGE_CHECK: return "CHALLENGE_CHECK";
        case LivenessState::PASSED:          return "PASSED";
        case LivenessState::FAILED:          return "FAILED";
    }
    return "UNKNOWN";
}

void LivenessSession::begin_stage(LivenessState next, int frames) {
    state = next;
    nose_track.clear();
    ear_track.clear();
    frames_requested = frames;
}

// ============================================================================
// ChallengeSelector
// ============================================================================

ChallengeSelector::ChallengeSelector() {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    random_ = [engine]() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(*engine);
    };
}

ChallengeSelector::ChallengeSelector(RandomSource random) : random_(std::move(random)) {
    if (!random_) {
        *this = ChallengeSelector();
    }
}

ChallengeSelector ChallengeSelector::fixed(ChallengeKind kind) {
    ChallengeSelector selector;
    selector.fixed_ = kind;
    return selector;
}

ChallengeKind ChallengeSelector::pick() {
    if (fixed_) {
        return *fixed_;
    }

    static const ChallengeKind kinds[] = {
        ChallengeKind::BLINK, ChallengeKind::TURN_LEFT, ChallengeKind::TURN_RIGHT
    };
    const double r = random_();
    const int index = std::min(2, std::max(0, static_cast<int>(r * 3.0)));
    return kinds[index];
}

float ChallengeSelector::uniform(float lo, float hi) {
    const double r = std::min(1.0, std::max(0.0, random_()));
    return lo + static_cast<float>(r) * (hi - lo);
}

// ============================================================================
// LivenessVerifier
// ============================================================================

LivenessVerifier::LivenessVerifier(const LivenessConfig& config, ChallengeSelector selector)
    : config_(config), selector_(std::move(selector)) {
    if (config_.quick_mode) {
        std::cout << "⚠ [Liveness] Quick mode enabled: single-frame presence check only" << std::endl;
    }
}

LivenessOutcome LivenessVerifier::verify(FrameSampler& sampler) {
    LivenessSession session;
    return verify(sampler, session);
}

LivenessOutcome LivenessVerifier::verify(FrameSampler& sampler, LivenessSession& session) {
    if (session.state != LivenessState::IDLE) {
        throw PresenceError(ErrorKind::InvalidInput,
                            std::string("Liveness session is not idle (") + to_string(session.state) + ")");
    }

    if (config_.quick_mode) {
        return run_quick_check(sampler, session);
    }

    if (auto failure = run_motion_check(sampler, session)) {
        return *failure;
    }

    enter_challenge(session);
    return run_challenge(sampler, session);
}

std::optional<LivenessOutcome> LivenessVerifier::run_motion_check(FrameSampler& sampler,
                                                                  LivenessSession& session) {
    session.begin_stage(LivenessState::MOTION_CHECK, config_.motion_frames);
    report_status("🔍 Checking for liveness...");

    auto samples = collect_with_tolerance<cv::Point2f>(
        sampler, config_.motion_frames, config_.motion_interval_ms,
        [](const FaceSample& sample) -> std::optional<cv::Point2f> {
            if (!sample.landmarks->has_nose_tip()) return std::nullopt;
            return sample.landmarks->nose_tip();
        });
    session.nose_track = samples.values;

    std::cout << "[Liveness] Motion check: " << samples.valid() << "/" << samples.frames_requested
              << " frames tracked" << std::endl;

    if (!samples.enough()) {
        return fail(session, config_.motion_fail_score, ErrorKind::TrackingLost,
                    "lost tracking during motion check");
    }

    CheckResult motion = evaluate_motion(session.nose_track, config_.thresholds);
    std::cout << "[Liveness] Mean motion: " << std::fixed << std::setprecision(2)
              << motion.measured << "px" << std::defaultfloat << std::endl;

    if (!motion.passed) {
        return fail(session, config_.motion_fail_score, ErrorKind::MotionCheckFailed, motion.reason,
                    motion.measured);
    }
    return std::nullopt;
}

ChallengeKind LivenessVerifier::enter_challenge(LivenessSession& session) {
    ChallengeKind kind;
    {
        std::lock_guard<std::mutex> lock(selector_mutex_);
        kind = selector_.pick();
    }
    session.challenge = kind;
    session.begin_stage(LivenessState::CHALLENGE_CHECK,
                        kind == ChallengeKind::BLINK ? config_.blink_frames : config_.turn_frames);

    std::cout << "[Liveness] Running challenge: " << to_string(kind) << std::endl;
    return kind;
}

LivenessOutcome LivenessVerifier::run_challenge(FrameSampler& sampler, LivenessSession& session) {
    if (session.state != LivenessState::CHALLENGE_CHECK || !session.challenge) {
        throw PresenceError(ErrorKind::InvalidInput, "Challenge stage entered without a drawn challenge");
    }

    if (*session.challenge == ChallengeKind::BLINK) {
        return run_blink(sampler, session);
    }
    return run_head_turn(sampler, session, *session.challenge);
}

LivenessOutcome LivenessVerifier::run_blink(FrameSampler& sampler, LivenessSession& session) {
    report_status("👁️ Please blink naturally...");

    auto samples = collect_with_tolerance<float>(
        sampler, config_.blink_frames, config_.blink_interval_ms,
        [](const FaceSample& sample) -> std::optional<float> {
            return average_eye_aspect_ratio(*sample.landmarks);
        });
    session.ear_track = samples.values;

    if (!samples.enough()) {
        return fail(session, config_.challenge_fail_score, ErrorKind::TrackingLost,
                    "lost tracking during blink check");
    }

    CheckResult blink = evaluate_blink(session.ear_track, config_.thresholds);
    std::cout << "[Liveness] Blink: samples=" << samples.valid() << " range=" << blink.measured << std::endl;

    if (!blink.passed) {
        return fail(session, config_.challenge_fail_score, ErrorKind::ChallengeFailed, blink.reason,
                    blink.measured);
    }

    LivenessOutcome outcome;
    outcome.passed = true;
    outcome.score = pass_score(blink);
    outcome.measured = blink.measured;
    return conclude(session, outcome);
}

LivenessOutcome LivenessVerifier::run_head_turn(FrameSampler& sampler, LivenessSession& session,
                                                ChallengeKind kind) {
    const bool left = (kind == ChallengeKind::TURN_LEFT);
    report_status(std::string("👤 Please turn your head ") + (left ? "left" : "right") + "...");

    auto samples = collect_with_tolerance<cv::Point2f>(
        sampler, config_.turn_frames, config_.turn_interval_ms,
        [](const FaceSample& sample) -> std::optional<cv::Point2f> {
            if (!sample.landmarks->has_nose_tip()) return std::nullopt;
            return sample.landmarks->nose_tip();
        });
    session.nose_track = samples.values;

    if (!samples.enough()) {
        return fail(session, config_.challenge_fail_score, ErrorKind::TrackingLost,
                    "lost tracking during head turn");
    }

    std::vector<float> nose_x;
    nose_x.reserve(session.nose_track.size());
    for (const auto& p : session.nose_track) {
        nose_x.push_back(p.x);
    }

    CheckResult turn = evaluate_head_turn(nose_x, kind, config_.thresholds);
    std::cout << "[Liveness] Head turn " << to_string(kind) << ": moved " << turn.measured
              << "px over " << samples.valid() << " frames" << std::endl;

    if (!turn.passed) {
        return fail(session, config_.challenge_fail_score, ErrorKind::ChallengeFailed, turn.reason,
                    turn.measured);
    }

    LivenessOutcome outcome;
    outcome.passed = true;
    outcome.score = pass_score(turn);
    outcome.measured = turn.measured;
    return conclude(session, outcome);
}

LivenessOutcome LivenessVerifier::run_quick_check(FrameSampler& sampler, LivenessSession& session) {
    report_status("⚡ Quick check (testing mode)...");
    session.begin_stage(LivenessState::MOTION_CHECK, 1);

    sampler.pause(config_.quick_pause_ms);
    FaceSample sample = sampler.sample_once();

    if (!sample.has_face()) {
        return fail(session, 0.0f, ErrorKind::TrackingLost, "no face detected");
    }

    LivenessOutcome outcome;
    outcome.passed = true;
    outcome.score = config_.quick_pass_score;
    return conclude(session, outcome);
}

LivenessOutcome LivenessVerifier::conclude(LivenessSession& session, LivenessOutcome outcome) {
    outcome.challenge = session.challenge;
    session.state = outcome.passed ? LivenessState::PASSED : LivenessState::FAILED;
    session.outcome = outcome;

    if (outcome.passed) {
        std::cout << "✅ [Liveness] Passed, score " << std::fixed << std::setprecision(2)
                  << outcome.score << std::defaultfloat << std::endl;
    } else {
        std::cout << "❌ [Liveness] Failed: " << outcome.reason.value_or("unknown") << std::endl;
    }
    return outcome;
}

LivenessOutcome LivenessVerifier::fail(LivenessSession& session, float score, ErrorKind kind,
                                       const std::string& reason, std::optional<float> measured) {
    LivenessOutcome outcome;
    outcome.passed = false;
    outcome.score = score;
    outcome.reason = reason;
    outcome.failure = kind;
    outcome.measured = measured;
    return conclude(session, outcome);
}

float LivenessVerifier::pass_score(const CheckResult& challenge_result) {
    const float lo = config_.pass_score_min;
    const float hi = config_.pass_score_max;

    if (config_.score_mode == "margin") {
        return lo + (hi - lo) * challenge_result.margin;
    }

    std::lock_guard<std::mutex> lock(selector_mutex_);
    return selector_.uniform(lo, hi);
}

void LivenessVerifier::set_status_callback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void LivenessVerifier::report_status(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    std::cout << "[Liveness] " << status << std::endl;
    if (callback) {
        callback(status);
    }
}

} // namespace presence
