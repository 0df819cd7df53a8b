#pragma once

/**
 * @file AttendanceController.hpp
 * @brief Drives one attendance or registration attempt end to end
 *
 *   IDLE -> VERIFYING -> CAPTURING -> MATCHING -> PENDING_CONFIRMATION -> RECORDED -> IDLE
 *   IDLE -> ENROLLING -> IDLE
 *
 * Liveness failure and no-match return to IDLE. Errors release the camera,
 * return to IDLE and are rethrown.
 */

#include "Camera.hpp"
#include "ConfirmationGate.hpp"
#include "DescriptorSource.hpp"
#include "EnrollmentAggregator.hpp"
#include "FrameSampler.hpp"
#include "LivenessVerifier.hpp"
#include "MatchGateway.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace presence {

enum class AttendanceState {
    IDLE,
    VERIFYING,
    CAPTURING,
    MATCHING,
    PENDING_CONFIRMATION,
    RECORDED,
    ENROLLING
};

const char* to_string(AttendanceState state);

/**
 * @brief What mark_attendance() ended with, when it did not throw
 */
struct AttemptResult {
    enum class Status {
        PENDING_CONFIRMATION,  // candidate held, waiting for confirm()/reject()
        LIVENESS_FAILED,
        NO_MATCH
    };

    Status status = Status::LIVENESS_FAILED;
    LivenessOutcome liveness;
    std::optional<MatchCandidate> candidate;
    std::string message;
};

class AttendanceController {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using RecordCallback = ConfirmationGate::RecordCallback;

    AttendanceController(CameraFactory camera_factory,
                         DescriptorSource& source,
                         MatchGateway& gateway,
                         EnrollmentStore& store,
                         const LivenessConfig& liveness_config,
                         const EnrollmentConfig& enrollment_config,
                         ChallengeSelector selector = ChallengeSelector(),
                         Sleeper sleeper = default_sleeper(),
                         ConfirmationGate::Clock clock = ConfirmationGate::Clock());

    /**
     * @brief Liveness, descriptor capture and match for the person in front of the camera
     * @throws PresenceError(AttemptInProgress | ModelNotReady | CameraUnavailable |
     *         TrackingLost | Cancelled | Gateway*)
     */
    AttemptResult mark_attendance();

    /**
     * @brief Record attendance for the pending candidate
     * @throws PresenceError(NoPendingCandidate)
     */
    AttendanceRecord confirm();

    /**
     * @brief Discard the pending candidate; nothing is recorded
     * @throws PresenceError(NoPendingCandidate)
     */
    void reject();

    /**
     * @brief Capture, average and register a new identity
     * @throws PresenceError(InvalidInput | AttemptInProgress | ModelNotReady |
     *         CameraUnavailable | TrackingLost | Cancelled | Gateway*)
     */
    void register_identity(const std::string& identity_id, const std::string& display_name);

    /**
     * @brief Abort the running attempt (safe from a signal thread)
     */
    void cancel();

    AttendanceState state() const { return state_.load(); }
    std::optional<PendingCandidate> pending() const { return gate_.pending(); }
    std::string last_error() const;

    void set_status_callback(StatusCallback callback);
    void set_record_callback(RecordCallback callback);

private:
    CameraFactory camera_factory_;
    DescriptorSource& source_;
    MatchGateway& gateway_;
    EnrollmentStore& store_;

    LivenessVerifier verifier_;
    EnrollmentAggregator aggregator_;
    ConfirmationGate gate_;
    Sleeper sleeper_;
    int camera_warmup_ms_;

    std::atomic<AttendanceState> state_{AttendanceState::IDLE};
    std::atomic<bool> attempt_active_{false};

    std::shared_ptr<CancelToken> cancel_;
    mutable std::mutex cancel_mutex_;

    std::string last_error_;
    mutable std::mutex error_mutex_;

    StatusCallback status_callback_;
    std::mutex callback_mutex_;

    /**
     * @brief Marks one attempt active for its scope
     */
    class AttemptGuard {
    public:
        explicit AttemptGuard(AttendanceController& owner);
        ~AttemptGuard();

        const std::shared_ptr<CancelToken>& token() const { return token_; }

    private:
        AttendanceController& owner_;
        std::shared_ptr<CancelToken> token_;
    };

    void set_state(AttendanceState new_state);
    void report_status(const std::string& status);
    void handle_attempt_error(const std::exception& e);
    void ensure_model_ready() const;
    std::unique_ptr<Camera> make_camera();
};

} // namespace presence
