#pragma once

/**
 * @file ConfirmationGate.hpp
 * @brief Operator accept/reject between a match and a recorded attendance
 */

#include "FaceTypes.hpp"

#include <functional>
#include <mutex>
#include <optional>

namespace presence {

enum class GateState {
    IDLE,
    PENDING,
    CONFIRMED
};

const char* to_string(GateState state);

/**
 * @brief Candidate snapshot held until the operator decides
 */
struct PendingCandidate {
    MatchCandidate candidate;
    LivenessOutcome liveness;
};

class ConfirmationGate {
public:
    using RecordCallback = std::function<void(const AttendanceRecord&)>;
    using Clock = std::function<std::string()>;

    /**
     * @param clock Source of recorded_at; defaults to local ISO-8601 time
     */
    explicit ConfirmationGate(Clock clock = Clock());

    /**
     * @brief Hold a matched candidate for confirmation
     * @throws PresenceError(InvalidInput) if the liveness outcome did not pass
     * @throws PresenceError(AttemptInProgress) if a candidate is already pending
     */
    void hold(const MatchCandidate& candidate, const LivenessOutcome& liveness);

    /**
     * @brief Finalize the held snapshot into an attendance record
     *
     * Never re-queries the gateway. The record callback runs outside the
     * gate's lock and before the gate is cleared; if it throws, the
     * candidate stays pending.
     * @throws PresenceError(NoPendingCandidate)
     */
    AttendanceRecord confirm();

    /**
     * @brief Drop the pending candidate and its liveness result
     * @throws PresenceError(NoPendingCandidate)
     */
    void reject();

    /**
     * @brief Forget any pending candidate without a decision (cancellation)
     */
    void reset();

    GateState state() const;
    std::optional<PendingCandidate> pending() const;

    void set_record_callback(RecordCallback callback);

private:
    Clock clock_;
    GateState state_ = GateState::IDLE;
    std::optional<PendingCandidate> pending_;
    RecordCallback record_callback_;
    mutable std::mutex mutex_;
};

} // namespace presence
