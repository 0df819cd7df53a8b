#include "ConfirmationGate.hpp"
#include "PresenceError.hpp"
#include "Utils.hpp"

#include <iostream>

namespace presence {

const char* to_string(GateState state) {
    switch (state) {
        case GateState::IDLE:      return "IDLE";
        case GateState::PENDING:   return "PENDING";
        case GateState::CONFIRMED: return "CONFIRMED";
    }
    return "UNKNOWN";
}

ConfirmationGate::ConfirmationGate(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return utils::iso_timestamp(); };
    }
}

void ConfirmationGate::hold(const MatchCandidate& candidate, const LivenessOutcome& liveness) {
    if (!liveness.passed) {
        throw PresenceError(ErrorKind::InvalidInput, "Cannot hold a candidate without a passed liveness check");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_) {
        throw PresenceError(ErrorKind::AttemptInProgress,
                            "Candidate " + pending_->candidate.identity_id + " is still awaiting confirmation");
    }

    pending_ = PendingCandidate{candidate, liveness};
    state_ = GateState::PENDING;
    std::cout << "[Gate] Pending: " << candidate.display_name << " (" << candidate.identity_id
              << "), confidence " << candidate.confidence << std::endl;
}

AttendanceRecord ConfirmationGate::confirm() {
    AttendanceRecord record;
    RecordCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) {
            throw PresenceError(ErrorKind::NoPendingCandidate, "Nothing to confirm");
        }

        record.identity_id = pending_->candidate.identity_id;
        record.display_name = pending_->candidate.display_name;
        record.confidence = pending_->candidate.confidence;
        record.distance = pending_->candidate.distance;
        record.liveness_score = pending_->liveness.score;
        record.recorded_at = clock_();
        callback = record_callback_;
    }

    // Runs unlocked so the sink may query the gate
    if (callback) {
        callback(record);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ && pending_->candidate.identity_id == record.identity_id) {
            pending_.reset();
            state_ = GateState::CONFIRMED;
        }
    }
    std::cout << "✅ [Gate] Attendance confirmed for " << record.display_name << " at "
              << record.recorded_at << std::endl;
    return record;
}

void ConfirmationGate::reject() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) {
        throw PresenceError(ErrorKind::NoPendingCandidate, "Nothing to reject");
    }

    std::cout << "[Gate] Rejected " << pending_->candidate.identity_id << std::endl;
    pending_.reset();
    state_ = GateState::IDLE;
}

void ConfirmationGate::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.reset();
    state_ = GateState::IDLE;
}

GateState ConfirmationGate::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<PendingCandidate> ConfirmationGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

void ConfirmationGate::set_record_callback(RecordCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_callback_ = std::move(callback);
}

} // namespace presence
