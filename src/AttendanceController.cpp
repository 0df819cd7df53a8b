/**
 * @file AttendanceController.cpp
 * @brief Attempt orchestration: camera session, liveness, match, confirmation
 */

#include "AttendanceController.hpp"
#include "PresenceError.hpp"

#include <iostream>

namespace presence {

const char* to_string(AttendanceState state) {
    switch (state) {
        case AttendanceState::IDLE:                 return "IDLE";
        case AttendanceState::VERIFYING:            return "VERIFYING";
        case AttendanceState::CAPTURING:            return "CAPTURING";
        case AttendanceState::MATCHING:             return "MATCHING";
        case AttendanceState::PENDING_CONFIRMATION: return "PENDING_CONFIRMATION";
        case AttendanceState::RECORDED:             return "RECORDED";
        case AttendanceState::ENROLLING:            return "ENROLLING";
    }
    return "UNKNOWN";
}

// ============================================================================
// AttemptGuard
// ============================================================================

AttendanceController::AttemptGuard::AttemptGuard(AttendanceController& owner) : owner_(owner) {
    if (owner_.attempt_active_.exchange(true)) {
        throw PresenceError(ErrorKind::AttemptInProgress, "Another attempt is using the camera");
    }
    token_ = std::make_shared<CancelToken>();

    std::lock_guard<std::mutex> lock(owner_.cancel_mutex_);
    owner_.cancel_ = token_;
}

AttendanceController::AttemptGuard::~AttemptGuard() {
    {
        std::lock_guard<std::mutex> lock(owner_.cancel_mutex_);
        owner_.cancel_.reset();
    }
    owner_.attempt_active_.store(false);
}

// ============================================================================
// AttendanceController
// ============================================================================

AttendanceController::AttendanceController(CameraFactory camera_factory,
                                           DescriptorSource& source,
                                           MatchGateway& gateway,
                                           EnrollmentStore& store,
                                           const LivenessConfig& liveness_config,
                                           const EnrollmentConfig& enrollment_config,
                                           ChallengeSelector selector,
                                           Sleeper sleeper,
                                           ConfirmationGate::Clock clock)
    : camera_factory_(std::move(camera_factory)),
      source_(source),
      gateway_(gateway),
      store_(store),
      verifier_(liveness_config, std::move(selector)),
      aggregator_(enrollment_config),
      gate_(std::move(clock)),
      sleeper_(sleeper ? std::move(sleeper) : default_sleeper()),
      camera_warmup_ms_(enrollment_config.camera_warmup_ms) {
    if (!camera_factory_) {
        throw PresenceError(ErrorKind::InvalidInput, "AttendanceController needs a camera factory");
    }
}

AttemptResult AttendanceController::mark_attendance() {
    if (gate_.state() == GateState::PENDING) {
        throw PresenceError(ErrorKind::AttemptInProgress, "Previous candidate is still awaiting confirmation");
    }

    AttemptGuard guard(*this);
    AttemptResult result;

    try {
        ensure_model_ready();
        set_state(AttendanceState::VERIFYING);

        Descriptor descriptor;
        {
            CameraSession camera(make_camera());
            FrameSampler sampler(camera, source_, guard.token(), sleeper_);

            report_status("📹 Starting camera...");
            sampler.pause(camera_warmup_ms_);

            result.liveness = verifier_.verify(sampler);
            if (!result.liveness.passed) {
                result.status = AttemptResult::Status::LIVENESS_FAILED;
                result.message = result.liveness.reason.value_or("liveness check failed");
                report_status("❌ Liveness check failed: " + result.message);
                set_state(AttendanceState::IDLE);
                return result;
            }

            set_state(AttendanceState::CAPTURING);
            report_status("✓ Liveness confirmed! Extracting face data...");

            FaceSample sample = sampler.sample_once();
            if (!sample.descriptor || sample.descriptor->empty()) {
                throw PresenceError(ErrorKind::TrackingLost, "No face detected for descriptor capture");
            }
            descriptor = std::move(*sample.descriptor);

            // Camera is not needed for the network round trip
            camera.release();
        }

        guard.token()->throw_if_cancelled();
        set_state(AttendanceState::MATCHING);
        report_status("🔍 Matching face...");

        MatchResult match = gateway_.match(MatchRequest{descriptor, result.liveness.score});
        guard.token()->throw_if_cancelled();

        if (!match.matched()) {
            result.status = AttemptResult::Status::NO_MATCH;
            result.message = match.no_match_reason.empty() ? "No match found" : match.no_match_reason;
            report_status("Failed: " + result.message);
            set_state(AttendanceState::IDLE);
            return result;
        }

        gate_.hold(*match.candidate, result.liveness);
        result.status = AttemptResult::Status::PENDING_CONFIRMATION;
        result.candidate = match.candidate;
        result.message = "Is this the correct user?";
        set_state(AttendanceState::PENDING_CONFIRMATION);
        report_status("👤 " + match.candidate->display_name + " - confirm or reject");
        return result;
    } catch (const std::exception& e) {
        handle_attempt_error(e);
        throw;
    }
}

AttendanceRecord AttendanceController::confirm() {
    if (state_.load() != AttendanceState::PENDING_CONFIRMATION) {
        throw PresenceError(ErrorKind::NoPendingCandidate, "No candidate awaiting confirmation");
    }

    AttendanceRecord record = gate_.confirm();
    set_state(AttendanceState::RECORDED);
    report_status("✅ Attendance marked for " + record.display_name);

    gate_.reset();
    set_state(AttendanceState::IDLE);
    return record;
}

void AttendanceController::reject() {
    if (state_.load() != AttendanceState::PENDING_CONFIRMATION) {
        throw PresenceError(ErrorKind::NoPendingCandidate, "No candidate awaiting confirmation");
    }

    gate_.reject();
    report_status("Attendance cancelled. Please try again.");
    set_state(AttendanceState::IDLE);
}

void AttendanceController::register_identity(const std::string& identity_id, const std::string& display_name) {
    if (identity_id.find_first_not_of(" \t") == std::string::npos ||
        display_name.find_first_not_of(" \t") == std::string::npos) {
        throw PresenceError(ErrorKind::InvalidInput, "Please enter both User ID and Name");
    }
    if (gate_.state() == GateState::PENDING) {
        throw PresenceError(ErrorKind::AttemptInProgress, "Candidate awaiting confirmation");
    }

    AttemptGuard guard(*this);

    try {
        ensure_model_ready();
        set_state(AttendanceState::ENROLLING);

        EnrollmentRequest request;
        request.identity_id = identity_id;
        request.display_name = display_name;
        {
            CameraSession camera(make_camera());
            FrameSampler sampler(camera, source_, guard.token(), sleeper_);

            report_status("📹 Starting camera...");
            sampler.pause(camera_warmup_ms_);

            request.descriptor = aggregator_.enroll(sampler);
            camera.release();
        }

        guard.token()->throw_if_cancelled();
        report_status("💾 Saving to database...");
        store_.enroll(request);

        report_status("✓ Successfully registered " + display_name + "!");
        set_state(AttendanceState::IDLE);
    } catch (const std::exception& e) {
        handle_attempt_error(e);
        throw;
    }
}

void AttendanceController::cancel() {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if (cancel_) {
        cancel_->cancel();
    }
}

std::string AttendanceController::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void AttendanceController::set_status_callback(StatusCallback callback) {
    verifier_.set_status_callback(callback);
    aggregator_.set_status_callback(callback);

    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void AttendanceController::set_record_callback(RecordCallback callback) {
    gate_.set_record_callback(std::move(callback));
}

void AttendanceController::set_state(AttendanceState new_state) {
    AttendanceState old_state = state_.exchange(new_state);
    if (old_state != new_state) {
        std::cout << "[Controller] " << to_string(old_state) << " -> " << to_string(new_state) << std::endl;
    }
}

void AttendanceController::report_status(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    std::cout << "[Controller] " << status << std::endl;
    if (callback) {
        callback(status);
    }
}

void AttendanceController::handle_attempt_error(const std::exception& e) {
    const auto* presence_error = dynamic_cast<const PresenceError*>(&e);
    const std::string kind = presence_error ? to_string(presence_error->kind()) : "Unexpected";

    std::cerr << "❌ [Controller] Attempt ended in " << to_string(state_.load()) << " [" << kind << "]: "
              << e.what() << std::endl;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = e.what();
    }
    set_state(AttendanceState::IDLE);
}

void AttendanceController::ensure_model_ready() const {
    if (!source_.is_ready()) {
        throw PresenceError(ErrorKind::ModelNotReady, "Face models not loaded yet");
    }
}

std::unique_ptr<Camera> AttendanceController::make_camera() {
    std::unique_ptr<Camera> camera = camera_factory_();
    if (!camera) {
        throw PresenceError(ErrorKind::CameraUnavailable, "Camera factory returned no camera");
    }
    return camera;
}

} // namespace presence
