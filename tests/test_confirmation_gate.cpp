#include "AttendanceController.hpp"
#include "ConfirmationGate.hpp"
#include "FakeDevices.hpp"
#include <cmath>
#include <iostream>

using namespace presence;
using namespace presence::testing;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static const char* FIXED_TIME = "2024-03-01T08:15:02+0000";

/**
 * @brief Motion, turnLeft of -15px, then the descriptor capture frame
 */
static FaceScript turn_left_attempt() {
    FaceScript capture{make_face(85.0f, 120.0f, 0.3f, Descriptor{0.1f, 0.2f, 0.3f, 0.4f})};
    return concat({jitter_frames(8), turn_frames(15, 100.0f, 85.0f), capture});
}

static LivenessOutcome passed_outcome(float score) {
    LivenessOutcome outcome;
    outcome.passed = true;
    outcome.score = score;
    outcome.challenge = ChallengeKind::BLINK;
    return outcome;
}

int main() {
    std::cout << "=== Confirmation Gate Test ===" << std::endl;

    // Test 1: Gate alone
    {
        ConfirmationGate gate([]() { return std::string(FIXED_TIME); });
        assert_true(gate.state() == GateState::IDLE, "gate starts IDLE");

        LivenessOutcome failed;
        failed.passed = false;
        failed.score = 0.4f;
        bool threw = throws_kind([&]() { gate.hold(MatchCandidate{"u-1", "Ada", 0.9f, 0.3f}, failed); },
                                 ErrorKind::InvalidInput);
        assert_true(threw, "candidate without passed liveness is refused");

        threw = throws_kind([&]() { gate.confirm(); }, ErrorKind::NoPendingCandidate);
        assert_true(threw, "confirm with nothing pending raises NoPendingCandidate");
        threw = throws_kind([&]() { gate.reject(); }, ErrorKind::NoPendingCandidate);
        assert_true(threw, "reject with nothing pending raises NoPendingCandidate");

        gate.hold(MatchCandidate{"u-1", "Ada", 0.9f, 0.3f}, passed_outcome(0.88f));
        assert_true(gate.state() == GateState::PENDING, "held candidate is PENDING");
        threw = throws_kind([&]() { gate.hold(MatchCandidate{"u-2", "Grace", 0.8f, 0.4f}, passed_outcome(0.9f)); },
                            ErrorKind::AttemptInProgress);
        assert_true(threw, "second candidate refused while one is pending");

        int recorded = 0;
        gate.set_record_callback([&recorded](const AttendanceRecord&) { ++recorded; });
        AttendanceRecord record = gate.confirm();
        assert_true(record.identity_id == "u-1" && record.display_name == "Ada", "record uses the held identity");
        assert_true(record.confidence == 0.9f && record.distance == 0.3f, "record uses the held match scores");
        assert_true(record.liveness_score == 0.88f, "record uses the held liveness score");
        assert_true(record.recorded_at == FIXED_TIME, "record timestamped at confirmation");
        assert_true(recorded == 1, "record callback invoked once");
        assert_true(gate.state() == GateState::CONFIRMED && !gate.pending(), "gate CONFIRMED and cleared");
    }

    // Test 2: A failing record sink keeps the candidate pending
    {
        ConfirmationGate gate([]() { return std::string(FIXED_TIME); });
        gate.hold(MatchCandidate{"u-1", "Ada", 0.9f, 0.3f}, passed_outcome(0.8f));
        gate.set_record_callback([](const AttendanceRecord&) {
            throw PresenceError(ErrorKind::GatewayNetworkError, "sink offline");
        });
        bool threw = throws_kind([&]() { gate.confirm(); }, ErrorKind::GatewayNetworkError);
        assert_true(threw, "record sink failure propagates");
        assert_true(gate.pending().has_value(), "candidate still pending after sink failure");
    }

    // Test 2b: The record sink may query the gate while confirming
    {
        ConfirmationGate gate([]() { return std::string(FIXED_TIME); });
        gate.hold(MatchCandidate{"u-7", "Alan", 0.85f, 0.35f}, passed_outcome(0.75f));

        bool saw_pending = false;
        GateState seen_state = GateState::IDLE;
        gate.set_record_callback([&](const AttendanceRecord& r) {
            std::optional<PendingCandidate> p = gate.pending();
            saw_pending = p.has_value() && p->candidate.identity_id == r.identity_id;
            seen_state = gate.state();
        });

        AttendanceRecord record = gate.confirm();
        assert_true(record.identity_id == "u-7", "confirm returns when the sink reads the gate");
        assert_true(saw_pending && seen_state == GateState::PENDING, "sink sees the candidate still pending");
        assert_true(gate.state() == GateState::CONFIRMED && !gate.pending(), "gate cleared after the sink returns");
    }

    // Test 2c: A sink that rejects the candidate leaves the gate as it put it
    {
        ConfirmationGate gate([]() { return std::string(FIXED_TIME); });
        gate.hold(MatchCandidate{"u-8", "Edsger", 0.8f, 0.4f}, passed_outcome(0.8f));
        gate.set_record_callback([&](const AttendanceRecord&) { gate.reject(); });

        AttendanceRecord record = gate.confirm();
        assert_true(record.identity_id == "u-8", "record still produced");
        assert_true(gate.state() == GateState::IDLE && !gate.pending(), "reject from the sink is not overwritten");
    }

    // Test 3: End to end, reject leaves nothing recorded
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt());
        RecordingGateway gateway;
        gateway.next_result = candidate_result("u-42", "Ada Lovelace", 0.92f, 0.31f);

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), no_sleep(),
                                        []() { return std::string(FIXED_TIME); });

        std::vector<AttendanceRecord> records;
        controller.set_record_callback([&records](const AttendanceRecord& r) { records.push_back(r); });

        AttemptResult result = controller.mark_attendance();
        assert_true(result.liveness.passed, "turnLeft -15px passes liveness");
        assert_true(result.liveness.score >= 0.7f && result.liveness.score <= 1.0f, "liveness score in [0.7, 1.0]");
        assert_true(result.status == AttemptResult::Status::PENDING_CONFIRMATION, "0.92 match enters pending");
        assert_true(controller.state() == AttendanceState::PENDING_CONFIRMATION, "controller PENDING_CONFIRMATION");
        assert_true(!tracker->open && tracker->closes == 1, "camera released before waiting for the operator");

        assert_true(gateway.match_requests.size() == 1, "gateway queried once");
        assert_true(gateway.match_requests.size() == 1 &&
                    gateway.match_requests[0].descriptor == Descriptor({0.1f, 0.2f, 0.3f, 0.4f}) &&
                    gateway.match_requests[0].liveness_score == result.liveness.score,
                    "gateway receives the descriptor with the liveness score");

        bool threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::AttemptInProgress);
        assert_true(threw, "no new attempt while a candidate is pending");

        controller.reject();
        assert_true(controller.state() == AttendanceState::IDLE, "reject returns to IDLE");
        assert_true(!controller.pending().has_value(), "pending candidate cleared");
        assert_true(records.empty(), "no attendance recorded after reject");

        threw = throws_kind([&]() { controller.confirm(); }, ErrorKind::NoPendingCandidate);
        assert_true(threw, "confirm after reject raises NoPendingCandidate");

        // Fresh attempt, this time confirmed
        source.set_script(turn_left_attempt());
        result = controller.mark_attendance();
        AttendanceRecord record = controller.confirm();
        assert_true(records.size() == 1, "confirm records exactly one attendance");
        assert_true(record.identity_id == "u-42" && record.display_name == "Ada Lovelace", "record identity");
        assert_true(std::fabs(record.confidence - 0.92f) < 1e-6f, "record confidence from the snapshot");
        assert_true(record.liveness_score == result.liveness.score, "record liveness score from the snapshot");
        assert_true(gateway.match_requests.size() == 2, "confirm does not query the gateway again");
        assert_true(controller.state() == AttendanceState::IDLE, "ready for the next attempt after confirm");
    }

    // Test 3b: Callbacks may call back into the controller
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt());
        RecordingGateway gateway;
        gateway.next_result = candidate_result("u-42", "Ada Lovelace", 0.92f, 0.31f);

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), no_sleep(),
                                        []() { return std::string(FIXED_TIME); });

        bool sink_saw_pending = false;
        controller.set_record_callback([&](const AttendanceRecord& r) {
            std::optional<PendingCandidate> p = controller.pending();
            sink_saw_pending = p.has_value() && p->candidate.identity_id == r.identity_id;
        });

        int later_statuses = 0;
        bool replaced = false;
        controller.set_status_callback([&](const std::string&) {
            if (!replaced) {
                replaced = true;
                controller.set_status_callback([&](const std::string&) { ++later_statuses; });
            }
        });

        controller.mark_attendance();
        AttendanceRecord record = controller.confirm();
        assert_true(record.identity_id == "u-42", "confirm completes when the sink reads pending()");
        assert_true(sink_saw_pending, "sink sees the held candidate");
        assert_true(replaced && later_statuses > 0, "status callback can replace itself");
        assert_true(controller.state() == AttendanceState::IDLE, "controller back to IDLE");
    }

    // Test 4: Liveness failure never reaches the gateway
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(FaceScript(8, make_face(100.0f)));
        RecordingGateway gateway;
        gateway.next_result = candidate_result("u-42", "Ada", 0.99f, 0.1f);

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::BLINK), no_sleep());

        AttemptResult result = controller.mark_attendance();
        assert_true(result.status == AttemptResult::Status::LIVENESS_FAILED, "static face ends LIVENESS_FAILED");
        assert_true(result.message.find("static image detected") == 0, "failure message carries the reason");
        assert_true(gateway.match_requests.empty(), "descriptor not matched without passed liveness");
        assert_true(controller.state() == AttendanceState::IDLE, "controller back to IDLE");
        assert_true(!tracker->open, "camera released after liveness failure");
    }

    // Test 5: No match
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt());
        RecordingGateway gateway;
        gateway.next_result.no_match_reason = "No matching face found";

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), no_sleep());

        AttemptResult result = controller.mark_attendance();
        assert_true(result.status == AttemptResult::Status::NO_MATCH, "no candidate ends NO_MATCH");
        assert_true(result.message == "No matching face found", "no-match reason passed through");
        assert_true(controller.state() == AttendanceState::IDLE, "controller back to IDLE");
    }

    // Test 6: Errors release the camera and return to IDLE
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt());
        RecordingGateway gateway;
        gateway.next_error = PresenceError(ErrorKind::GatewayNetworkError, "connection refused");

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), no_sleep());

        bool threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::GatewayNetworkError);
        assert_true(threw, "gateway network error propagates");
        assert_true(controller.state() == AttendanceState::IDLE, "IDLE after network error");
        assert_true(controller.last_error() == "connection refused", "last error kept");
        assert_true(!tracker->open, "camera released after network error");

        // Capture frame without a face
        FaceScript no_capture = concat({jitter_frames(8), turn_frames(15, 100.0f, 85.0f)});
        source.set_script(no_capture);
        gateway.next_error.reset();
        threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::TrackingLost);
        assert_true(threw, "no face for the descriptor capture raises TrackingLost");
        assert_true(gateway.match_requests.size() == 1, "nothing matched without a descriptor");

        // Camera cannot be opened
        tracker->fail_open = true;
        threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::CameraUnavailable);
        assert_true(threw, "camera open failure raises CameraUnavailable");
        assert_true(controller.state() == AttendanceState::IDLE, "IDLE after camera failure");
    }

    // Test 7: Model readiness is checked before the camera opens
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt(), /*ready=*/false);
        RecordingGateway gateway;
        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                        LivenessConfig(), EnrollmentConfig(),
                                        ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), no_sleep());

        bool threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::ModelNotReady);
        assert_true(threw, "attempt before models load raises ModelNotReady");
        assert_true(tracker->opens == 0, "camera never opened");
    }

    // Test 8: Cancellation mid-attempt
    {
        auto tracker = std::make_shared<CameraTracker>();
        ScriptedDescriptorSource source(turn_left_attempt());
        RecordingGateway gateway;
        gateway.next_result = candidate_result("u-42", "Ada", 0.92f, 0.31f);

        AttendanceController* self = nullptr;
        int sleeps = 0;
        Sleeper cancel_during_motion = [&](std::chrono::milliseconds) {
            if (++sleeps == 4 && self) self->cancel();
        };

        AttendanceController controller(scripted_camera_factory(tracker), source, gateway, gateway,
                                         LivenessConfig(), EnrollmentConfig(),
                                         ChallengeSelector::fixed(ChallengeKind::TURN_LEFT), cancel_during_motion);
        self = &controller;

        bool threw = throws_kind([&]() { controller.mark_attendance(); }, ErrorKind::Cancelled);
        assert_true(threw, "cancel() aborts the running attempt");
        assert_true(!tracker->open && tracker->closes == 1, "camera released after cancellation");
        assert_true(gateway.match_requests.empty(), "cancelled attempt has no side effects");
        assert_true(controller.state() == AttendanceState::IDLE, "IDLE after cancellation");

        // The next attempt gets a fresh token
        self = nullptr;
        source.set_script(turn_left_attempt());
        AttemptResult result = controller.mark_attendance();
        assert_true(result.status == AttemptResult::Status::PENDING_CONFIRMATION, "attempt after cancellation works");
    }

    std::cout << (fails == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << std::endl;
    return fails == 0 ? 0 : 1;
}
