#include "DescriptorSource.hpp"
#include "FakeDevices.hpp"
#include "LivenessMath.hpp"
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

static bool near(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int main() {
    std::cout << "=== Liveness Math Test ===" << std::endl;

    // Test 1: EAR of a constructed eye and scale invariance
    {
        auto eye = make_eye(10.0f, 20.0f, 0.3f);
        assert_true(near(eye_aspect_ratio(eye), 0.3f), "EAR of constructed eye is 0.3");

        std::array<cv::Point2f, 6> scaled;
        for (size_t i = 0; i < eye.size(); ++i) {
            scaled[i] = eye[i] * 3.5f;
        }
        assert_true(near(eye_aspect_ratio(scaled), eye_aspect_ratio(eye)), "EAR unchanged when scaled by 3.5");

        for (size_t i = 0; i < eye.size(); ++i) {
            scaled[i] = eye[i] * 0.25f;
        }
        assert_true(near(eye_aspect_ratio(scaled), eye_aspect_ratio(eye)), "EAR unchanged when scaled by 0.25");
    }

    // Test 2: Degenerate eye does not divide by zero
    {
        std::array<cv::Point2f, 6> eye;
        eye.fill(cv::Point2f(5.0f, 5.0f));
        assert_true(eye_aspect_ratio(eye) == 0.0f, "coincident eye corners give EAR 0");
    }

    // Test 3: Average EAR uses both eyes
    {
        LandmarkSet lm;
        lm.left_eye = make_eye(0.0f, 0.0f, 0.2f);
        lm.right_eye = make_eye(50.0f, 0.0f, 0.4f);
        assert_true(near(average_eye_aspect_ratio(lm), 0.3f), "average EAR is mean of left and right");
    }

    // Test 4: Blink detection
    {
        std::vector<float> blink = {0.30f, 0.29f, 0.10f, 0.12f, 0.28f, 0.30f};
        CheckResult r = evaluate_blink(blink);
        assert_true(r.passed, "min 0.10 with range 0.20 is a blink");
        assert_true(near(r.measured, 0.20f), "blink range measured as 0.20");

        std::vector<float> flat(12, 0.30f);
        r = evaluate_blink(flat);
        assert_true(!r.passed, "flat EAR at 0.30 is not a blink");
        assert_true(r.reason == "no blink detected", "flat EAR reason is 'no blink detected'");

        // Low but steady (eyes half closed the whole time)
        std::vector<float> squint(12, 0.18f);
        squint[3] = 0.20f;
        assert_true(!evaluate_blink(squint).passed, "low EAR without swing is not a blink");

        // Big swing that never closes
        std::vector<float> wide = {0.45f, 0.30f, 0.45f, 0.30f};
        assert_true(!evaluate_blink(wide).passed, "swing with min above 0.25 is not a blink");

        assert_true(!evaluate_blink({}).passed, "no samples is not a blink");
    }

    // Test 5: Head turn detection
    {
        std::vector<float> left = {100.0f, 95.0f, 90.0f, 85.0f, 80.0f};
        assert_true(evaluate_head_turn(left, ChallengeKind::TURN_LEFT).passed, "100 -> 80 passes turnLeft");
        assert_true(!evaluate_head_turn(left, ChallengeKind::TURN_RIGHT).passed, "100 -> 80 fails turnRight");

        std::vector<float> right = {80.0f, 90.0f, 100.0f};
        assert_true(evaluate_head_turn(right, ChallengeKind::TURN_RIGHT).passed, "80 -> 100 passes turnRight");

        // Only the endpoints count
        std::vector<float> wobble = {100.0f, 60.0f, 140.0f, 95.0f};
        CheckResult r = evaluate_head_turn(wobble, ChallengeKind::TURN_LEFT);
        assert_true(!r.passed, "net displacement -5 fails turnLeft despite large wobble");
        assert_true(contains(r.reason, "5.0px"), "failure reason reports 5.0px");
        assert_true(contains(r.reason, "left"), "failure reason names the direction");

        std::vector<float> exactly = {100.0f, 88.0f};
        assert_true(!evaluate_head_turn(exactly, ChallengeKind::TURN_LEFT).passed,
                    "exactly -12px is not more negative than -12px");

        bool threw = throws_kind([&]() { evaluate_head_turn(left, ChallengeKind::BLINK); },
                                 ErrorKind::InvalidInput);
        assert_true(threw, "head turn with BLINK kind is rejected");
    }

    // Test 6: Motion check
    {
        std::vector<cv::Point2f> still(8, cv::Point2f(100.0f, 120.0f));
        CheckResult r = evaluate_motion(still);
        assert_true(!r.passed, "8 identical nose positions fail");
        assert_true(contains(r.reason, "static image detected"), "static reason reported");

        std::vector<cv::Point2f> moving;
        for (int i = 0; i < 8; ++i) {
            moving.push_back(cv::Point2f(100.0f + ((i % 2) ? 4.0f : 0.0f), 120.0f));
        }
        assert_true(near(mean_consecutive_displacement(moving), 4.0f), "alternating 4px gives mean 4px");
        assert_true(evaluate_motion(moving).passed, "mean motion 4px passes");

        std::vector<cv::Point2f> diagonal = {cv::Point2f(0, 0), cv::Point2f(3, 4), cv::Point2f(6, 8)};
        assert_true(near(mean_consecutive_displacement(diagonal), 5.0f), "displacement is Euclidean");

        assert_true(mean_consecutive_displacement({cv::Point2f(1, 1)}) == 0.0f, "single position gives 0");
    }

    // Test 7: Margins
    {
        std::vector<float> strong = {0.30f, 0.05f};  // range 0.25
        CheckResult r = evaluate_blink(strong);
        assert_true(near(r.margin, 1.0f), "blink margin clamped to 1");

        std::vector<float> turn = {100.0f, 82.0f};  // |d| = 18
        r = evaluate_head_turn(turn, ChallengeKind::TURN_LEFT);
        assert_true(near(r.margin, 0.5f), "turn of 18px has margin 0.5");
    }

    // Test 8: iBUG-68 conversion
    {
        std::vector<cv::Point2f> pts;
        for (int i = 0; i < 68; ++i) {
            pts.push_back(cv::Point2f(static_cast<float>(i), static_cast<float>(i * 2)));
        }
        LandmarkSet lm = landmarks_from_ibug68(pts);
        assert_true(lm.left_eye[0] == pts[36] && lm.left_eye[5] == pts[41], "left eye is points 36-41");
        assert_true(lm.right_eye[0] == pts[42] && lm.right_eye[5] == pts[47], "right eye is points 42-47");
        assert_true(lm.nose.size() == 9, "nose has 9 points");
        assert_true(lm.has_nose_tip() && lm.nose_tip() == pts[30], "nose tip is point 30");

        pts.resize(20);
        bool threw = throws_kind([&]() { landmarks_from_ibug68(pts); }, ErrorKind::InvalidInput);
        assert_true(threw, "fewer than 68 points rejected");
    }

    std::cout << (fails == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << std::endl;
    return fails == 0 ? 0 : 1;
}
