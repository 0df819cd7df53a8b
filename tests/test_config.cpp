#include "Config.hpp"
#include "FakeDevices.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <unistd.h>

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

int main() {
    std::cout << "=== Config Test ===" << std::endl;
    unsetenv("PRESENCE_GATEWAY_URL");
    unsetenv("PRESENCE_GATEWAY_TOKEN");

    // Test 1: Empty document keeps defaults
    {
        PresenceConfig c = parse_config("{}");
        assert_true(c.camera.backend == "opencv" && c.camera.width == 640, "camera defaults");
        assert_true(c.liveness.motion_frames == 8 && c.liveness.motion_interval_ms == 60, "motion defaults");
        assert_true(c.liveness.blink_frames == 12 && c.liveness.turn_frames == 15, "challenge frame defaults");
        assert_true(c.liveness.score_mode == "random", "random pass score by default");
        assert_true(c.enrollment.capture_count == 3 && c.enrollment.stabilization_ms == 1000, "enrollment defaults");
        assert_true(c.gateway.base_url == "http://localhost:3001", "gateway default URL");
    }

    // Test 2: Overrides per section
    {
        PresenceConfig c = parse_config(R"({
            "camera": {"backend": "realsense", "stream": "infrared", "fps": 15},
            "models": {"detector": "/opt/models/yunet.onnx", "score_threshold": 0.7},
            "liveness": {"turn_min_px": 20.0, "score_mode": "margin", "quick_mode": true},
            "enrollment": {"capture_count": 5},
            "gateway": {"base_url": "https://attend.example.org", "token": "abc", "timeout_ms": 2500}
        })");
        assert_true(c.camera.backend == "realsense" && c.camera.stream == "infrared" && c.camera.fps == 15,
                    "camera overrides");
        assert_true(c.models.detector_model == "/opt/models/yunet.onnx", "model path override");
        assert_true(c.liveness.thresholds.turn_min_px == 20.0f, "threshold override");
        assert_true(c.liveness.score_mode == "margin" && c.liveness.quick_mode, "liveness mode overrides");
        assert_true(c.liveness.blink_frames == 12, "unset keys in a present section keep defaults");
        assert_true(c.enrollment.capture_count == 5, "capture count override");
        assert_true(c.gateway.token == "abc" && c.gateway.timeout_ms == 2500, "gateway overrides");
    }

    // Test 3: Invalid documents
    {
        bool threw = throws_kind([]() { parse_config("{ not json"); }, ErrorKind::InvalidInput);
        assert_true(threw, "malformed JSON rejected");
        threw = throws_kind([]() { parse_config("[1, 2]"); }, ErrorKind::InvalidInput);
        assert_true(threw, "non-object root rejected");
        threw = throws_kind([]() { parse_config(R"({"camera": 3})"); }, ErrorKind::InvalidInput);
        assert_true(threw, "non-object section rejected");
        threw = throws_kind([]() { parse_config(R"({"liveness": {"blink_frames": "twelve"}})"); },
                            ErrorKind::InvalidInput);
        assert_true(threw, "wrongly typed key rejected");
        threw = throws_kind([]() { parse_config(R"({"liveness": {"score_mode": "fixed"}})"); },
                            ErrorKind::InvalidInput);
        assert_true(threw, "unknown score mode rejected");
        threw = throws_kind([]() { parse_config(R"({"liveness": {"pass_score_max": 1.5}})"); },
                            ErrorKind::InvalidInput);
        assert_true(threw, "pass score above 1 rejected");
        threw = throws_kind([]() { parse_config(R"({"camera": {"backend": "gstreamer"}})"); },
                            ErrorKind::InvalidInput);
        assert_true(threw, "unknown camera backend rejected");
        threw = throws_kind([]() { parse_config(R"({"enrollment": {"capture_count": 0}})"); },
                            ErrorKind::InvalidInput);
        assert_true(threw, "zero captures rejected");
    }

    // Test 4: Environment overrides win over the file
    {
        setenv("PRESENCE_GATEWAY_URL", "http://10.0.0.5:8080", 1);
        setenv("PRESENCE_GATEWAY_TOKEN", "env-token", 1);
        PresenceConfig c = parse_config(R"({"gateway": {"base_url": "http://file:1", "token": "file"}})");
        apply_env_overrides(c);
        assert_true(c.gateway.base_url == "http://10.0.0.5:8080", "URL taken from environment");
        assert_true(c.gateway.token == "env-token", "token taken from environment");

        setenv("PRESENCE_GATEWAY_URL", "", 1);
        c = parse_config(R"({"gateway": {"base_url": "http://file:1"}})");
        apply_env_overrides(c);
        assert_true(c.gateway.base_url == "http://file:1", "empty environment value ignored");
        unsetenv("PRESENCE_GATEWAY_URL");
        unsetenv("PRESENCE_GATEWAY_TOKEN");
    }

    // Test 5: Loading from disk
    {
        char path[] = "/tmp/presence_config_XXXXXX";
        int fd = mkstemp(path);
        assert_true(fd >= 0, "temporary config created");
        if (fd >= 0) {
            close(fd);
            std::ofstream out(path);
            out << R"({"liveness": {"motion_frames": 10}})";
            out.close();

            PresenceConfig c = load_config(path, true);
            assert_true(c.liveness.motion_frames == 10, "file contents applied");
            unlink(path);
        }

        bool threw = throws_kind([]() { load_config("/nonexistent/presence.json", true); },
                                 ErrorKind::InvalidInput);
        assert_true(threw, "missing explicit config file rejected");

        PresenceConfig c = load_config("/nonexistent/presence.json", false);
        assert_true(c.liveness.motion_frames == 8, "missing default config falls back to defaults");
    }

    std::cout << (fails == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << std::endl;
    return fails == 0 ? 0 : 1;
}
