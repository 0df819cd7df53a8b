#include "Config.hpp"
#include "PresenceError.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace presence {

namespace {

using nlohmann::json;

template <typename T>
void read_key(const json& section, const std::string& section_name, const char* key, T& field) {
    if (!section.contains(key)) {
        return;
    }
    try {
        field = section.at(key).get<T>();
    } catch (const json::type_error&) {
        throw PresenceError(ErrorKind::InvalidInput,
                            "Config key '" + section_name + "." + key + "' has the wrong type");
    }
}

const json* find_section(const json& root, const char* name) {
    if (!root.contains(name)) {
        return nullptr;
    }
    const json& section = root.at(name);
    if (!section.is_object()) {
        throw PresenceError(ErrorKind::InvalidInput, std::string("Config section '") + name + "' must be an object");
    }
    return &section;
}

void read_camera(const json& s, CameraConfig& c) {
    read_key(s, "camera", "backend", c.backend);
    read_key(s, "camera", "device_index", c.device_index);
    read_key(s, "camera", "device_serial", c.device_serial);
    read_key(s, "camera", "stream", c.stream);
    read_key(s, "camera", "width", c.width);
    read_key(s, "camera", "height", c.height);
    read_key(s, "camera", "fps", c.fps);
    read_key(s, "camera", "auto_exposure", c.auto_exposure);
    read_key(s, "camera", "manual_exposure", c.manual_exposure);
    read_key(s, "camera", "manual_gain", c.manual_gain);
    read_key(s, "camera", "grab_timeout_ms", c.grab_timeout_ms);

    if (c.backend != "opencv" && c.backend != "realsense") {
        throw PresenceError(ErrorKind::InvalidInput, "camera.backend must be 'opencv' or 'realsense'");
    }
    if (c.stream != "color" && c.stream != "infrared") {
        throw PresenceError(ErrorKind::InvalidInput, "camera.stream must be 'color' or 'infrared'");
    }
}

void read_models(const json& s, ModelConfig& m) {
    read_key(s, "models", "detector", m.detector_model);
    read_key(s, "models", "landmarks", m.landmark_model);
    read_key(s, "models", "recognizer", m.recognizer_model);
    read_key(s, "models", "score_threshold", m.score_threshold);
    read_key(s, "models", "nms_threshold", m.nms_threshold);
    read_key(s, "models", "top_k", m.top_k);
}

void read_liveness(const json& s, LivenessConfig& l) {
    read_key(s, "liveness", "motion_frames", l.motion_frames);
    read_key(s, "liveness", "motion_interval_ms", l.motion_interval_ms);
    read_key(s, "liveness", "blink_frames", l.blink_frames);
    read_key(s, "liveness", "blink_interval_ms", l.blink_interval_ms);
    read_key(s, "liveness", "turn_frames", l.turn_frames);
    read_key(s, "liveness", "turn_interval_ms", l.turn_interval_ms);

    read_key(s, "liveness", "motion_min_mean_px", l.thresholds.motion_min_mean_px);
    read_key(s, "liveness", "blink_max_min_ear", l.thresholds.blink_max_min_ear);
    read_key(s, "liveness", "blink_min_ear_range", l.thresholds.blink_min_ear_range);
    read_key(s, "liveness", "turn_min_px", l.thresholds.turn_min_px);

    read_key(s, "liveness", "motion_fail_score", l.motion_fail_score);
    read_key(s, "liveness", "challenge_fail_score", l.challenge_fail_score);
    read_key(s, "liveness", "pass_score_min", l.pass_score_min);
    read_key(s, "liveness", "pass_score_max", l.pass_score_max);
    read_key(s, "liveness", "score_mode", l.score_mode);

    read_key(s, "liveness", "quick_mode", l.quick_mode);
    read_key(s, "liveness", "quick_pause_ms", l.quick_pause_ms);
    read_key(s, "liveness", "quick_pass_score", l.quick_pass_score);

    if (l.score_mode != "random" && l.score_mode != "margin") {
        throw PresenceError(ErrorKind::InvalidInput, "liveness.score_mode must be 'random' or 'margin'");
    }
    if (l.motion_frames < 2 || l.blink_frames < 1 || l.turn_frames < 2) {
        throw PresenceError(ErrorKind::InvalidInput, "liveness frame counts are too small");
    }
    if (l.pass_score_min < 0.0f || l.pass_score_max > 1.0f || l.pass_score_min > l.pass_score_max) {
        throw PresenceError(ErrorKind::InvalidInput, "liveness pass score range must lie within [0, 1]");
    }
}

void read_enrollment(const json& s, EnrollmentConfig& e) {
    read_key(s, "enrollment", "capture_count", e.capture_count);
    read_key(s, "enrollment", "stabilization_ms", e.stabilization_ms);
    read_key(s, "enrollment", "camera_warmup_ms", e.camera_warmup_ms);

    if (e.capture_count < 1) {
        throw PresenceError(ErrorKind::InvalidInput, "enrollment.capture_count must be at least 1");
    }
}

void read_gateway(const json& s, GatewayConfig& g) {
    read_key(s, "gateway", "base_url", g.base_url);
    read_key(s, "gateway", "token", g.token);
    read_key(s, "gateway", "timeout_ms", g.timeout_ms);
}

} // namespace

PresenceConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw PresenceError(ErrorKind::InvalidInput, std::string("Malformed config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw PresenceError(ErrorKind::InvalidInput, "Config root must be a JSON object");
    }

    PresenceConfig config;
    if (const json* s = find_section(root, "camera"))     read_camera(*s, config.camera);
    if (const json* s = find_section(root, "models"))     read_models(*s, config.models);
    if (const json* s = find_section(root, "liveness"))   read_liveness(*s, config.liveness);
    if (const json* s = find_section(root, "enrollment")) read_enrollment(*s, config.enrollment);
    if (const json* s = find_section(root, "gateway"))    read_gateway(*s, config.gateway);
    return config;
}

void apply_env_overrides(PresenceConfig& config) {
    const char* env_url = std::getenv("PRESENCE_GATEWAY_URL");
    if (env_url && *env_url) {
        config.gateway.base_url = env_url;
    }
    const char* env_token = std::getenv("PRESENCE_GATEWAY_TOKEN");
    if (env_token && *env_token) {
        config.gateway.token = env_token;
    }
}

PresenceConfig load_config(const std::string& path, bool explicit_path) {
    PresenceConfig config;

    std::ifstream config_file(path);
    if (config_file.is_open()) {
        std::stringstream buffer;
        buffer << config_file.rdbuf();
        config = parse_config(buffer.str());
        std::cout << "✓ Loaded config: " << path << std::endl;
    } else if (explicit_path) {
        throw PresenceError(ErrorKind::InvalidInput, "Cannot open config file: " + path);
    } else {
        std::cout << "⚠ No config at " << path << ", using defaults" << std::endl;
    }

    apply_env_overrides(config);
    return config;
}

} // namespace presence
