#pragma once

/**
 * @file Config.hpp
 * @brief Kiosk configuration (JSON file + environment overrides)
 */

#include "Camera.hpp"
#include "DescriptorSource.hpp"
#include "EnrollmentAggregator.hpp"
#include "LivenessVerifier.hpp"
#include "MatchGateway.hpp"

#include <string>

namespace presence {

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/presence/presence.json";

struct PresenceConfig {
    CameraConfig camera;
    ModelConfig models;
    LivenessConfig liveness;
    EnrollmentConfig enrollment;
    GatewayConfig gateway;
};

/**
 * @brief Parse a JSON document; missing keys keep their defaults
 * @throws PresenceError(InvalidInput) on malformed JSON or a wrongly typed key
 */
PresenceConfig parse_config(const std::string& json_text);

/**
 * @brief Load the file at path, then apply environment overrides
 *
 * A missing file at the default path is not an error (defaults are used);
 * a missing file given explicitly is.
 * @throws PresenceError(InvalidInput)
 */
PresenceConfig load_config(const std::string& path, bool explicit_path);

/**
 * @brief PRESENCE_GATEWAY_URL / PRESENCE_GATEWAY_TOKEN
 */
void apply_env_overrides(PresenceConfig& config);

} // namespace presence
