#pragma once

/**
 * @file EnrollmentAggregator.hpp
 * @brief Multi-capture enrollment reduced to one representative descriptor
 */

#include "FaceTypes.hpp"
#include "FrameSampler.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace presence {

struct EnrollmentConfig {
    int capture_count = 3;
    int stabilization_ms = 1000;  // pause before each capture
    int camera_warmup_ms = 1000;  // after opening the camera, before the first frame
};

/**
 * @brief Captured descriptors of one registration attempt
 *
 * Only yields a result when it holds exactly target_count descriptors.
 */
struct EnrollmentSession {
    int target_count = 0;
    std::vector<Descriptor> captures;

    bool complete() const { return static_cast<int>(captures.size()) == target_count; }
};

/**
 * @brief Per-dimension arithmetic mean of equally sized descriptors
 * @throws PresenceError(DescriptorDimensionMismatch) on empty input,
 *         empty descriptors or differing dimensionality
 */
Descriptor average_descriptors(const std::vector<Descriptor>& descriptors);

class EnrollmentAggregator {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    explicit EnrollmentAggregator(const EnrollmentConfig& config);

    /**
     * @brief Capture capture_count descriptors and average them
     *
     * A capture without a descriptor aborts the whole session; nothing
     * partial is returned.
     * @throws PresenceError(TrackingLost | DescriptorDimensionMismatch |
     *         CameraUnavailable | Cancelled)
     */
    Descriptor enroll(FrameSampler& sampler);

    void set_status_callback(StatusCallback callback);

    const EnrollmentConfig& get_config() const { return config_; }

private:
    EnrollmentConfig config_;

    StatusCallback status_callback_;
    std::mutex callback_mutex_;

    void report_status(const std::string& status);
};

} // namespace presence
