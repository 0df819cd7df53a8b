#include "EnrollmentAggregator.hpp"
#include "PresenceError.hpp"

#include <iostream>

namespace presence {

Descriptor average_descriptors(const std::vector<Descriptor>& descriptors) {
    if (descriptors.empty()) {
        throw PresenceError(ErrorKind::DescriptorDimensionMismatch, "No descriptors to average");
    }

    const size_t dims = descriptors.front().size();
    if (dims == 0) {
        throw PresenceError(ErrorKind::DescriptorDimensionMismatch, "Empty descriptor");
    }

    for (size_t j = 1; j < descriptors.size(); ++j) {
        if (descriptors[j].size() != dims) {
            throw PresenceError(ErrorKind::DescriptorDimensionMismatch,
                                "Descriptor " + std::to_string(j + 1) + " has " +
                                std::to_string(descriptors[j].size()) + " dimensions, expected " +
                                std::to_string(dims));
        }
    }

    // Accumulate in double; descriptors are small but values are not normalized
    std::vector<double> sum(dims, 0.0);
    for (const auto& d : descriptors) {
        for (size_t i = 0; i < dims; ++i) {
            sum[i] += d[i];
        }
    }

    const double n = static_cast<double>(descriptors.size());
    Descriptor avg(dims);
    for (size_t i = 0; i < dims; ++i) {
        avg[i] = static_cast<float>(sum[i] / n);
    }
    return avg;
}

EnrollmentAggregator::EnrollmentAggregator(const EnrollmentConfig& config) : config_(config) {
    if (config_.capture_count < 1) {
        throw PresenceError(ErrorKind::InvalidInput, "enrollment.capture_count must be at least 1");
    }
}

Descriptor EnrollmentAggregator::enroll(FrameSampler& sampler) {
    EnrollmentSession session;
    session.target_count = config_.capture_count;

    for (int i = 1; i <= session.target_count; ++i) {
        report_status("📸 Capturing " + std::to_string(i) + "/" + std::to_string(session.target_count) +
                      "... hold still");
        sampler.pause(config_.stabilization_ms);

        FaceSample sample = sampler.sample_once();
        if (!sample.descriptor || sample.descriptor->empty()) {
            std::cerr << "❌ [Enrollment] No face in capture " << i << "/" << session.target_count << std::endl;
            throw PresenceError(ErrorKind::TrackingLost,
                                "failed to detect face in capture " + std::to_string(i) + "/" +
                                std::to_string(session.target_count));
        }

        session.captures.push_back(std::move(*sample.descriptor));
        std::cout << "✓ [Enrollment] Capture " << i << " ok (" << session.captures.back().size()
                  << " dims)" << std::endl;
    }

    if (!session.complete()) {
        throw PresenceError(ErrorKind::TrackingLost, "Enrollment session incomplete");
    }

    Descriptor averaged = average_descriptors(session.captures);
    std::cout << "✅ [Enrollment] Averaged " << session.captures.size() << " captures" << std::endl;
    return averaged;
}

void EnrollmentAggregator::set_status_callback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void EnrollmentAggregator::report_status(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    std::cout << "[Enrollment] " << status << std::endl;
    if (callback) {
        callback(status);
    }
}

} // namespace presence
