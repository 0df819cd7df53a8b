#include "FrameSampler.hpp"
#include "PresenceError.hpp"

#include <algorithm>
#include <thread>

namespace presence {

void CancelToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw PresenceError(ErrorKind::Cancelled, "Attempt cancelled by operator");
    }
}

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

// ============================================================================
// FrameSequence
// ============================================================================

FrameSequence::FrameSequence(FrameSampler& sampler, int max_frames, std::chrono::milliseconds interval)
    : sampler_(sampler), max_frames_(std::max(0, max_frames)), interval_(interval) {}

std::optional<FaceSample> FrameSequence::next() {
    if (produced_ >= max_frames_) {
        return std::nullopt;
    }

    // Pace between consecutive frames, not before the first one
    if (produced_ > 0 && interval_.count() > 0) {
        sampler_.check_cancelled();
        sampler_.sleeper_(interval_);
    }

    FaceSample sample = sampler_.sample_once();
    ++produced_;
    return sample;
}

// ============================================================================
// FrameSampler
// ============================================================================

FrameSampler::FrameSampler(CameraSession& camera,
                           DescriptorSource& source,
                           std::shared_ptr<const CancelToken> cancel,
                           Sleeper sleeper)
    : camera_(camera),
      source_(source),
      cancel_(std::move(cancel)),
      sleeper_(sleeper ? std::move(sleeper) : default_sleeper()) {
    if (!source_.is_ready()) {
        throw PresenceError(ErrorKind::ModelNotReady,
                            "Descriptor source '" + source_.name() + "' is not ready");
    }
}

FrameSequence FrameSampler::sample(int max_frames, int interval_ms) {
    return FrameSequence(*this, max_frames, std::chrono::milliseconds(std::max(0, interval_ms)));
}

FaceSample FrameSampler::sample_once() {
    check_cancelled();

    // Camera failure is terminal for the sequence; it propagates as thrown
    FrameBox frame = camera_.grab();
    ++frames_sampled_;

    FaceSample sample;
    sample.sequence_id = frame.sequence_id;

    std::optional<FaceDetection> detection = source_.detect(frame);
    if (detection) {
        sample.landmarks = std::move(detection->landmarks);
        sample.descriptor = std::move(detection->descriptor);
    }
    return sample;
}

void FrameSampler::pause(int ms) {
    check_cancelled();
    if (ms > 0) {
        sleeper_(std::chrono::milliseconds(ms));
    }
    check_cancelled();
}

void FrameSampler::check_cancelled() const {
    if (cancel_) {
        cancel_->throw_if_cancelled();
    }
}

} // namespace presence
