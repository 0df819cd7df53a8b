#pragma once

/**
 * @file FrameSampler.hpp
 * @brief Paced frame sampling from one camera session
 */

#include "Camera.hpp"
#include "DescriptorSource.hpp"
#include "FaceTypes.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace presence {

/**
 * @brief Abort flag shared between the caller and a running attempt
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @throws PresenceError(Cancelled) once cancel() has been called
     */
    void throw_if_cancelled() const;

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Blocking wait used between ticks (injectable so tests run instantly)
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper default_sleeper();

class FrameSampler;

/**
 * @brief Finite, single-pass sequence of FaceSamples
 *
 * next() yields one sample per tick and std::nullopt once max_frames have
 * been produced. "No face" is a sample with empty members, not the end of
 * the sequence. Camera failure and cancellation throw from next().
 */
class FrameSequence {
public:
    std::optional<FaceSample> next();

    int produced() const { return produced_; }
    int max_frames() const { return max_frames_; }

private:
    friend class FrameSampler;
    FrameSequence(FrameSampler& sampler, int max_frames, std::chrono::milliseconds interval);

    FrameSampler& sampler_;
    int max_frames_;
    std::chrono::milliseconds interval_;
    int produced_ = 0;
};

/**
 * @brief Pulls frames from the camera at a controlled cadence
 *
 * Bound to one CameraSession; not shared across attempts.
 */
class FrameSampler {
public:
    /**
     * @throws PresenceError(ModelNotReady) if the source is not loaded
     */
    FrameSampler(CameraSession& camera,
                 DescriptorSource& source,
                 std::shared_ptr<const CancelToken> cancel = nullptr,
                 Sleeper sleeper = default_sleeper());

    /**
     * @brief Lazy sequence of up to max_frames samples, interval_ms apart
     */
    FrameSequence sample(int max_frames, int interval_ms);

    /**
     * @brief Grab and analyze exactly one frame
     */
    FaceSample sample_once();

    /**
     * @brief Cancellable pause (stabilization, warm-up)
     */
    void pause(int ms);

    uint64_t frames_sampled() const { return frames_sampled_; }

private:
    friend class FrameSequence;

    CameraSession& camera_;
    DescriptorSource& source_;
    std::shared_ptr<const CancelToken> cancel_;
    Sleeper sleeper_;
    uint64_t frames_sampled_ = 0;

    void check_cancelled() const;
};

/**
 * @brief Values extracted from the valid frames of one check
 */
template <typename T>
struct TolerantSamples {
    std::vector<T> values;
    int frames_requested = 0;

    int valid() const { return static_cast<int>(values.size()); }

    /**
     * @brief At least half of the requested frames were usable
     */
    bool enough() const { return valid() * 2 >= frames_requested; }
};

/**
 * @brief Sample-with-tolerance: continue on tracking loss, count at the end
 *
 * Every check uses this with its own frame count, interval and per-frame
 * extraction. The extractor returns std::nullopt for frames it cannot use.
 */
template <typename T, typename Extract>
TolerantSamples<T> collect_with_tolerance(FrameSampler& sampler, int frames, int interval_ms,
                                          Extract extract) {
    TolerantSamples<T> result;
    result.frames_requested = frames;
    result.values.reserve(frames);

    FrameSequence sequence = sampler.sample(frames, interval_ms);
    while (auto sample = sequence.next()) {
        if (!sample->has_face()) {
            continue;
        }
        std::optional<T> value = extract(*sample);
        if (value) {
            result.values.push_back(*value);
        }
    }
    return result;
}

} // namespace presence
