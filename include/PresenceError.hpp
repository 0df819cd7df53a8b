#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace presence {

enum class ErrorKind {
    CameraUnavailable,
    ModelNotReady,
    TrackingLost,
    MotionCheckFailed,
    ChallengeFailed,
    DescriptorDimensionMismatch,
    GatewayNetworkError,
    GatewayConflict,
    GatewayRejected,
    InvalidInput,
    AttemptInProgress,
    Cancelled,
    NoPendingCandidate
};

enum class ConflictKind {
    None,
    DuplicateIdentity,
    DuplicateFace,
    Other
};

const char* to_string(ErrorKind kind);
const char* to_string(ConflictKind kind);

/**
 * @brief Error that ends the current attempt
 *
 * Thrown by adapters and orchestration code. Liveness check failures are
 * not thrown; they come back as a failed LivenessOutcome.
 */
class PresenceError : public std::runtime_error {
public:
    PresenceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    PresenceError(ConflictKind conflict, const std::string& message, std::string existing_owner)
        : std::runtime_error(message),
          kind_(ErrorKind::GatewayConflict),
          conflict_(conflict),
          existing_owner_(std::move(existing_owner)) {}

    ErrorKind kind() const { return kind_; }
    ConflictKind conflict() const { return conflict_; }

    /** Owner of the duplicate identity/face, when the service reports one */
    const std::string& existing_owner() const { return existing_owner_; }

private:
    ErrorKind kind_;
    ConflictKind conflict_ = ConflictKind::None;
    std::string existing_owner_;
};

} // namespace presence
