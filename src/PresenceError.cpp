#include "PresenceError.hpp"
#include "FaceTypes.hpp"

namespace presence {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CameraUnavailable:           return "CameraUnavailable";
        case ErrorKind::ModelNotReady:               return "ModelNotReady";
        case ErrorKind::TrackingLost:                return "TrackingLost";
        case ErrorKind::MotionCheckFailed:           return "MotionCheckFailed";
        case ErrorKind::ChallengeFailed:             return "ChallengeFailed";
        case ErrorKind::DescriptorDimensionMismatch: return "DescriptorDimensionMismatch";
        case ErrorKind::GatewayNetworkError:         return "GatewayNetworkError";
        case ErrorKind::GatewayConflict:             return "GatewayConflict";
        case ErrorKind::GatewayRejected:             return "GatewayRejected";
        case ErrorKind::InvalidInput:                return "InvalidInput";
        case ErrorKind::AttemptInProgress:           return "AttemptInProgress";
        case ErrorKind::Cancelled:                   return "Cancelled";
        case ErrorKind::NoPendingCandidate:          return "NoPendingCandidate";
    }
    return "Unknown";
}

const char* to_string(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::None:              return "None";
        case ConflictKind::DuplicateIdentity: return "DuplicateIdentity";
        case ConflictKind::DuplicateFace:     return "DuplicateFace";
        case ConflictKind::Other:             return "Other";
    }
    return "Unknown";
}

const char* to_string(ChallengeKind kind) {
    switch (kind) {
        case ChallengeKind::BLINK:      return "blink";
        case ChallengeKind::TURN_LEFT:  return "turnLeft";
        case ChallengeKind::TURN_RIGHT: return "turnRight";
    }
    return "unknown";
}

} // namespace presence
