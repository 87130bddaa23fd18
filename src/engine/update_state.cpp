#include "engine/update_state.hpp"

namespace pkgrepo {

std::string_view ToString(UpdateState state) {
    switch (state) {
        case UpdateState::Idle: return "IDLE";
        case UpdateState::Resolving: return "RESOLVING";
        case UpdateState::Locking: return "LOCKING";
        case UpdateState::Staging: return "STAGING";
        case UpdateState::BuildingMetadata: return "BUILDING_METADATA";
        case UpdateState::Signing: return "SIGNING";
        case UpdateState::Publishing: return "PUBLISHING";
        case UpdateState::Releasing: return "RELEASING";
        case UpdateState::Done: return "DONE";
        case UpdateState::Failing: return "FAILING";
        case UpdateState::RolledBack: return "ROLLED_BACK";
    }
    return "UNKNOWN";
}

bool RequiresRollback(UpdateState state) {
    switch (state) {
        case UpdateState::Staging:
        case UpdateState::BuildingMetadata:
        case UpdateState::Signing:
        case UpdateState::Publishing:
            return true;
        default:
            return false;
    }
}

} // namespace pkgrepo
