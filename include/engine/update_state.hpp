#pragma once

#include <string_view>

namespace pkgrepo {

enum class UpdateState {
    Idle,
    Resolving,
    Locking,
    Staging,
    BuildingMetadata,
    Signing,
    Publishing,
    Releasing,
    Done,
    Failing,
    RolledBack,
};

std::string_view ToString(UpdateState state);

// States after which a failure must run the rollback path.
bool RequiresRollback(UpdateState state);

} // namespace pkgrepo
