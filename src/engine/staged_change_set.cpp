#include "engine/staged_change_set.hpp"

#include "util/logger.hpp"

namespace pkgrepo {

Result StagedChangeSet::Rollback(IObjectStore& store) {
    if (published_) return Result::Ok();

    Result first;
    size_t deleted = 0;
    for (auto it = written_.rbegin(); it != written_.rend(); ++it) {
        auto r = DeleteObject(store, *it);
        if (!r.is_ok()) {
            LogWarn("rollback %s: cannot delete %s: %s", prefix_.c_str(), it->c_str(), r.msg.c_str());
            if (first.is_ok()) first = r;
            continue;
        }
        ++deleted;
    }
    LogInfo("rollback %s: deleted %zu of %zu staged objects", prefix_.c_str(), deleted, written_.size());
    if (first.is_ok()) written_.clear();
    return first;
}

} // namespace pkgrepo
