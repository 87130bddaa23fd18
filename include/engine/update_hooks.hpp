#pragma once

#include "engine/update_state.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace pkgrepo {

class IUpdateObserver {
public:
    virtual ~IUpdateObserver() = default;
    virtual void OnStateChange(const std::string& prefix, UpdateState from, UpdateState to) = 0;
};

// Told which keys changed after a successful publication.
class ICacheInvalidator {
public:
    virtual ~ICacheInvalidator() = default;
    virtual Result Invalidate(const std::string& prefix, const std::vector<std::string>& keys) = 0;
};

// Runs argv with "{prefix}" substituted and the changed keys appended.
class CommandCacheInvalidator final : public ICacheInvalidator {
public:
    CommandCacheInvalidator(std::vector<std::string> command, std::chrono::seconds timeout);
    Result Invalidate(const std::string& prefix, const std::vector<std::string>& keys) override;

private:
    std::vector<std::string> command_;
    std::chrono::seconds timeout_;
};

} // namespace pkgrepo
