#include "engine/update_hooks.hpp"

#include "util/process.hpp"

namespace pkgrepo {

CommandCacheInvalidator::CommandCacheInvalidator(std::vector<std::string> command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

Result CommandCacheInvalidator::Invalidate(const std::string& prefix, const std::vector<std::string>& keys) {
    if (command_.empty()) return Result::Ok();

    ProcessSpec spec;
    spec.timeout = timeout_;
    for (auto arg : command_) {
        for (auto pos = arg.find("{prefix}"); pos != std::string::npos; pos = arg.find("{prefix}", pos + prefix.size()))
            arg.replace(pos, 8, prefix);
        spec.argv.push_back(std::move(arg));
    }
    for (const auto& k : keys) spec.argv.push_back("/" + k);

    ProcessOutput po;
    return RunProcessChecked(spec, po, ErrorCode::StorageError);
}

} // namespace pkgrepo
