#pragma once

#include "metadata/repository_index.hpp"
#include "storage/object_store.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace pkgrepo {

// Published state of one repository as seen through its manifest.
struct CurrentState {
    bool exists = false;
    // Token of the manifest object; the publish precondition.
    VersionToken manifest_token;
    RepositoryManifest manifest;
    RepositoryIndex index;
};

class IndexStore {
public:
    explicit IndexStore(IObjectStore& store) : store_(store) {}

    // Missing manifest is not an error: exists=false and an empty index.
    Result ReadCurrent(const std::string& prefix, CurrentState& out) const;

    // Prefixes that hold a manifest, sorted.
    Result DiscoverRepositories(std::vector<std::string>& out_prefixes) const;

private:
    IObjectStore& store_;
};

} // namespace pkgrepo
