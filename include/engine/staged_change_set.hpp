#pragma once

#include "metadata/repository_index.hpp"
#include "storage/object_store.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace pkgrepo {

// Objects written for one repository update. Either adopted by the manifest
// write or deleted by Rollback(); never partially kept.
class StagedChangeSet {
public:
    explicit StagedChangeSet(std::string prefix) : prefix_(std::move(prefix)) {}

    const std::string& Prefix() const { return prefix_; }

    void AddPackage(IndexEntry entry) { added_.push_back(std::move(entry)); }
    void RemoveHash(std::string content_hash) { removed_.push_back(std::move(content_hash)); }
    void RecordObject(std::string key) { written_.push_back(std::move(key)); }
    void MarkPublished() { published_ = true; }

    const std::vector<IndexEntry>& Added() const { return added_; }
    const std::vector<std::string>& Removed() const { return removed_; }
    const std::vector<std::string>& WrittenObjects() const { return written_; }
    bool Empty() const { return added_.empty() && removed_.empty(); }
    bool Published() const { return published_; }

    // Deletes every written object, newest first. Keeps going past failures
    // and reports the first one. No-op once published.
    Result Rollback(IObjectStore& store);

private:
    std::string prefix_;
    std::vector<IndexEntry> added_;
    std::vector<std::string> removed_;
    std::vector<std::string> written_;
    bool published_ = false;
};

} // namespace pkgrepo
