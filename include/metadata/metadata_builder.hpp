#pragma once

#include "metadata/metadata_generator.hpp"
#include "metadata/repository_index.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pkgrepo {

struct StagedComponent {
    ManifestComponent component;
    Bytes data;
};

struct MetadataBuildOutput {
    RepositoryIndex index;
    // Unsigned; components listed in generation order.
    RepositoryManifest manifest;
    std::vector<StagedComponent> components;
};

// (current index, added, removed) -> complete new metadata set. Never touches
// storage; failures are MetadataBuildFailed.
class MetadataBuilder {
public:
    MetadataBuilder(std::shared_ptr<IMetadataGenerator> generator, std::shared_ptr<const IClock> clock);

    Result Build(const RepositoryIndex& current,
                 const std::vector<IndexEntry>& added,
                 const std::vector<std::string>& removed,
                 MetadataBuildOutput& out) const;

    // (current + added) - removed, metadata_version bumped.
    static RepositoryIndex ApplyDelta(const RepositoryIndex& current,
                                      const std::vector<IndexEntry>& added,
                                      const std::vector<std::string>& removed);

    const IMetadataGenerator& Generator() const { return *generator_; }

private:
    Result Validate(const RepositoryIndex& expected, const MetadataBuildOutput& out) const;

    std::shared_ptr<IMetadataGenerator> generator_;
    std::shared_ptr<const IClock> clock_;
};

} // namespace pkgrepo
