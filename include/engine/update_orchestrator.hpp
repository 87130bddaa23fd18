#pragma once

#include "engine/staged_change_set.hpp"
#include "engine/update_hooks.hpp"
#include "engine/update_report.hpp"
#include "engine/update_state.hpp"
#include "io/io.hpp"
#include "lock/lock_manager.hpp"
#include "metadata/index_store.hpp"
#include "metadata/metadata_builder.hpp"
#include "package/descriptor_extractor.hpp"
#include "routing/repository_locator.hpp"
#include "signing/signer.hpp"
#include "storage/object_store.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pkgrepo {

struct PackageInput {
    std::string filename;
    Bytes bytes;
    // Object the package was read from, when it came from the store.
    std::string source_key;
};

struct UpdateOptions {
    // Skip inputs that cannot be resolved instead of aborting the batch.
    bool best_effort = false;
    std::optional<WallTime> deadline;
    const std::atomic_bool* cancel = nullptr;
};

struct EngineServices {
    std::shared_ptr<IObjectStore> store;
    std::shared_ptr<const DescriptorExtractor> extractor;
    std::shared_ptr<const RepositoryLocator> locator;
    std::shared_ptr<LockManager> locks;
    std::shared_ptr<const MetadataBuilder> builder;
    std::shared_ptr<const Signer> signer;
    std::shared_ptr<const IClock> clock;
    // Optional.
    std::shared_ptr<ICacheInvalidator> invalidator;
    std::string holder_id;
};

// Drives one update per affected repository:
// IDLE -> RESOLVING -> LOCKING -> STAGING -> BUILDING_METADATA -> SIGNING
//      -> PUBLISHING -> RELEASING -> DONE, or FAILING -> ROLLED_BACK.
// Repositories are processed one at a time in prefix order. Every method
// fills the report with one entry per input/repository pair and returns the
// first failure, if any.
class UpdateOrchestrator {
public:
    explicit UpdateOrchestrator(EngineServices services);

    void SetObserver(IUpdateObserver* observer) { observer_ = observer; }

    Result Add(std::vector<PackageInput> packages, const UpdateOptions& opt, UpdateReport& report);
    Result AddFromStorage(const std::vector<std::string>& keys,
                          bool remove_source,
                          const UpdateOptions& opt,
                          UpdateReport& report);
    // Searches prefixes, or every repository holding a manifest when empty.
    Result Remove(const std::vector<std::string>& content_hashes,
                  const std::vector<std::string>& prefixes,
                  const UpdateOptions& opt,
                  UpdateReport& report);
    Result Init(const std::string& prefix, PackageFormat format, const UpdateOptions& opt, UpdateReport& report);

    // Dry run: extraction and routing only. Never takes a lock or writes.
    Result Plan(const std::vector<PackageInput>& packages, UpdateReport& report) const;
    Result List(const std::string& prefix, std::vector<IndexEntry>& out) const;

private:
    struct PendingAdd {
        size_t entry = 0;
        ExtractedPackage extracted;
        Bytes bytes;
        // Deleted after publication when set.
        std::string source_key;
    };

    struct PendingRemove {
        size_t entry = 0;
        std::string content_hash;
    };

    struct RepositoryJob {
        std::string prefix;
        PackageFormat format = PackageFormat::Unknown;
        bool init = false;
        std::vector<PendingAdd> adds;
        std::vector<PendingRemove> removes;
        // Every report entry whose fate follows this job.
        std::vector<size_t> entries;
    };

    struct JobContext {
        RepositoryJob& job;
        UpdateReport& report;
        const UpdateOptions& opt;
        UpdateState state = UpdateState::Resolving;
        CurrentState current;
    };

    Result AddResolved(std::vector<PackageInput> packages,
                       bool remove_source,
                       const UpdateOptions& opt,
                       UpdateReport& report);
    Result RunJobs(std::vector<RepositoryJob>& jobs, const UpdateOptions& opt, UpdateReport& report);
    void RunJob(RepositoryJob& job, const UpdateOptions& opt, UpdateReport& report);

    Result Stage(JobContext& ctx, StagedChangeSet& staged, LeaseGuard& lease);
    Result StageAdd(JobContext& ctx, PendingAdd& add, StagedChangeSet& staged);
    Result Publish(JobContext& ctx, const MetadataBuildOutput& build, StagedChangeSet& staged, LeaseGuard& lease);
    void CleanupAfterPublish(JobContext& ctx, const MetadataBuildOutput& build, const StagedChangeSet& staged);
    Result Checkpoint(const UpdateOptions& opt, LeaseGuard& lease) const;

    void Transition(JobContext& ctx, UpdateState next);
    void FailJob(JobContext& ctx, const Result& error);
    static void AbortUnresolved(UpdateReport& report, const Result& cause);

    EngineServices svc_;
    IndexStore index_store_;
    IUpdateObserver* observer_ = nullptr;
};

} // namespace pkgrepo
