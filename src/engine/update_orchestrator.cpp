#include "engine/update_orchestrator.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace pkgrepo {

namespace {

bool CancelRequested(const UpdateOptions& opt) {
    return opt.cancel && opt.cancel->load(std::memory_order_relaxed);
}

void SetFailed(ReportEntry& e, const Result& r, Outcome outcome = Outcome::Failed) {
    e.outcome = outcome;
    e.error = r.err;
    e.message = r.msg;
}

} // namespace

UpdateOrchestrator::UpdateOrchestrator(EngineServices services)
    : svc_(std::move(services)), index_store_(*svc_.store) {
    if (!svc_.clock) svc_.clock = SystemClock();
    if (!svc_.signer) svc_.signer = std::make_shared<Signer>();
    if (svc_.holder_id.empty()) svc_.holder_id = MakeHolderId();
}

void UpdateOrchestrator::Transition(JobContext& ctx, UpdateState next) {
    const UpdateState prev = ctx.state;
    ctx.state = next;
    LogInfo("%s: %s -> %s", ctx.job.prefix.empty() ? "/" : ctx.job.prefix.c_str(),
            std::string(ToString(prev)).c_str(), std::string(ToString(next)).c_str());
    if (observer_) observer_->OnStateChange(ctx.job.prefix, prev, next);
}

void UpdateOrchestrator::FailJob(JobContext& ctx, const Result& error) {
    for (size_t idx : ctx.job.entries) {
        auto& e = ctx.report.entries[idx];
        if (e.IsFailure()) continue;
        SetFailed(e, error);
    }
}

void UpdateOrchestrator::AbortUnresolved(UpdateReport& report, const Result& cause) {
    for (auto& e : report.entries) {
        if (e.IsFailure()) continue;
        SetFailed(e, Result::Fail(cause.err, "batch aborted: " + cause.msg), Outcome::Aborted);
    }
}

Result UpdateOrchestrator::Checkpoint(const UpdateOptions& opt, LeaseGuard& lease) const {
    if (CancelRequested(opt)) return Result::Fail(ErrorCode::Cancelled, "update cancelled");
    if (opt.deadline && svc_.clock->Now() >= *opt.deadline)
        return Result::Fail(ErrorCode::Timeout, "deadline passed");
    return lease.RenewIfDue();
}

Result UpdateOrchestrator::Add(std::vector<PackageInput> packages, const UpdateOptions& opt, UpdateReport& report) {
    report = UpdateReport{};
    report.operation = "add";
    return AddResolved(std::move(packages), false, opt, report);
}

Result UpdateOrchestrator::AddFromStorage(const std::vector<std::string>& keys,
                                          bool remove_source,
                                          const UpdateOptions& opt,
                                          UpdateReport& report) {
    report = UpdateReport{};
    report.operation = "add";

    std::vector<PackageInput> inputs;
    bool read_failed = false;
    for (const auto& raw_key : keys) {
        const std::string key = NormalizeKey(raw_key);
        StoredObject obj;
        auto r = svc_.store->Get(key, obj);
        if (!r.is_ok()) {
            ReportEntry e;
            e.package = key;
            SetFailed(e, r);
            report.entries.push_back(std::move(e));
            read_failed = true;
            continue;
        }
        inputs.push_back(PackageInput{std::string(KeyBaseName(key)), std::move(obj.data), key});
    }
    if (read_failed && !opt.best_effort) {
        const Result cause = report.FirstFailure();
        for (const auto& in : inputs) {
            ReportEntry e;
            e.package = in.filename;
            SetFailed(e, Result::Fail(cause.err, "batch aborted: " + cause.msg), Outcome::Aborted);
            report.entries.push_back(std::move(e));
        }
        return cause;
    }
    return AddResolved(std::move(inputs), remove_source, opt, report);
}

Result UpdateOrchestrator::AddResolved(std::vector<PackageInput> packages,
                                       bool remove_source,
                                       const UpdateOptions& opt,
                                       UpdateReport& report) {
    std::map<std::string, RepositoryJob> jobs;
    std::map<std::string, std::string> first_by_hash;
    Result first_failure;

    for (auto& in : packages) {
        const size_t idx = report.entries.size();
        report.entries.emplace_back();
        ReportEntry& e = report.entries.back();
        e.package = in.filename;

        ExtractedPackage x;
        auto r = svc_.extractor->Extract(in.filename, in.bytes, x);
        if (!r.is_ok()) {
            SetFailed(e, r);
            if (first_failure.is_ok()) first_failure = r;
            continue;
        }
        e.content_hash = x.descriptor.content_hash;
        e.warnings = x.warnings;
        for (const auto& w : x.warnings) LogWarn("%s: %s", in.filename.c_str(), w.c_str());

        std::string prefix;
        r = svc_.locator->Resolve(x.descriptor, prefix);
        if (!r.is_ok()) {
            SetFailed(e, r);
            if (first_failure.is_ok()) first_failure = r;
            continue;
        }
        prefix = NormalizeKey(prefix);
        e.repository = prefix;

        auto [job_it, created] = jobs.try_emplace(prefix);
        RepositoryJob& job = job_it->second;
        if (created) {
            job.prefix = prefix;
            job.format = x.descriptor.format;
            LogDebug("%s: IDLE -> RESOLVING", prefix.c_str());
        } else if (job.format != x.descriptor.format) {
            r = Result::Fail(ErrorCode::NoMatchingRepository,
                             std::string(ToString(x.descriptor.format)) + " package routed to " + prefix +
                                 " which receives " + std::string(ToString(job.format)) + " packages");
            SetFailed(e, r);
            if (first_failure.is_ok()) first_failure = r;
            continue;
        }
        job.entries.push_back(idx);

        auto [dup_it, fresh] = first_by_hash.try_emplace(x.descriptor.content_hash, in.filename);
        if (!fresh) {
            e.outcome = Outcome::Unchanged;
            e.message = "duplicate of " + dup_it->second + " in this batch";
            continue;
        }

        PendingAdd add;
        add.entry = idx;
        add.extracted = std::move(x);
        add.bytes = std::move(in.bytes);
        if (remove_source) add.source_key = in.source_key;
        job.adds.push_back(std::move(add));
    }

    if (!first_failure.is_ok() && !opt.best_effort) {
        LogError("resolution failed, aborting batch: %s", first_failure.msg.c_str());
        AbortUnresolved(report, first_failure);
        return report.FirstFailure();
    }

    std::vector<RepositoryJob> ordered;
    for (auto& [prefix, job] : jobs) ordered.push_back(std::move(job));
    return RunJobs(ordered, opt, report);
}

Result UpdateOrchestrator::Remove(const std::vector<std::string>& content_hashes,
                                  const std::vector<std::string>& prefixes,
                                  const UpdateOptions& opt,
                                  UpdateReport& report) {
    report = UpdateReport{};
    report.operation = "remove";

    std::vector<std::string> candidates;
    if (prefixes.empty()) {
        auto r = index_store_.DiscoverRepositories(candidates);
        if (!r.is_ok()) {
            for (const auto& h : content_hashes) {
                ReportEntry e;
                e.package = h;
                e.content_hash = h;
                SetFailed(e, r);
                report.entries.push_back(std::move(e));
            }
            return r;
        }
    } else {
        for (const auto& p : prefixes) candidates.push_back(NormalizeKey(p));
        std::sort(candidates.begin(), candidates.end());
        candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    }

    std::vector<std::pair<std::string, CurrentState>> states;
    for (const auto& prefix : candidates) {
        CurrentState st;
        auto r = index_store_.ReadCurrent(prefix, st);
        if (!r.is_ok()) {
            LogWarn("skipping repository %s: %s", prefix.c_str(), r.msg.c_str());
            continue;
        }
        if (st.exists) states.emplace_back(prefix, std::move(st));
    }

    std::map<std::string, RepositoryJob> jobs;
    std::set<std::string> seen;
    Result first_failure;
    for (const auto& raw : content_hashes) {
        std::string hash = raw;
        std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) { return std::tolower(c); });
        if (!seen.insert(hash).second) continue;

        if (!IsSha256Hex(hash)) {
            ReportEntry e;
            e.package = raw;
            auto r = Result::Fail(ErrorCode::MalformedPackage, "not a SHA-256 content hash: " + raw);
            SetFailed(e, r);
            report.entries.push_back(std::move(e));
            if (first_failure.is_ok()) first_failure = r;
            continue;
        }

        bool found = false;
        for (const auto& [prefix, st] : states) {
            const IndexEntry* entry = st.index.Find(hash);
            if (!entry) continue;
            found = true;

            const size_t idx = report.entries.size();
            ReportEntry e;
            e.package = entry->filename;
            e.content_hash = hash;
            e.repository = prefix;
            report.entries.push_back(std::move(e));

            auto [job_it, created] = jobs.try_emplace(prefix);
            if (created) {
                job_it->second.prefix = prefix;
                job_it->second.format = st.index.format;
            }
            job_it->second.entries.push_back(idx);
            job_it->second.removes.push_back(PendingRemove{idx, hash});
        }
        if (!found) {
            ReportEntry e;
            e.package = raw;
            e.content_hash = hash;
            auto r = Result::Fail(ErrorCode::PackageNotFound, "no repository holds " + hash);
            SetFailed(e, r);
            report.entries.push_back(std::move(e));
            if (first_failure.is_ok()) first_failure = r;
        }
    }

    if (!first_failure.is_ok() && !opt.best_effort) {
        AbortUnresolved(report, first_failure);
        return report.FirstFailure();
    }

    std::vector<RepositoryJob> ordered;
    for (auto& [prefix, job] : jobs) ordered.push_back(std::move(job));
    return RunJobs(ordered, opt, report);
}

Result UpdateOrchestrator::Init(const std::string& prefix,
                                PackageFormat format,
                                const UpdateOptions& opt,
                                UpdateReport& report) {
    report = UpdateReport{};
    report.operation = "init";

    ReportEntry e;
    e.package = NormalizeKey(prefix);
    e.repository = e.package;
    if (format == PackageFormat::Unknown) {
        SetFailed(e, Result::Fail(ErrorCode::InvalidConfig, "repository format must be rpm or deb"));
        report.entries.push_back(std::move(e));
        return report.FirstFailure();
    }
    report.entries.push_back(std::move(e));

    std::vector<RepositoryJob> jobs(1);
    jobs[0].prefix = NormalizeKey(prefix);
    jobs[0].format = format;
    jobs[0].init = true;
    jobs[0].entries.push_back(0);
    return RunJobs(jobs, opt, report);
}

Result UpdateOrchestrator::Plan(const std::vector<PackageInput>& packages, UpdateReport& report) const {
    report = UpdateReport{};
    report.operation = "plan";
    for (const auto& in : packages) {
        ReportEntry e;
        e.package = in.filename;
        ExtractedPackage x;
        auto r = svc_.extractor->Extract(in.filename, in.bytes, x);
        if (r.is_ok()) {
            e.content_hash = x.descriptor.content_hash;
            e.warnings = x.warnings;
            std::string prefix;
            r = svc_.locator->Resolve(x.descriptor, prefix);
            if (r.is_ok()) {
                e.repository = NormalizeKey(prefix);
                e.outcome = Outcome::Planned;
                e.message = x.descriptor.Nevra();
            }
        }
        if (!r.is_ok()) SetFailed(e, r);
        report.entries.push_back(std::move(e));
    }
    return Result::Ok();
}

Result UpdateOrchestrator::List(const std::string& prefix, std::vector<IndexEntry>& out) const {
    out.clear();
    CurrentState st;
    auto r = index_store_.ReadCurrent(prefix, st);
    if (!r.is_ok()) return r;
    if (!st.exists) return Result::Fail(ErrorCode::NotFound, "no repository at " + NormalizeKey(prefix));
    for (const auto& [hash, entry] : st.index.packages) out.push_back(entry);
    return Result::Ok();
}

Result UpdateOrchestrator::RunJobs(std::vector<RepositoryJob>& jobs, const UpdateOptions& opt, UpdateReport& report) {
    for (auto& job : jobs) RunJob(job, opt, report);
    return report.FirstFailure();
}

void UpdateOrchestrator::RunJob(RepositoryJob& job, const UpdateOptions& opt, UpdateReport& report) {
    JobContext ctx{job, report, opt};
    Transition(ctx, UpdateState::Locking);

    HeldLease held;
    auto r = svc_.locks->Acquire(job.prefix, svc_.holder_id, opt.deadline, opt.cancel, held);
    if (!r.is_ok()) {
        Transition(ctx, UpdateState::Failing);
        FailJob(ctx, r);
        return;
    }
    LeaseGuard lease(*svc_.locks, std::move(held));
    StagedChangeSet staged(job.prefix);

    auto fail = [&](const Result& err) {
        const bool rollback = RequiresRollback(ctx.state);
        LogError("%s: update failed in %s: %s", job.prefix.c_str(), std::string(ToString(ctx.state)).c_str(),
                 err.msg.c_str());
        Transition(ctx, UpdateState::Failing);
        if (rollback) {
            auto rb = staged.Rollback(*svc_.store);
            if (!rb.is_ok()) LogError("%s: rollback incomplete: %s", job.prefix.c_str(), rb.msg.c_str());
            Transition(ctx, UpdateState::RolledBack);
        }
        auto rel = lease.Release();
        if (!rel.is_ok()) LogWarn("%s: %s", job.prefix.c_str(), rel.msg.c_str());
        FailJob(ctx, err);
    };

    Transition(ctx, UpdateState::Staging);
    r = Stage(ctx, staged, lease);
    if (!r.is_ok()) return fail(r);

    const bool needs_publish = !staged.Empty() || !ctx.current.exists;
    if (needs_publish) {
        Transition(ctx, UpdateState::BuildingMetadata);
        MetadataBuildOutput build;
        r = svc_.builder->Build(ctx.current.index, staged.Added(), staged.Removed(), build);
        if (r.is_ok()) r = Checkpoint(opt, lease);
        if (!r.is_ok()) return fail(r);

        Transition(ctx, UpdateState::Signing);
        r = svc_.signer->SignManifest(build.manifest);
        if (r.is_ok()) r = Checkpoint(opt, lease);
        if (!r.is_ok()) return fail(r);

        Transition(ctx, UpdateState::Publishing);
        r = Publish(ctx, build, staged, lease);
        if (!r.is_ok()) return fail(r);
        CleanupAfterPublish(ctx, build, staged);
    } else {
        LogInfo("%s: nothing to change", job.prefix.c_str());
    }

    Transition(ctx, UpdateState::Releasing);
    r = lease.Release();
    if (!r.is_ok()) LogWarn("%s: %s", job.prefix.c_str(), r.msg.c_str());
    Transition(ctx, UpdateState::Done);
}

Result UpdateOrchestrator::Stage(JobContext& ctx, StagedChangeSet& staged, LeaseGuard& lease) {
    RepositoryJob& job = ctx.job;
    auto r = index_store_.ReadCurrent(job.prefix, ctx.current);
    if (!r.is_ok()) return r;

    if (!ctx.current.exists) {
        if (!job.removes.empty())
            return Result::Fail(ErrorCode::PackageNotFound, "repository " + job.prefix + " does not exist");
        ctx.current.index.format = job.format;
        LogInfo("%s: creating new %s repository", job.prefix.c_str(), std::string(ToString(job.format)).c_str());
        if (job.init) ctx.report.entries[job.entries.front()].outcome = Outcome::Initialized;
    } else if (job.format != PackageFormat::Unknown && job.format != ctx.current.index.format) {
        return Result::Fail(ErrorCode::InvalidConfig,
                            "repository " + job.prefix + " holds " +
                                std::string(ToString(ctx.current.index.format)) + " packages, not " +
                                std::string(ToString(job.format)));
    } else if (job.init) {
        auto& e = ctx.report.entries[job.entries.front()];
        e.outcome = Outcome::Unchanged;
        e.message = "repository already initialized";
    }

    for (auto& add : job.adds) {
        r = Checkpoint(ctx.opt, lease);
        if (!r.is_ok()) return r;
        r = StageAdd(ctx, add, staged);
        if (!r.is_ok()) return r;
    }

    for (const auto& rm : job.removes) {
        auto& e = ctx.report.entries[rm.entry];
        if (!ctx.current.index.Find(rm.content_hash)) {
            SetFailed(e, Result::Fail(ErrorCode::PackageNotFound,
                                      rm.content_hash + " is no longer in " + job.prefix));
            continue;
        }
        staged.RemoveHash(rm.content_hash);
        e.outcome = Outcome::Removed;
    }
    return Result::Ok();
}

Result UpdateOrchestrator::StageAdd(JobContext& ctx, PendingAdd& add, StagedChangeSet& staged) {
    auto& e = ctx.report.entries[add.entry];
    const PackageDescriptor& d = add.extracted.descriptor;

    if (ctx.current.index.Find(d.content_hash)) {
        e.outcome = Outcome::Unchanged;
        e.message = "already present";
        // Content is published, so the uploaded copy is no longer needed.
        if (!add.source_key.empty()) {
            auto r = DeleteObject(*svc_.store, add.source_key);
            if (!r.is_ok()) LogWarn("cannot delete source %s: %s", add.source_key.c_str(), r.msg.c_str());
        }
        return Result::Ok();
    }

    if (const IndexEntry* old = ctx.current.index.FindSameIdentity(d)) {
        LogWarn("%s: %s replaces %s", ctx.job.prefix.c_str(), add.extracted.filename.c_str(),
                old->descriptor.content_hash.c_str());
        e.warnings.push_back("replaces " + old->filename + " (" + old->descriptor.content_hash + ")");
        staged.RemoveHash(old->descriptor.content_hash);
    }

    Bytes bytes = std::move(add.bytes);
    bool is_signed = false;
    auto r = svc_.signer->SignPackage(d.format, add.extracted.filename, bytes, is_signed);
    if (!r.is_ok()) return r;

    IndexEntry entry;
    entry.descriptor = d;
    entry.filename = add.extracted.filename;
    entry.object_key = PackageObjectKey(ctx.job.prefix, d);
    entry.size = bytes.size();
    entry.object_sha256 = Sha256Hex(bytes);
    entry.is_signed = is_signed;

    r = PutObject(*svc_.store, entry.object_key, bytes);
    if (!r.is_ok()) return Result::Wrap(r, "stage " + entry.object_key);
    staged.RecordObject(entry.object_key);
    LogInfo("%s: staged %s as %s", ctx.job.prefix.c_str(), entry.filename.c_str(), entry.object_key.c_str());

    staged.AddPackage(std::move(entry));
    e.outcome = Outcome::Added;
    return Result::Ok();
}

Result UpdateOrchestrator::Publish(JobContext& ctx,
                                   const MetadataBuildOutput& build,
                                   StagedChangeSet& staged,
                                   LeaseGuard& lease) {
    std::set<std::string> live;
    for (const auto& c : ctx.current.manifest.components) live.insert(c.key);

    for (const auto& sc : build.components) {
        if (live.count(sc.component.key)) continue;
        auto r = PutObject(*svc_.store, sc.component.key, sc.data);
        if (!r.is_ok()) return Result::Wrap(r, "write " + sc.component.key);
        staged.RecordObject(sc.component.key);
    }

    auto r = Checkpoint(ctx.opt, lease);
    if (!r.is_ok()) return r;

    // Every referenced object exists now; the manifest goes last.
    const std::string key = ManifestKey(ctx.job.prefix);
    const Precondition pre = ctx.current.exists ? Precondition::IfMatch(ctx.current.manifest_token)
                                                : Precondition::IfAbsent();
    const std::string body = EncodeManifest(build.manifest);
    r = svc_.store->Put(key, ToBytes(body), pre, nullptr);
    if (r.err == ErrorCode::PreconditionFailed)
        return Result::Fail(ErrorCode::RepositoryBusy, "manifest of " + ctx.job.prefix + " changed during the update");
    if (!r.is_ok()) return Result::Wrap(r, "write " + key);

    staged.MarkPublished();
    LogInfo("%s: published metadata v%llu (%llu packages)", ctx.job.prefix.c_str(),
            static_cast<unsigned long long>(build.manifest.metadata_version),
            static_cast<unsigned long long>(build.manifest.package_count));
    return Result::Ok();
}

void UpdateOrchestrator::CleanupAfterPublish(JobContext& ctx,
                                             const MetadataBuildOutput& build,
                                             const StagedChangeSet& staged) {
    std::vector<std::string> changed{ManifestKey(ctx.job.prefix)};
    auto remove = [&](const std::string& key) {
        auto r = DeleteObject(*svc_.store, key);
        if (!r.is_ok()) {
            LogWarn("%s: cleanup of %s failed: %s", ctx.job.prefix.c_str(), key.c_str(), r.msg.c_str());
            return;
        }
        changed.push_back(key);
    };

    std::set<std::string> referenced;
    for (const auto& c : build.manifest.components) referenced.insert(c.key);
    for (const auto& c : ctx.current.manifest.components) {
        if (!referenced.count(c.key)) remove(c.key);
    }

    std::set<std::string> live_objects;
    for (const auto& [hash, entry] : build.index.packages) live_objects.insert(entry.object_key);
    for (const auto& hash : staged.Removed()) {
        const IndexEntry* old = ctx.current.index.Find(hash);
        if (old && !live_objects.count(old->object_key)) remove(old->object_key);
    }

    for (const auto& add : ctx.job.adds) {
        if (add.source_key.empty() || live_objects.count(add.source_key)) continue;
        auto r = DeleteObject(*svc_.store, add.source_key);
        if (!r.is_ok()) LogWarn("cannot delete source %s: %s", add.source_key.c_str(), r.msg.c_str());
    }

    if (svc_.invalidator) {
        auto r = svc_.invalidator->Invalidate(ctx.job.prefix, changed);
        if (!r.is_ok()) LogWarn("%s: cache invalidation failed: %s", ctx.job.prefix.c_str(), r.msg.c_str());
    }
}

} // namespace pkgrepo
