#include "engine/engine_factory.hpp"

#include "signing/gpg_signing_backend.hpp"
#include "storage/filesystem_object_store.hpp"
#include "storage/memory_object_store.hpp"
#include "storage/retrying_object_store.hpp"
#include "util/logger.hpp"

#include <cstdlib>

namespace pkgrepo {

namespace {

Result OpenStore(const config::StorageConfig& cfg, std::shared_ptr<IObjectStore>& out) {
    if (cfg.type == "memory") {
        out = std::make_shared<MemoryObjectStore>();
        return Result::Ok();
    }
    auto fs = std::make_shared<FilesystemObjectStore>();
    auto r = FilesystemObjectStore::Open(cfg.root, *fs);
    if (!r.is_ok()) return r;
    out = std::move(fs);
    return Result::Ok();
}

std::shared_ptr<ISigningBackend> MakeSigningBackend(const config::SigningConfig& cfg) {
    GpgOptions g;
    g.gpg_executable = cfg.gpg_executable;
    g.rpm_executable = cfg.rpm_executable;
    g.key_path = cfg.key_path;
    g.privileged_command = cfg.privileged_command;
    g.verify_uses_system_keyring = cfg.verify_uses_system_keyring;
    g.timeout = cfg.timeout;
    if (!cfg.passphrase_env.empty()) {
        if (const char* pass = std::getenv(cfg.passphrase_env.c_str())) g.passphrase = pass;
    }
    return std::make_shared<GpgSigningBackend>(std::move(g));
}

} // namespace

Result BuildEngine(const config::EngineConfig& cfg,
                   std::shared_ptr<IObjectStore> store,
                   std::shared_ptr<const IClock> clock,
                   Engine& out) {
    if (cfg.routing.empty()) return Result::Fail(ErrorCode::InvalidConfig, "no routing rules configured");
    if (!clock) clock = SystemClock();

    if (!store) {
        auto r = OpenStore(cfg.storage, store);
        if (!r.is_ok()) return r;
    }

    EngineServices svc;
    svc.clock = clock;
    svc.store = std::make_shared<RetryingObjectStore>(std::move(store), cfg.storage_retry, clock);
    svc.extractor = std::make_shared<DescriptorExtractor>(DescriptorExtractor::Options{cfg.strict_headers});
    svc.locator = std::make_shared<RepositoryLocator>(cfg.routing);
    svc.locks = std::make_shared<LockManager>(*svc.store, cfg.lock, clock);

    std::shared_ptr<IMetadataGenerator> generator;
    if (cfg.metadata.generator == "external") {
        generator = std::make_shared<ExternalMetadataGenerator>(
            ExternalGeneratorOptions{cfg.metadata.command, cfg.metadata.timeout});
    } else {
        generator = std::make_shared<NativeMetadataGenerator>();
    }
    svc.builder = std::make_shared<MetadataBuilder>(std::move(generator), clock);

    if (cfg.signing.enabled) {
        svc.signer = std::make_shared<Signer>(MakeSigningBackend(cfg.signing),
                                              SignerOptions{cfg.signing.sign_packages, cfg.signing.verify});
    } else {
        svc.signer = std::make_shared<Signer>();
    }

    if (!cfg.cdn_invalidate_command.empty())
        svc.invalidator = std::make_shared<CommandCacheInvalidator>(cfg.cdn_invalidate_command, std::chrono::seconds(60));

    svc.holder_id = MakeHolderId();
    LogDebug("engine: store=%s holder=%s rules=%zu", svc.store->Describe().c_str(), svc.holder_id.c_str(),
             cfg.routing.size());

    out.services = svc;
    out.orchestrator = std::make_unique<UpdateOrchestrator>(std::move(svc));
    return Result::Ok();
}

} // namespace pkgrepo
