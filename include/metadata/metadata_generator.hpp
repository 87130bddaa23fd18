#pragma once

#include "io/io.hpp"
#include "metadata/repository_index.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pkgrepo {

// One generated index file. Stored as <prefix>/metadata/<type>-<sha256>.<extension>.
struct GeneratedComponent {
    std::string type;
    std::string extension;
    Bytes data;
};

// Computes the full metadata set for a package index. Must be idempotent for
// the same index and accept an empty one.
class IMetadataGenerator {
public:
    virtual ~IMetadataGenerator() = default;
    virtual Result Generate(const RepositoryIndex& index, std::vector<GeneratedComponent>& out) = 0;
    virtual std::string Describe() const = 0;
};

// primary (gzip'd index JSON) and checksums ("<sha256>  <relative key>" lines).
class NativeMetadataGenerator final : public IMetadataGenerator {
public:
    Result Generate(const RepositoryIndex& index, std::vector<GeneratedComponent>& out) override;
    std::string Describe() const override { return "native"; }
};

struct ExternalGeneratorOptions {
    // argv; "{input}", "{output}", "{prefix}" and "{format}" are substituted.
    std::vector<std::string> command;
    std::chrono::seconds timeout{600};
};

// Native components plus every file the external tool writes under {output}.
// {input} is a directory holding packages.json. Output files become components
// typed "ext-" + their directories joined by '-' + the file name up to its
// first dot; the rest of the name is the extension. Directories are walked,
// any other non-regular entry fails the build.
class ExternalMetadataGenerator final : public IMetadataGenerator {
public:
    explicit ExternalMetadataGenerator(ExternalGeneratorOptions opt);

    Result Generate(const RepositoryIndex& index, std::vector<GeneratedComponent>& out) override;
    std::string Describe() const override;

private:
    ExternalGeneratorOptions opt_;
    NativeMetadataGenerator native_;
};

} // namespace pkgrepo
