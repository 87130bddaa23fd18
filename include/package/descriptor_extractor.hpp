#pragma once

#include "package/package_descriptor.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pkgrepo {

struct ExtractedPackage {
    PackageDescriptor descriptor;
    std::string filename;
    // DescriptorMismatch and header fallback diagnostics; never fatal.
    std::vector<std::string> warnings;
};

class DescriptorExtractor {
public:
    struct Options {
        // Refuse packages whose embedded header cannot be read instead of
        // falling back to the filename.
        bool strict_headers = false;
    };

    class IFormatStrategy {
    public:
        virtual ~IFormatStrategy() = default;
        virtual PackageFormat Format() const = 0;
        virtual bool HasMagic(std::span<const std::uint8_t> bytes) const = 0;
        virtual Result ParseFilename(std::string_view filename, PackageDescriptor& out) const = 0;
        virtual Result ReadHeader(std::span<const std::uint8_t> bytes, PackageDescriptor& out) const = 0;
    };

    DescriptorExtractor();
    explicit DescriptorExtractor(Options opt);
    DescriptorExtractor(Options opt, std::vector<std::shared_ptr<const IFormatStrategy>> strategies);

    // Pure: no I/O. Header data wins over the filename when both are present.
    Result Extract(std::string_view filename,
                   std::span<const std::uint8_t> bytes,
                   ExtractedPackage& out) const;

    // Filename-only parsing, used for routing previews.
    Result ParseFilename(std::string_view filename, PackageDescriptor& out) const;

private:
    const IFormatStrategy* SelectStrategy(std::string_view filename,
                                          std::span<const std::uint8_t> bytes) const;

    Options opt_;
    std::vector<std::shared_ptr<const IFormatStrategy>> strategies_;
};

std::vector<std::shared_ptr<const DescriptorExtractor::IFormatStrategy>> CreateDefaultFormatStrategies();

} // namespace pkgrepo
