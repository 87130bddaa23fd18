#include "metadata/metadata_generator.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "io/temp_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/process.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pkgrepo {

namespace {

std::string SubstitutePlaceholders(std::string arg,
                                   const std::string& input,
                                   const std::string& output,
                                   const RepositoryIndex& index) {
    const std::pair<const char*, std::string> vars[] = {
        {"{input}", input},
        {"{output}", output},
        {"{prefix}", index.prefix},
        {"{format}", std::string(ToString(index.format))},
    };
    for (const auto& [name, value] : vars) {
        const std::string_view n(name);
        for (size_t pos = arg.find(n); pos != std::string::npos; pos = arg.find(n, pos + value.size())) {
            arg.replace(pos, n.size(), value);
        }
    }
    return arg;
}

} // namespace

Result NativeMetadataGenerator::Generate(const RepositoryIndex& index, std::vector<GeneratedComponent>& out) {
    out.clear();

    const std::string index_json = EncodeIndexJson(index);
    GeneratedComponent primary{.type = std::string(kPrimaryComponent), .extension = "json.gz", .data = {}};
    auto r = GzipCompress(ToBytes(index_json), primary.data);
    if (!r.is_ok()) return Result::Wrap(r, "compress primary index");

    std::string sums;
    for (const auto& [hash, entry] : index.packages) {
        std::string rel = entry.object_key;
        const std::string lead = NormalizeKey(index.prefix) + "/";
        if (StartsWith(rel, lead)) rel.erase(0, lead.size());
        sums += entry.object_sha256 + "  " + rel + "\n";
    }
    GeneratedComponent checksums{.type = std::string(kChecksumsComponent), .extension = "txt", .data = ToBytes(sums)};

    out.push_back(std::move(primary));
    out.push_back(std::move(checksums));
    return Result::Ok();
}

ExternalMetadataGenerator::ExternalMetadataGenerator(ExternalGeneratorOptions opt) : opt_(std::move(opt)) {}

std::string ExternalMetadataGenerator::Describe() const {
    return "external: " + DescribeCommand(opt_.command);
}

Result ExternalMetadataGenerator::Generate(const RepositoryIndex& index, std::vector<GeneratedComponent>& out) {
    if (opt_.command.empty())
        return Result::Fail(ErrorCode::InvalidConfig, "external metadata generator has no command");

    auto r = native_.Generate(index, out);
    if (!r.is_ok()) return r;

    TempDirectory work;
    r = TempDirectory::Create("pkgrepo-meta-", work);
    if (!r.is_ok()) return r;

    const std::string input_dir = work.Path() + "/input";
    const std::string output_dir = work.Path() + "/output";
    std::error_code ec;
    fs::create_directories(input_dir, ec);
    if (!ec) fs::create_directories(output_dir, ec);
    if (ec) return Result::Fail(ErrorCode::MetadataBuildFailed, "cannot prepare work directory: " + ec.message());

    r = WriteFileBytes(input_dir + "/packages.json", ToBytes(EncodeIndexJson(index)));
    if (!r.is_ok()) return r;

    ProcessSpec spec;
    spec.timeout = opt_.timeout;
    spec.cwd = work.Path();
    for (const auto& arg : opt_.command) {
        spec.argv.push_back(SubstitutePlaceholders(arg, input_dir, output_dir, index));
    }

    LogInfo("running metadata generator for %s: %s", index.prefix.c_str(), DescribeCommand(spec.argv).c_str());
    ProcessOutput po;
    r = RunProcessChecked(spec, po, ErrorCode::MetadataBuildFailed);
    if (!r.is_ok()) {
        if (r.err == ErrorCode::Timeout)
            return Result::Fail(ErrorCode::MetadataBuildFailed, "metadata generator timed out: " + r.msg);
        return r;
    }

    std::vector<fs::path> produced;
    fs::recursive_directory_iterator it(output_dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        const bool link = it->is_symlink(type_ec);
        if (!link && it->is_directory(type_ec)) continue;
        if (link || !it->is_regular_file(type_ec))
            return Result::Fail(ErrorCode::MetadataBuildFailed,
                                "generator produced a non-file entry: " +
                                    it->path().lexically_relative(output_dir).string());
        produced.push_back(it->path());
    }
    if (ec) return Result::Fail(ErrorCode::MetadataBuildFailed, "cannot scan generator output: " + ec.message());
    std::sort(produced.begin(), produced.end());

    // "repodata/primary.xml.gz" -> type "ext-repodata-primary", extension "xml.gz".
    for (const auto& p : produced) {
        const fs::path rel = p.lexically_relative(output_dir);
        std::string type(kExternalComponentPrefix);
        for (const auto& dir : rel.parent_path()) type += dir.string() + "-";
        const std::string name = rel.filename().string();
        const auto dot = name.find('.');

        GeneratedComponent c;
        c.type = type + name.substr(0, dot);
        c.extension = dot == std::string::npos ? std::string() : name.substr(dot + 1);
        r = ReadFileBytes(p.string(), c.data);
        if (!r.is_ok()) return Result::Wrap(r, "read generator output");
        out.push_back(std::move(c));
    }
    return Result::Ok();
}

} // namespace pkgrepo
