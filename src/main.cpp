#include "engine/engine_factory.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/pkgrepo/pkgrepo.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-v] [--best-effort] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  add <file>...                         Add package files\n"
        "  add --from-storage [--remove-source] <key>...\n"
        "                                        Add packages already uploaded to the store\n"
        "  remove [--prefix <p>]... <sha256>...  Remove packages by content hash\n"
        "  init <prefix> <rpm|deb>               Create an empty repository\n"
        "  plan <file>...                        Show where packages would go\n"
        "  list <prefix>                         List packages of a repository\n"
        "\n"
        "Options:\n"
        "  -c, --config           Configuration file (default %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -b, --best-effort      Skip unresolvable inputs instead of aborting\n"
        "  -h, --help             Show this help\n",
        argv, kDefaultConfigPath);
}

int PrintReport(const pkgrepo::UpdateReport &report) {
    std::printf("%s\n", report.ToJson().c_str());
    return report.AnyFailed() ? 1 : 0;
}

bool ReadPackageFiles(const std::vector<std::string> &paths, std::vector<pkgrepo::PackageInput> &out) {
    for (const auto &path : paths) {
        pkgrepo::PackageInput in;
        in.filename = std::string(pkgrepo::KeyBaseName(path));
        if (auto r = pkgrepo::ReadFileBytes(path, in.bytes); !r.ok) {
            std::fprintf(stderr, "ERROR: %s: %s\n", path.c_str(), r.msg.c_str());
            return false;
        }
        out.push_back(std::move(in));
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    pkgrepo::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    bool verbose = false;
    bool best_effort = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"best-effort", no_argument, nullptr, 'b'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    // '+' stops at the command so its own flags are left alone.
    while ((c = getopt_long(argc, argv, "+hc:vb", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case 'b':
                best_effort = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    pkgrepo::config::EngineConfig cfg;
    if (auto r = pkgrepo::config::LoadEngineConfig(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }
    auto &logger = pkgrepo::Logger::Instance();
    logger.SetLevel(cfg.log_level.value_or(pkgrepo::LogLevel::Info));
    if (verbose) logger.SetLevel(pkgrepo::LogLevel::Debug);

    pkgrepo::Engine engine;
    if (auto r = pkgrepo::BuildEngine(cfg, nullptr, nullptr, engine); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }
    auto &orchestrator = *engine.orchestrator;

    pkgrepo::UpdateOptions opt;
    opt.best_effort = best_effort;
    opt.cancel = &pkgrepo::g_cancel;
    if (cfg.deadline.count() > 0) opt.deadline = engine.services.clock->Now() + cfg.deadline;

    pkgrepo::UpdateReport report;

    if (command == "add") {
        bool from_storage = false;
        bool remove_source = false;
        std::vector<std::string> operands;
        for (const auto &a : args) {
            if (a == "--from-storage") {
                from_storage = true;
            } else if (a == "--remove-source") {
                remove_source = true;
            } else {
                operands.push_back(a);
            }
        }
        if (operands.empty() || (remove_source && !from_storage)) {
            PrintUsage(argv[0]);
            return 2;
        }
        if (from_storage) {
            (void)orchestrator.AddFromStorage(operands, remove_source, opt, report);
            return PrintReport(report);
        }
        std::vector<pkgrepo::PackageInput> inputs;
        if (!ReadPackageFiles(operands, inputs)) return 1;
        (void)orchestrator.Add(std::move(inputs), opt, report);
        return PrintReport(report);
    }

    if (command == "remove") {
        std::vector<std::string> prefixes;
        std::vector<std::string> hashes;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--prefix" || args[i] == "-p") {
                if (i + 1 >= args.size()) {
                    PrintUsage(argv[0]);
                    return 2;
                }
                prefixes.push_back(args[++i]);
            } else {
                hashes.push_back(args[i]);
            }
        }
        if (hashes.empty()) {
            PrintUsage(argv[0]);
            return 2;
        }
        (void)orchestrator.Remove(hashes, prefixes, opt, report);
        return PrintReport(report);
    }

    if (command == "init") {
        if (args.size() != 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        auto format = pkgrepo::ParsePackageFormat(args[1]);
        if (!format) {
            std::fprintf(stderr, "Invalid format: %s\n", args[1].c_str());
            return 2;
        }
        (void)orchestrator.Init(args[0], *format, opt, report);
        return PrintReport(report);
    }

    if (command == "plan") {
        if (args.empty()) {
            PrintUsage(argv[0]);
            return 2;
        }
        std::vector<pkgrepo::PackageInput> inputs;
        if (!ReadPackageFiles(args, inputs)) return 1;
        (void)orchestrator.Plan(inputs, report);
        return PrintReport(report);
    }

    if (command == "list") {
        if (args.size() != 1) {
            PrintUsage(argv[0]);
            return 2;
        }
        std::vector<pkgrepo::IndexEntry> entries;
        if (auto r = orchestrator.List(args[0], entries); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        nlohmann::json out = nlohmann::json::array();
        for (const auto &e : entries) {
            out.push_back({
                {"nevra", e.descriptor.Nevra()},
                {"filename", e.filename},
                {"content_hash", e.descriptor.content_hash},
                {"object_key", e.object_key},
                {"size", e.size},
                {"signed", e.is_signed},
            });
        }
        std::printf("%s\n", out.dump(2).c_str());
        return 0;
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
