#include "agent/principal.hpp"
#include "crypto/sha256.hpp"
#include "io/module_loader.hpp"
#include "mgmt/chunking.hpp"
#include "mgmt/management_canister.hpp"
#include "util/installer_config.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <getopt.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -i <module|-> [-c <config.json>] [-t <canister-id>] [-m <mode>] [-v]\n"
        "\n"
        "Prints how a module would be installed, without contacting any canister.\n"
        "\n"
        "Options:\n"
        "  -i, --input     Module file path or '-' for stdin\n"
        "  -c, --config    Installer config (JSON)\n"
        "  -t, --target    Target canister id; adds the install call size to the plan\n"
        "  -m, --mode      install | reinstall | upgrade (default install)\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv);
}

nlohmann::json ChunksToJson(const std::vector<canister::Chunk>& chunks,
                            std::span<const std::uint8_t> module,
                            canister::ChunkManifest& manifest) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& chunk : chunks) {
        const auto digest = canister::Sha256Digest(chunk);
        manifest.push_back(digest);
        out.push_back({
            {"offset", static_cast<std::uint64_t>(chunk.data() - module.data())},
            {"size", chunk.size()},
            {"sha256", canister::DigestToHex(digest)},
        });
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    std::string input;
    std::string config_path;
    std::string target_text;
    std::string mode_name = "install";
    bool verbose = false;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"config", required_argument, nullptr, 'c'},
        {"target", required_argument, nullptr, 't'},
        {"mode", required_argument, nullptr, 'm'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hi:c:t:m:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'i':
                input = optarg;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 't':
                target_text = optarg;
                break;
            case 'm':
                mode_name = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (input.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    auto mode = canister::ParseInstallMode(mode_name);
    if (!mode) {
        std::fprintf(stderr, "ERROR: %s\n", mode.error().c_str());
        return 2;
    }

    std::optional<canister::Principal> target;
    if (!target_text.empty()) {
        auto parsed = canister::Principal::FromText(target_text);
        if (!parsed) {
            std::fprintf(stderr, "ERROR: %s\n", parsed.error().c_str());
            return 2;
        }
        target = *parsed;
    }

    canister::InstallerConfig cfg;
    if (!config_path.empty()) {
        auto cr = canister::InstallerConfig::LoadFromFile(config_path, cfg);
        if (!cr.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", cr.message().c_str());
            return 1;
        }
    }
    if (cfg.log_level.has_value())
        canister::Logger::Instance().SetLevel(*cfg.log_level);
    if (verbose)
        canister::Logger::Instance().SetLevel(canister::LogLevel::Debug);

    canister::InstallOptions options;
    cfg.ApplyTo(options);

    std::vector<std::uint8_t> module;
    auto lr = canister::LoadModuleImage(input, module);
    if (!lr.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", lr.message().c_str());
        return 1;
    }
    LogDebug("loaded %zu bytes from %s", module.size(), input.c_str());

    canister::InstallPlan plan;
    auto pr = canister::PlanInstall(module, options.chunking, plan);
    if (!pr.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", pr.message().c_str());
        return 1;
    }

    nlohmann::json out;
    const auto module_digest = canister::Sha256Digest(module);
    out["module_size"] = module.size();
    out["module_sha256"] = canister::DigestToHex(module_digest);
    out["mode"] = canister::ToString(mode->kind);
    out["one_shot_threshold"] = options.chunking.threshold;

    std::optional<canister::CallDescriptor> call;
    canister::Result br = canister::Result::Ok();
    if (const auto* chunked = std::get_if<canister::ChunkedPlan>(&plan)) {
        canister::ChunkManifest manifest;
        out["plan"] = "chunked";
        out["max_chunk_size"] = options.chunking.max_chunk_size;
        out["chunks"] = ChunksToJson(chunked->chunks, module, manifest);
        if (target) {
            br = canister::ManagementCanister::InstallChunkedCode(
                *target, *mode, manifest, module_digest, {}, call);
        }
    } else {
        out["plan"] = "one-shot";
        if (target) {
            br = canister::ManagementCanister::InstallCode(*target, *mode, module, {}, call);
        }
    }

    if (!br.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", br.message().c_str());
        return 1;
    }
    if (call) {
        out["target"] = target->ToText();
        out["install_call"] = {
            {"method", call->Method()},
            {"arg_size", call->Arg().size()},
        };
    }

    LogInfo("%s plan for %zu byte module", out["plan"].get<std::string>().c_str(), module.size());
    std::printf("%s\n", out.dump(2).c_str());
    return 0;
}
