#include "util/installer_config.hpp"

#include "util/config_json_utils.hpp"

namespace canister {

namespace {

Result Invalid(const std::string& msg) {
    return Result::Fail(ErrorKind::Validation, "config: " + msg);
}

Result FillFromJson(const nlohmann::json& j, InstallerConfig& cfg) {
    std::string err;

    if (!config::detail::GetU64IfPresent(j, "MaxChunkSize", cfg.max_chunk_size, err))
        return Invalid(err);
    if (cfg.max_chunk_size == 0 || cfg.max_chunk_size > kMaxChunkBytes) {
        return Invalid("MaxChunkSize must be between 1 and " + std::to_string(kMaxChunkBytes));
    }

    if (!config::detail::GetU64IfPresent(j, "OneShotThreshold", cfg.one_shot_threshold, err))
        return Invalid(err);

    if (!config::detail::GetU64IfPresent(j, "UploadParallelism", cfg.upload_parallelism, err))
        return Invalid(err);
    if (cfg.upload_parallelism == 0)
        return Invalid("UploadParallelism must be at least 1");

    std::string cleanup;
    if (!config::detail::GetStringIfPresent(j, "ChunkStoreCleanup", cleanup, err))
        return Invalid(err);
    if (!cleanup.empty()) {
        auto parsed = ParseChunkStoreCleanup(cleanup);
        if (!parsed)
            return Invalid("unknown ChunkStoreCleanup: " + cleanup);
        cfg.cleanup = *parsed;
    }

    std::string level;
    if (!config::detail::GetStringIfPresent(j, "LogLevel", level, err))
        return Invalid(err);
    if (!level.empty()) {
        auto parsed = ParseLogLevel(level);
        if (!parsed)
            return Invalid("unknown LogLevel: " + level);
        cfg.log_level = *parsed;
    }

    return Result::Ok();
}

} // namespace

Result InstallerConfig::LoadFromFile(const std::string& path, InstallerConfig& out) {
    out = InstallerConfig{};

    nlohmann::json j;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, j, err))
        return Invalid(err);

    auto fr = FillFromJson(j, out);
    if (!fr.is_ok())
        return Result::Fail(fr.kind, fr.msg + " in " + path);
    return Result::Ok();
}

Result InstallerConfig::Parse(const std::string& json_text, InstallerConfig& out) {
    out = InstallerConfig{};

    nlohmann::json j;
    std::string err;
    if (!config::detail::ParseJsonObject(json_text, j, err))
        return Invalid(err);
    return FillFromJson(j, out);
}

void InstallerConfig::ApplyTo(InstallOptions& options) const {
    options.chunking.max_chunk_size = max_chunk_size;
    options.chunking.threshold = one_shot_threshold;
    options.upload_parallelism = static_cast<std::size_t>(upload_parallelism);
    options.cleanup = cleanup;
}

} // namespace canister
