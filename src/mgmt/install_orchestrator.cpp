#include "mgmt/install_orchestrator.hpp"

#include "mgmt/arg_codec.hpp"
#include "mgmt/management_canister.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace canister {

namespace {

Result Cancelled(const char* where) {
    return Result::Fail(ErrorKind::Cancelled, std::string("install cancelled ") + where);
}

// Joins every started worker when the upload step is left, also by an exception.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() {
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
    }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
    std::vector<std::thread>& threads_;
};

} // namespace

const char* ToString(ChunkStoreCleanup cleanup) {
    switch (cleanup) {
        case ChunkStoreCleanup::AfterSuccess: return "after-success";
        case ChunkStoreCleanup::Always:       return "always";
        case ChunkStoreCleanup::Never:        return "never";
    }
    return "unknown";
}

std::optional<ChunkStoreCleanup> ParseChunkStoreCleanup(std::string_view name) {
    if (name == "after-success") return ChunkStoreCleanup::AfterSuccess;
    if (name == "always") return ChunkStoreCleanup::Always;
    if (name == "never") return ChunkStoreCleanup::Never;
    return std::nullopt;
}

InstallOrchestrator::InstallOrchestrator(ITransport& transport, InstallOptions options)
    : transport_(transport),
      options_(std::move(options)),
      chunk_store_(transport, options_.chunking.max_chunk_size) {}

void InstallOrchestrator::Notify(const InstallProgressEvent& e) {
    if (options_.progress)
        options_.progress->OnProgress(e);
}

Result InstallOrchestrator::Fail(InstallReport& report, Result error) {
    report.failed_at = report.state;
    report.state = InstallState::Failed;
    InstallProgressEvent e;
    e.state = InstallState::Failed;
    Notify(e);
    return error;
}

Result InstallOrchestrator::IssueCall(const std::optional<CallDescriptor>& call, const char* what) {
    std::vector<std::uint8_t> reply;
    auto cr = transport_.Call(*call, reply);
    if (!cr.is_ok())
        return Wrap(cr, what);
    return Wrap(DecodeEmptyReply(reply), what);
}

Result InstallOrchestrator::UploadMissing(const Principal& target,
                                          std::span<const Chunk> chunks,
                                          const std::vector<UploadJob>& jobs,
                                          std::size_t chunks_total,
                                          InstallReport& report) {
    std::uint64_t bytes_to_upload = 0;
    for (const auto& job : jobs)
        bytes_to_upload += chunks[job.chunk_index].size();

    std::mutex mu;
    // Serializes sink calls without holding `mu` while the sink runs.
    std::mutex notify_mu;
    std::size_t notified_done = report.chunks_skipped;
    Result first_error = Result::Ok();
    std::atomic_bool stop{false};
    std::atomic<std::size_t> next{0};
    InstallProgressEvent progress;
    progress.state = InstallState::Uploading;
    progress.chunks_total = chunks_total;
    progress.chunks_done = report.chunks_skipped;
    progress.bytes_to_upload = bytes_to_upload;
    Notify(progress);

    auto record_error = [&](Result r) {
        std::lock_guard<std::mutex> lk(mu);
        if (first_error.is_ok())
            first_error = std::move(r);
        stop = true;
    };

    auto worker = [&]() {
        while (!stop) {
            const std::size_t i = next++;
            if (i >= jobs.size())
                return;
            if (options_.cancel.IsCancelled()) {
                record_error(Cancelled("during upload"));
                return;
            }

            const UploadJob& job = jobs[i];
            const Chunk chunk = chunks[job.chunk_index];
            ChunkDigest stored{};
            auto ur = chunk_store_.UploadChunk(target, chunk, job.digest, stored);
            if (!ur.is_ok()) {
                record_error(Wrap(ur, "chunk " + std::to_string(job.chunk_index)));
                return;
            }

            InstallProgressEvent snapshot;
            {
                std::lock_guard<std::mutex> lk(mu);
                ++report.chunks_uploaded;
                ++progress.chunks_done;
                progress.bytes_uploaded += chunk.size();
                snapshot = progress;
            }

            std::lock_guard<std::mutex> nlk(notify_mu);
            // A worker that lost the race to the sink drops its older snapshot.
            if (snapshot.chunks_done > notified_done) {
                notified_done = snapshot.chunks_done;
                Notify(snapshot);
            }
        }
    };

    const std::size_t workers =
        std::min(std::max<std::size_t>(options_.upload_parallelism, 1), jobs.size());
    std::vector<std::thread> threads;
    {
        ThreadJoiner joiner(threads);
        if (workers > 1) {
            threads.reserve(workers - 1);
            for (std::size_t w = 1; w < workers; ++w) {
                try {
                    threads.emplace_back(worker);
                } catch (const std::system_error& e) {
                    LogDebug("started %zu of %zu upload workers: %s", w, workers, e.what());
                    break;
                }
            }
        }
        worker();
    }

    return first_error;
}

Result InstallOrchestrator::InstallChunked(const Principal& target,
                                           std::span<const Chunk> chunks,
                                           const InstallMode& mode,
                                           std::span<const std::uint8_t> init_arg,
                                           InstallReport& report) {
    report = InstallReport{};
    report.chunked = true;
    Notify({.state = InstallState::Planning});

    auto vr = ManagementCanister::ValidateTarget(target);
    if (!vr.is_ok())
        return Fail(report, vr);
    if (chunks.empty())
        return Fail(report, Result::Fail(ErrorKind::Validation, "no chunks to install"));

    const std::uint64_t max_chunk = options_.chunking.max_chunk_size;
    ChunkManifest manifest;
    manifest.reserve(chunks.size());
    try {
        Sha256Hasher module_hasher;
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            if (chunks[i].size() > max_chunk) {
                return Fail(report,
                            Result::Fail(ErrorKind::Validation,
                                         "chunk " + std::to_string(i) + " has " +
                                             std::to_string(chunks[i].size()) +
                                             " bytes, maximum is " + std::to_string(max_chunk)));
            }
            manifest.push_back(Sha256Digest(chunks[i]));
            module_hasher.Update(chunks[i]);
        }
        report.module_digest = module_hasher.Final();
    } catch (const std::exception& e) {
        return Fail(report, Result::Fail(ErrorKind::Validation, std::string("hashing failed: ") + e.what()));
    }

    report.state = InstallState::Uploading;

    RemoteChunkSet stored;
    if (options_.known_chunks.has_value()) {
        stored = *options_.known_chunks;
    } else {
        auto sr = chunk_store_.StoredChunks(target, stored);
        if (!sr.is_ok())
            return Fail(report, sr);
    }

    // Each distinct digest is settled once, at its first position.
    std::vector<UploadJob> jobs;
    std::set<ChunkDigest> seen;
    for (std::size_t i = 0; i < manifest.size(); ++i) {
        if (!seen.insert(manifest[i]).second)
            continue;
        if (stored.contains(manifest[i])) {
            LogDebug("chunk %zu already stored: %s", i, DigestToHex(manifest[i]).c_str());
            ++report.chunks_skipped;
            continue;
        }
        jobs.push_back({i, manifest[i]});
    }

    LogDebug("chunked install to %s: %zu chunks, %zu distinct, %zu to upload",
            target.ToText().c_str(),
            manifest.size(),
            seen.size(),
            jobs.size());

    auto ur = UploadMissing(target, chunks, jobs, seen.size(), report);
    if (!ur.is_ok())
        return Fail(report, ur);

    if (options_.cancel.IsCancelled())
        return Fail(report, Cancelled("before install call"));

    std::optional<CallDescriptor> call;
    auto br = ManagementCanister::InstallChunkedCode(
        target, mode, manifest, report.module_digest, init_arg, call);
    if (!br.is_ok())
        return Fail(report, br);

    report.manifest = std::move(manifest);
    report.state = InstallState::Installing;
    Notify({.state = InstallState::Installing});

    auto ir = IssueCall(call, "install_chunked_code");
    if (!ir.is_ok())
        return Fail(report, ir);

    report.state = InstallState::Done;
    Notify({.state = InstallState::Done});
    LogDebug("installed module %s on %s (%s)",
            DigestToHex(report.module_digest).c_str(),
            target.ToText().c_str(),
            ToString(mode.kind));
    return Result::Ok();
}

Result InstallOrchestrator::ApplyCleanup(const Principal& target,
                                         bool install_ok,
                                         InstallReport& report) {
    bool clear = false;
    switch (options_.cleanup) {
        case ChunkStoreCleanup::AfterSuccess:
            clear = install_ok;
            break;
        case ChunkStoreCleanup::Always:
            // Runs rejected before any remote call left nothing behind.
            clear = install_ok || report.failed_at != InstallState::Planning;
            break;
        case ChunkStoreCleanup::Never:
            break;
    }
    if (!clear)
        return Result::Ok();

    report.cleanup_ran = true;
    report.cleanup = chunk_store_.ClearChunkStore(target);
    if (!report.cleanup.is_ok()) {
        LogWarn("chunk store cleanup of %s failed: %s",
                target.ToText().c_str(),
                report.cleanup.message().c_str());
    }
    return report.cleanup;
}

Result InstallOrchestrator::InstallAuto(const Principal& target,
                                        std::span<const std::uint8_t> module,
                                        const InstallMode& mode,
                                        std::span<const std::uint8_t> init_arg,
                                        InstallReport& report) {
    report = InstallReport{};

    auto vr = ManagementCanister::ValidateTarget(target);
    if (!vr.is_ok())
        return Fail(report, vr);

    InstallPlan plan;
    auto pr = PlanInstall(module, options_.chunking, plan);
    if (!pr.is_ok())
        return Fail(report, pr);

    if (auto* chunked = std::get_if<ChunkedPlan>(&plan)) {
        LogDebug("module of %zu bytes exceeds one-shot threshold %llu, installing in %zu chunks",
                module.size(),
                (unsigned long long)options_.chunking.threshold,
                chunked->chunks.size());
        auto ir = InstallChunked(target, chunked->chunks, mode, init_arg, report);
        // The install outcome takes precedence; a failed cleanup is kept in the report.
        (void)ApplyCleanup(target, ir.is_ok(), report);
        return ir;
    }

    const auto& one_shot = std::get<OneShotPlan>(plan);
    try {
        report.module_digest = Sha256Digest(one_shot.module);
    } catch (const std::exception& e) {
        return Fail(report, Result::Fail(ErrorKind::Validation, std::string("hashing failed: ") + e.what()));
    }

    if (options_.cancel.IsCancelled())
        return Fail(report, Cancelled("before install call"));

    std::optional<CallDescriptor> call;
    auto br = ManagementCanister::InstallCode(target, mode, one_shot.module, init_arg, call);
    if (!br.is_ok())
        return Fail(report, br);

    report.state = InstallState::Installing;
    Notify({.state = InstallState::Installing});
    LogDebug("installing module of %zu bytes on %s in one call",
            one_shot.module.size(),
            target.ToText().c_str());

    auto ir = IssueCall(call, "install_code");
    if (!ir.is_ok())
        return Fail(report, ir);

    report.state = InstallState::Done;
    Notify({.state = InstallState::Done});
    return Result::Ok();
}

std::future<Result> InstallOrchestrator::InstallAutoAsync(const Principal& target,
                                                          std::span<const std::uint8_t> module,
                                                          const InstallMode& mode,
                                                          std::vector<std::uint8_t> init_arg,
                                                          InstallReport& report) {
    return std::async(std::launch::async,
                      [this, target, module, mode, arg = std::move(init_arg), &report]() {
                          return InstallAuto(target, module, mode, arg, report);
                      });
}

} // namespace canister
