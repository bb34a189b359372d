#include <gtest/gtest.h>

#include "mgmt/install_orchestrator.hpp"
#include "testing.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace canister {

namespace {

class RecordingProgress final : public IInstallProgress {
  public:
    void OnProgress(const InstallProgressEvent& e) override { events.push_back(e); }

    std::vector<InstallProgressEvent> events;
};

std::vector<Chunk> Split(const std::vector<std::uint8_t>& module, std::uint64_t size) {
    std::vector<Chunk> chunks;
    EXPECT_TRUE(SplitIntoChunks(module, size, chunks).is_ok());
    return chunks;
}

} // namespace

class InstallOrchestratorTest : public ::testing::Test {
  protected:
    InstallOptions SmallChunks(std::uint64_t chunk, std::uint64_t threshold) {
        InstallOptions options;
        options.chunking.max_chunk_size = chunk;
        options.chunking.threshold = threshold;
        return options;
    }

    testutil::FakeManagementCanister host;
    const Principal target = testutil::TestCanister();
    const std::vector<std::uint8_t> init_arg = testutil::Bytes("init");
};

TEST_F(InstallOrchestratorTest, SmallModuleIsInstalledInOneCall) {
    InstallOrchestrator orchestrator(host, SmallChunks(100, 1000));
    const auto module = testutil::PatternModule(1000);

    InstallReport report;
    auto r = orchestrator.InstallAuto(target, module, InstallMode::Install(), init_arg, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(report.state, InstallState::Done);
    EXPECT_FALSE(report.chunked);
    EXPECT_EQ(report.module_digest, Sha256Digest(module));
    EXPECT_EQ(host.CountCalls("upload_chunk"), 0u);
    EXPECT_EQ(host.CountCalls("stored_chunks"), 0u);
    EXPECT_EQ(host.CountCalls("clear_chunk_store"), 0u);
    ASSERT_EQ(host.Calls().size(), 1u);

    auto installed = host.Installed(target);
    ASSERT_TRUE(installed.has_value());
    EXPECT_EQ(installed->method, "install_code");
    EXPECT_EQ(installed->wasm, module);
    EXPECT_EQ(installed->arg, init_arg);
    EXPECT_EQ(installed->mode, (nlohmann::json{{"install", nullptr}}));
}

TEST_F(InstallOrchestratorTest, EmptyModuleIsOneShotWithEmptyPayload) {
    InstallOrchestrator orchestrator(host, SmallChunks(100, 1000));
    const std::vector<std::uint8_t> module;

    InstallReport report;
    ASSERT_TRUE(
        orchestrator.InstallAuto(target, module, InstallMode::Install(), {}, report).is_ok());
    auto installed = host.Installed(target);
    ASSERT_TRUE(installed.has_value());
    EXPECT_EQ(installed->method, "install_code");
    EXPECT_TRUE(installed->wasm.empty());
}

TEST_F(InstallOrchestratorTest, LargeModuleIsChunkedAndStoreClearedAfterwards) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000000, 2000000));
    const auto module = testutil::PatternModule(3000000);

    InstallReport report;
    auto r = orchestrator.InstallAuto(target, module, InstallMode::Upgrade(), init_arg, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_TRUE(report.chunked);
    EXPECT_EQ(report.state, InstallState::Done);
    ASSERT_EQ(report.manifest.size(), 3u);
    const std::span<const std::uint8_t> all(module);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(report.manifest[i], Sha256Digest(all.subspan(i * 1000000, 1000000)));
    }
    EXPECT_EQ(report.module_digest, Sha256Digest(module));
    EXPECT_EQ(report.chunks_uploaded, 3u);
    EXPECT_EQ(report.chunks_skipped, 0u);

    auto installed = host.Installed(target);
    ASSERT_TRUE(installed.has_value());
    EXPECT_EQ(installed->method, "install_chunked_code");
    EXPECT_EQ(installed->wasm, module);
    EXPECT_EQ(installed->manifest, report.manifest);

    EXPECT_TRUE(report.cleanup_ran);
    EXPECT_TRUE(report.cleanup.is_ok());
    EXPECT_TRUE(host.Stored(target).empty());

    // Cleanup only happens after the install call.
    const auto calls = host.Calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.back().method, "clear_chunk_store");
    EXPECT_EQ(calls[calls.size() - 2].method, "install_chunked_code");
}

TEST_F(InstallOrchestratorTest, AllCallsAreRoutedToTheTarget) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 2000));
    const auto module = testutil::PatternModule(5500);

    InstallReport report;
    ASSERT_TRUE(
        orchestrator.InstallAuto(target, module, InstallMode::Install(), {}, report).is_ok());
    for (const auto& call : host.Calls()) {
        EXPECT_TRUE(call.target.IsEmpty()) << call.method;
        EXPECT_EQ(call.effective_canister_id, target) << call.method;
    }
}

TEST_F(InstallOrchestratorTest, AlreadyStoredChunksAreNotUploadedButStayInManifest) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 0));
    const auto module = testutil::PatternModule(3000);
    const auto chunks = Split(module, 1000);
    host.SeedChunk(target, chunks[1]);

    InstallReport report;
    auto r = orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(report.chunks_uploaded, 2u);
    EXPECT_EQ(report.chunks_skipped, 1u);
    EXPECT_EQ(host.CountCalls("upload_chunk"), 2u);
    const auto uploaded = host.UploadedDigests();
    EXPECT_EQ(std::count(uploaded.begin(), uploaded.end(), Sha256Digest(chunks[1])), 0);

    ASSERT_EQ(report.manifest.size(), 3u);
    EXPECT_EQ(report.manifest[1], Sha256Digest(chunks[1]));
    EXPECT_EQ(host.Installed(target)->wasm, module);
}

TEST_F(InstallOrchestratorTest, RepeatedChunkIsUploadedOnceAndListedTwice) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 0));
    const auto a = testutil::PatternModule(1000, 7);
    const auto b = testutil::PatternModule(1000, 8);
    std::vector<std::uint8_t> module;
    module.insert(module.end(), a.begin(), a.end());
    module.insert(module.end(), b.begin(), b.end());
    module.insert(module.end(), a.begin(), a.end());

    const auto chunks = Split(module, 1000);
    InstallReport report;
    ASSERT_TRUE(
        orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report).is_ok());

    const ChunkDigest da = Sha256Digest(a);
    const ChunkDigest db = Sha256Digest(b);
    EXPECT_EQ(report.manifest, (ChunkManifest{da, db, da}));
    EXPECT_EQ(host.CountCalls("upload_chunk"), 2u);
    EXPECT_EQ(report.chunks_uploaded, 2u);
    EXPECT_EQ(host.Installed(target)->wasm, module);
}

TEST_F(InstallOrchestratorTest, CallerSuppliedKnownChunksSkipListing) {
    auto options = SmallChunks(1000, 0);
    const auto module = testutil::PatternModule(2000);
    const auto chunks = Split(module, 1000);
    host.SeedChunk(target, chunks[0]);
    options.known_chunks = RemoteChunkSet{Sha256Digest(chunks[0])};
    InstallOrchestrator orchestrator(host, options);

    InstallReport report;
    ASSERT_TRUE(
        orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report).is_ok());
    EXPECT_EQ(host.CountCalls("stored_chunks"), 0u);
    EXPECT_EQ(host.CountCalls("upload_chunk"), 1u);
}

TEST_F(InstallOrchestratorTest, DigestMismatchAbortsBeforeInstall) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 0));
    host.CorruptUploadDigests(true);
    const auto module = testutil::PatternModule(2500);

    InstallReport report;
    auto r = orchestrator.InstallChunked(
        target, Split(module, 1000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_EQ(report.state, InstallState::Failed);
    EXPECT_EQ(report.failed_at, InstallState::Uploading);
    EXPECT_TRUE(report.manifest.empty());
    EXPECT_EQ(host.CountCalls("install_chunked_code"), 0u);
    EXPECT_FALSE(host.Installed(target).has_value());
}

TEST_F(InstallOrchestratorTest, UploadTransportFailureAbortsWithoutInstall) {
    auto options = SmallChunks(1000, 0);
    options.upload_parallelism = 3;
    InstallOrchestrator orchestrator(host, options);
    host.FailUploadNumber(2, ErrorKind::Transport);
    const auto module = testutil::PatternModule(6000);

    InstallReport report;
    auto r = orchestrator.InstallChunked(
        target, Split(module, 1000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Transport);
    EXPECT_EQ(host.CountCalls("install_chunked_code"), 0u);
}

TEST_F(InstallOrchestratorTest, StoredChunksFailureAbortsBeforeAnyUpload) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    host.FailMethod("stored_chunks", ErrorKind::Transport);

    InstallReport report;
    auto r = orchestrator.InstallAuto(
        target, testutil::PatternModule(3000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Transport);
    EXPECT_EQ(report.failed_at, InstallState::Uploading);
    EXPECT_EQ(host.CountCalls("upload_chunk"), 0u);
    EXPECT_EQ(host.CountCalls("install_chunked_code"), 0u);
}

TEST_F(InstallOrchestratorTest, UnreadableInstallReplyIsProtocolError) {
    InstallOrchestrator orchestrator(host, SmallChunks(100, 1000));
    host.ReplyRaw("install_code", {0x62, 0xff, 0xfe});

    InstallReport report;
    Result r;
    EXPECT_NO_THROW(r = orchestrator.InstallAuto(
                        target, testutil::PatternModule(10), InstallMode::Install(), {}, report));
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_EQ(report.state, InstallState::Failed);
    EXPECT_EQ(report.failed_at, InstallState::Installing);
}

TEST_F(InstallOrchestratorTest, UnreadableCleanupReplyKeepsInstallSuccess) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    host.ReplyRaw("clear_chunk_store", {0x62, 0xff, 0xfe});

    InstallReport report;
    Result r;
    EXPECT_NO_THROW(r = orchestrator.InstallAuto(
                        target, testutil::PatternModule(3000), InstallMode::Install(), {}, report));
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(report.cleanup_ran);
    EXPECT_EQ(report.cleanup.kind, ErrorKind::Protocol);
    EXPECT_TRUE(host.Installed(target).has_value());
}

TEST_F(InstallOrchestratorTest, AfterSuccessCleanupSkippedOnFailedInstall) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    host.FailMethod("install_chunked_code", ErrorKind::Protocol);
    const auto module = testutil::PatternModule(3000);

    InstallReport report;
    auto r = orchestrator.InstallAuto(target, module, InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_EQ(report.failed_at, InstallState::Installing);
    EXPECT_FALSE(report.cleanup_ran);
    EXPECT_EQ(host.CountCalls("clear_chunk_store"), 0u);
    EXPECT_EQ(host.Stored(target).size(), 3u);
}

TEST_F(InstallOrchestratorTest, AlwaysCleanupRunsAfterFailedInstall) {
    auto options = SmallChunks(1000, 1000);
    options.cleanup = ChunkStoreCleanup::Always;
    InstallOrchestrator orchestrator(host, options);
    host.FailMethod("install_chunked_code", ErrorKind::Transport);

    InstallReport report;
    auto r = orchestrator.InstallAuto(
        target, testutil::PatternModule(3000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Transport);
    EXPECT_TRUE(report.cleanup_ran);
    EXPECT_TRUE(host.Stored(target).empty());
}

TEST_F(InstallOrchestratorTest, NeverCleanupKeepsChunks) {
    auto options = SmallChunks(1000, 1000);
    options.cleanup = ChunkStoreCleanup::Never;
    InstallOrchestrator orchestrator(host, options);

    InstallReport report;
    ASSERT_TRUE(orchestrator
                    .InstallAuto(target, testutil::PatternModule(3000), InstallMode::Install(), {},
                                 report)
                    .is_ok());
    EXPECT_FALSE(report.cleanup_ran);
    EXPECT_EQ(host.Stored(target).size(), 3u);
}

TEST_F(InstallOrchestratorTest, FailedCleanupDoesNotFailInstall) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    host.FailMethod("clear_chunk_store", ErrorKind::Transport);

    InstallReport report;
    auto r = orchestrator.InstallAuto(
        target, testutil::PatternModule(3000), InstallMode::Install(), {}, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(report.cleanup_ran);
    EXPECT_FALSE(report.cleanup.is_ok());
    EXPECT_EQ(report.cleanup.kind, ErrorKind::Transport);
    EXPECT_TRUE(host.Installed(target).has_value());
}

TEST_F(InstallOrchestratorTest, OversizedChunkIsRejectedBeforeAnyCall) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 0));
    const auto module = testutil::PatternModule(3000);
    const auto chunks = Split(module, 1500);

    InstallReport report;
    auto r = orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_EQ(report.failed_at, InstallState::Planning);
    EXPECT_TRUE(host.Calls().empty());
}

TEST_F(InstallOrchestratorTest, EmptyTargetIsRejected) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    InstallReport report;
    auto r = orchestrator.InstallAuto(Principal::ManagementCanister(),
                                      testutil::PatternModule(10),
                                      InstallMode::Install(),
                                      {},
                                      report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_TRUE(host.Calls().empty());
}

TEST_F(InstallOrchestratorTest, CancelBetweenUploadsStopsBeforeInstall) {
    auto options = SmallChunks(1000, 0);
    InstallOrchestrator orchestrator(host, options);
    const CancelToken cancel = orchestrator.Options().cancel;
    host.SetUploadHook([cancel](std::size_t n) {
        if (n == 2)
            cancel.Cancel();
    });

    InstallReport report;
    auto r = orchestrator.InstallChunked(
        target, Split(testutil::PatternModule(5000), 1000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(host.CountCalls("upload_chunk"), 2u);
    EXPECT_EQ(host.CountCalls("install_chunked_code"), 0u);
}

TEST_F(InstallOrchestratorTest, CancelDuringParallelUploadsStopsBeforeInstall) {
    auto options = SmallChunks(1000, 0);
    options.upload_parallelism = 4;
    InstallOrchestrator orchestrator(host, options);
    const CancelToken cancel = orchestrator.Options().cancel;
    host.SetUploadHook([cancel](std::size_t n) {
        if (n == 3)
            cancel.Cancel();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    });

    InstallReport report;
    auto r = orchestrator.InstallChunked(
        target, Split(testutil::PatternModule(20000), 1000), InstallMode::Install(), {}, report);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(report.failed_at, InstallState::Uploading);
    // Uploads already in flight finish; no worker starts a new one afterwards.
    EXPECT_LT(host.CountCalls("upload_chunk"), 20u);
    EXPECT_EQ(host.CountCalls("install_chunked_code"), 0u);
}

TEST_F(InstallOrchestratorTest, CancelledBeforeStartIssuesNoInstall) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    orchestrator.Options().cancel.Cancel();

    InstallReport report;
    auto r = orchestrator.InstallAuto(
        target, testutil::PatternModule(10), InstallMode::Install(), {}, report);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(host.Calls().empty());
}

TEST_F(InstallOrchestratorTest, ParallelUploadsRespectLimitAndKeepOrder) {
    auto options = SmallChunks(1000, 0);
    options.upload_parallelism = 4;
    InstallOrchestrator orchestrator(host, options);
    host.SetUploadHook([](std::size_t) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    });

    const auto module = testutil::PatternModule(16000);
    const auto chunks = Split(module, 1000);
    InstallReport report;
    auto r = orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_LE(host.MaxUploadsInFlight(), 4u);
    EXPECT_GT(host.MaxUploadsInFlight(), 1u);
    EXPECT_EQ(host.CountCalls("upload_chunk"), 16u);
    ASSERT_EQ(report.manifest.size(), 16u);
    for (std::size_t i = 0; i < chunks.size(); ++i)
        EXPECT_EQ(report.manifest[i], Sha256Digest(chunks[i]));
    EXPECT_EQ(host.Installed(target)->wasm, module);
}

TEST_F(InstallOrchestratorTest, ProgressReportsEveryChunkAndStates) {
    RecordingProgress progress;
    auto options = SmallChunks(1000, 0);
    options.progress = &progress;
    InstallOrchestrator orchestrator(host, options);
    const auto module = testutil::PatternModule(3000);
    const auto chunks = Split(module, 1000);
    host.SeedChunk(target, chunks[0]);

    InstallReport report;
    ASSERT_TRUE(
        orchestrator.InstallChunked(target, chunks, InstallMode::Install(), {}, report).is_ok());

    ASSERT_FALSE(progress.events.empty());
    EXPECT_EQ(progress.events.front().state, InstallState::Planning);
    EXPECT_EQ(progress.events.back().state, InstallState::Done);

    std::size_t last_done = 0;
    for (const auto& e : progress.events) {
        if (e.state != InstallState::Uploading)
            continue;
        EXPECT_EQ(e.chunks_total, 3u);
        EXPECT_EQ(e.bytes_to_upload, 2000u);
        last_done = e.chunks_done;
    }
    EXPECT_EQ(last_done, 3u);
}

TEST_F(InstallOrchestratorTest, ParallelProgressCountsOnlyGoUp) {
    RecordingProgress progress;
    auto options = SmallChunks(1000, 0);
    options.upload_parallelism = 4;
    options.progress = &progress;
    InstallOrchestrator orchestrator(host, options);
    host.SetUploadHook([](std::size_t n) {
        std::this_thread::sleep_for(std::chrono::milliseconds(n % 3));
    });

    InstallReport report;
    ASSERT_TRUE(orchestrator
                    .InstallChunked(target, Split(testutil::PatternModule(12000), 1000),
                                    InstallMode::Install(), {}, report)
                    .is_ok());

    std::size_t last_done = 0;
    std::uint64_t last_bytes = 0;
    bool first = true;
    for (const auto& e : progress.events) {
        if (e.state != InstallState::Uploading)
            continue;
        if (!first) {
            EXPECT_GT(e.chunks_done, last_done);
            EXPECT_GT(e.bytes_uploaded, last_bytes);
        }
        first = false;
        last_done = e.chunks_done;
        last_bytes = e.bytes_uploaded;
    }
    EXPECT_EQ(last_done, 12u);
    EXPECT_EQ(last_bytes, 12000u);
}

TEST_F(InstallOrchestratorTest, AsyncInstallCompletes) {
    InstallOrchestrator orchestrator(host, SmallChunks(1000, 1000));
    const auto module = testutil::PatternModule(4200);

    InstallReport report;
    auto future = orchestrator.InstallAutoAsync(
        target, module, InstallMode::Reinstall(), init_arg, report);
    const Result r = future.get();
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(report.state, InstallState::Done);
    EXPECT_EQ(host.Installed(target)->wasm, module);
    EXPECT_EQ(host.Installed(target)->mode, (nlohmann::json{{"reinstall", nullptr}}));
}

} // namespace canister
