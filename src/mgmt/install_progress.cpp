#include "mgmt/install_progress.hpp"

#include <atomic>
#include <cstdio>

namespace canister {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

const char* ToString(InstallState state) {
    switch (state) {
        case InstallState::Planning:   return "planning";
        case InstallState::Uploading:  return "uploading";
        case InstallState::Installing: return "installing";
        case InstallState::Done:       return "done";
        case InstallState::Failed:     return "failed";
    }
    return "unknown";
}

void ConsoleInstallProgress::OnProgress(const InstallProgressEvent& e) {
    if (e.state != InstallState::Uploading) {
        ClearProgressLine();
        return;
    }

    int pct = 100;
    if (e.bytes_to_upload > 0) {
        pct = static_cast<int>((e.bytes_uploaded * 100ULL) / e.bytes_to_upload);
        if (pct > 100)
            pct = 100;
    }

    std::fprintf(stderr,
                 "\r[chunks %zu/%zu] %3d%% (%llu/%llu bytes)",
                 e.chunks_done,
                 e.chunks_total,
                 pct,
                 (unsigned long long)e.bytes_uploaded,
                 (unsigned long long)e.bytes_to_upload);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.chunks_total > 0 && e.chunks_done >= e.chunks_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace canister
