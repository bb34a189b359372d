#pragma once

#include <cstddef>
#include <cstdint>

namespace canister {

enum class InstallState {
    Planning,
    Uploading,
    Installing,
    Done,
    Failed,
};

const char* ToString(InstallState state);

struct InstallProgressEvent {
    InstallState state = InstallState::Planning;

    // Distinct chunks settled so far, either uploaded or found already stored.
    std::size_t chunks_done = 0;
    std::size_t chunks_total = 0;

    std::uint64_t bytes_uploaded = 0;
    std::uint64_t bytes_to_upload = 0;
};

// Calls are serialized by the orchestrator, even when uploads run in parallel.
class IInstallProgress {
  public:
    virtual ~IInstallProgress() = default;
    virtual void OnProgress(const InstallProgressEvent& e) = 0;
};

class ConsoleInstallProgress final : public IInstallProgress {
  public:
    void OnProgress(const InstallProgressEvent& e) override;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace canister
