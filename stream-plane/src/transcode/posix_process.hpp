#pragma once
#include <mutex>
#include <sys/types.h>
#include "transcode/process_handle.hpp"

namespace jukebox::stream::transcode {

// fork/execvp child with stdin and stdout on /dev/null and stderr on a pipe.
class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle() = default;
    ~PosixProcessHandle() override;

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    void Start(const std::vector<std::string>& argv) override;
    void Signal(int signo) override;
    std::optional<int> Wait(std::chrono::milliseconds timeout) override;
    bool ReadDiagnosticLine(std::string& line) override;
    bool IsRunning() override;

    pid_t pid() const { return pid_; }

private:
    // Non-blocking reap. Caller holds status_mutex_.
    bool ReapLocked();

    pid_t pid_ = -1;
    int stderr_fd_ = -1;

    std::mutex status_mutex_;
    std::optional<int> exit_code_;

    // Owned by the reader thread
    std::string pending_;
    bool eof_ = false;
};

class PosixProcessFactory : public ProcessFactory {
public:
    std::unique_ptr<ProcessHandle> Create() override {
        return std::make_unique<PosixProcessHandle>();
    }
};

} // namespace jukebox::stream::transcode
