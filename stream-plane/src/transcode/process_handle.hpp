#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jukebox::stream::transcode {

// One external child process. Start() is called at most once per handle.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Throws std::runtime_error if the process cannot be spawned.
    virtual void Start(const std::vector<std::string>& argv) = 0;

    virtual void Signal(int signo) = 0;

    // Waits up to timeout for exit. Returns the exit code, or 128 + signal
    // number when the process was killed by a signal; nullopt on timeout.
    virtual std::optional<int> Wait(std::chrono::milliseconds timeout) = 0;

    // Blocks for the next stderr line. Returns false once the stream is closed.
    virtual bool ReadDiagnosticLine(std::string& line) = 0;

    virtual bool IsRunning() = 0;
};

class ProcessFactory {
public:
    virtual ~ProcessFactory() = default;
    virtual std::unique_ptr<ProcessHandle> Create() = 0;
};

} // namespace jukebox::stream::transcode
