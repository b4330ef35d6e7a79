#include "transcode/posix_process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace jukebox::stream::transcode {

namespace {

int DecodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

PosixProcessHandle::~PosixProcessHandle() {
    if (pid_ > 0) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (!ReapLocked()) {
            spdlog::warn("[process] pid {} still running at teardown, killing", pid_);
            kill(pid_, SIGKILL);
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
    }
    CloseFd(stderr_fd_);
}

void PosixProcessHandle::Start(const std::vector<std::string>& argv) {
    if (pid_ > 0) throw std::runtime_error("process already started");
    if (argv.empty()) throw std::runtime_error("empty command line");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    // Carries errno back to the parent if execvp fails; closes on successful exec.
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        int code = errno;
        ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(err_pipe[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw std::runtime_error("cannot execute " + argv[0] + ": " + std::strerror(exec_errno));
    }

    pid_ = pid;
    stderr_fd_ = err_pipe[0];
    spdlog::debug("[process] Started {} (pid {})", argv[0], pid_);
}

void PosixProcessHandle::Signal(int signo) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    // Never signal a reaped pid, it may have been reused
    if (pid_ > 0 && !ReapLocked()) {
        if (kill(pid_, signo) != 0 && errno != ESRCH) {
            spdlog::warn("[process] kill({}, {}) failed: {}", pid_, signo, std::strerror(errno));
        }
    }
}

std::optional<int> PosixProcessHandle::Wait(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            if (ReapLocked()) return exit_code_;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

bool PosixProcessHandle::ReadDiagnosticLine(std::string& line) {
    while (true) {
        auto pos = pending_.find_first_of("\r\n");
        if (pos != std::string::npos) {
            line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            if (line.empty()) continue; // "\r\n" or blank progress line
            return true;
        }

        if (eof_ || stderr_fd_ < 0) {
            if (pending_.empty()) return false;
            line.swap(pending_);
            pending_.clear();
            return true;
        }

        char buf[4096];
        ssize_t n = read(stderr_fd_, buf, sizeof(buf));
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR) {
            spdlog::warn("[process] stderr read failed: {}", std::strerror(errno));
            eof_ = true;
        }
    }
}

bool PosixProcessHandle::IsRunning() {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return pid_ > 0 && !ReapLocked();
}

bool PosixProcessHandle::ReapLocked() {
    if (exit_code_) return true;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exit_code_ = DecodeStatus(status);
        return true;
    }
    if (r < 0) {
        // ECHILD: already reaped elsewhere, exit status lost
        exit_code_ = -1;
        return true;
    }
    return false;
}

} // namespace jukebox::stream::transcode
