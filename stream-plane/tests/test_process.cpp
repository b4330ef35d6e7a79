#include <gtest/gtest.h>
#include <csignal>
#include <stdexcept>
#include "transcode/posix_process.hpp"

using namespace jukebox::stream::transcode;
using namespace std::chrono_literals;

TEST(PosixProcessTest, SplitsDiagnosticsOnCarriageReturnAndNewline) {
    PosixProcessHandle process;
    process.Start({"/bin/sh", "-c", "printf 'one\\rtwo\\nthree\\r\\nfour' 1>&2"});

    std::vector<std::string> lines;
    std::string line;
    while (process.ReadDiagnosticLine(line)) lines.push_back(line);

    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three", "four"}));
    EXPECT_EQ(process.Wait(5s), 0);
}

TEST(PosixProcessTest, ReportsExitCode) {
    PosixProcessHandle process;
    process.Start({"/bin/sh", "-c", "exit 3"});
    EXPECT_EQ(process.Wait(5s), 3);
    EXPECT_FALSE(process.IsRunning());
}

TEST(PosixProcessTest, SigtermEndsProcess) {
    PosixProcessHandle process;
    process.Start({"/bin/sh", "-c", "exec sleep 30"});
    EXPECT_TRUE(process.IsRunning());
    EXPECT_FALSE(process.Wait(100ms).has_value());

    process.Signal(SIGTERM);
    EXPECT_EQ(process.Wait(5s), 128 + SIGTERM);
    EXPECT_FALSE(process.IsRunning());

    // Signalling a reaped process is harmless
    process.Signal(SIGKILL);
}

TEST(PosixProcessTest, SigkillEndsProcessIgnoringSigterm) {
    PosixProcessHandle process;
    process.Start({"/bin/sh", "-c", "trap '' TERM; while true; do sleep 1; done"});
    process.Signal(SIGTERM);
    EXPECT_FALSE(process.Wait(300ms).has_value());

    process.Signal(SIGKILL);
    EXPECT_EQ(process.Wait(5s), 128 + SIGKILL);
}

TEST(PosixProcessTest, MissingExecutableThrows) {
    PosixProcessHandle process;
    EXPECT_THROW(process.Start({"/nonexistent/jukebox-ffmpeg"}), std::runtime_error);
    EXPECT_FALSE(process.IsRunning());
}

TEST(PosixProcessTest, StdinIsClosed) {
    PosixProcessHandle process;
    // read gets EOF from /dev/null immediately instead of blocking
    process.Start({"/bin/sh", "-c", "read x; exit 7"});
    EXPECT_EQ(process.Wait(5s), 7);
}
