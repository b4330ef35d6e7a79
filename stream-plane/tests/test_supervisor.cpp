#include <gtest/gtest.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>
#include "fakes/fake_process.hpp"
#include "storage/active_asset_registry.hpp"
#include "transcode/posix_process.hpp"
#include "transcode/transcode_supervisor.hpp"
#include "utils/metrics.hpp"

namespace fs = std::filesystem;
using namespace jukebox::stream;
using namespace std::chrono_literals;

class TranscodeSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("jukebox_supervisor_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "media");
        fs::create_directories(root_ / "hls");

        asset_.path = root_ / "media" / "song.mp3";
        asset_.kind = acquisition::MediaKind::AUDIO;
        asset_.format = "audio/mpeg";
        std::ofstream(asset_.path) << "ID3";
        asset_.size_bytes = 3;

        config_.ffmpeg_path = "ffmpeg";
        config_.hls_dir = root_ / "hls";
        config_.verify_delay = 50ms;
        config_.grace_period = 200ms;

        factory_ = std::make_unique<fakes::FakeProcessFactory>(config_.hls_dir);
    }

    void TearDown() override {
        supervisor_.reset();
        fs::remove_all(root_);
    }

    transcode::TranscodeSupervisor& Supervisor() {
        if (!supervisor_) {
            supervisor_ = std::make_unique<transcode::TranscodeSupervisor>(config_, *factory_, registry_, metrics_);
        }
        return *supervisor_;
    }

    size_t CountHlsOutput() {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(config_.hls_dir)) {
            auto ext = entry.path().extension();
            if (ext == ".ts" || ext == ".m3u8") n++;
        }
        return n;
    }

    fs::path root_;
    acquisition::MediaAsset asset_;
    transcode::SupervisorConfig config_;
    utils::Metrics metrics_;
    storage::ActiveAssetRegistry registry_;
    std::unique_ptr<fakes::FakeProcessFactory> factory_;
    std::unique_ptr<transcode::TranscodeSupervisor> supervisor_;
};

TEST_F(TranscodeSupervisorTest, StartVerifiesOutputAndPinsAsset) {
    auto result = Supervisor().Start(asset_, std::nullopt);

    EXPECT_EQ(result, transcode::StartResult::STARTED);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::ACTIVE);
    EXPECT_EQ(Supervisor().CurrentMediaPath(), asset_.path);
    EXPECT_TRUE(registry_.IsProtected(asset_.path));
    EXPECT_EQ(factory_->log().running, 1);

    auto cmd = factory_->log().LastCommand();
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd.back(), (config_.hls_dir / "playlist.m3u8").string());
}

TEST_F(TranscodeSupervisorTest, StopTerminatesAndClearsOutput) {
    std::ofstream(config_.hls_dir / "status.json") << "{}";
    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    ASSERT_GT(CountHlsOutput(), 0u);

    Supervisor().Stop();

    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(factory_->log().running, 0);
    EXPECT_EQ(CountHlsOutput(), 0u);
    EXPECT_TRUE(fs::exists(config_.hls_dir / "status.json"));
    EXPECT_FALSE(registry_.Current().has_value());
    EXPECT_FALSE(Supervisor().CurrentMediaPath().has_value());
    EXPECT_EQ(factory_->log().Signals(), std::vector<int>{SIGTERM});
}

TEST_F(TranscodeSupervisorTest, StaleOutputClearedOnConstruction) {
    std::ofstream(config_.hls_dir / "segment_041.ts") << "old";
    std::ofstream(config_.hls_dir / "playlist.m3u8") << "#EXTM3U\n";
    std::ofstream(config_.hls_dir / "playlist.m3u8.tmp") << "#EXTM3U\n";

    Supervisor();
    EXPECT_EQ(CountHlsOutput(), 0u);
    EXPECT_FALSE(fs::exists(config_.hls_dir / "playlist.m3u8.tmp"));
}

TEST_F(TranscodeSupervisorTest, VerificationFailsWithoutOutput) {
    fakes::FakeProcessScript script;
    script.write_output = false;
    factory_->SetScript(script);

    EXPECT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::VERIFY_FAILED);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(factory_->log().running, 0);
    EXPECT_FALSE(registry_.Current().has_value());
}

TEST_F(TranscodeSupervisorTest, VerificationRequiresPlaylistHeader) {
    fakes::FakeProcessScript script;
    script.write_output = false;
    factory_->SetScript(script);
    Supervisor();

    // Segment present but playlist lacks #EXTM3U
    std::ofstream(config_.hls_dir / "segment_000.ts") << "x";
    std::ofstream(config_.hls_dir / "playlist.m3u8") << "garbage\n";
    EXPECT_FALSE(Supervisor().VerifyOutput());

    std::ofstream(config_.hls_dir / "playlist.m3u8") << "#EXTM3U\n";
    EXPECT_TRUE(Supervisor().VerifyOutput());

    fs::remove(config_.hls_dir / "segment_000.ts");
    EXPECT_FALSE(Supervisor().VerifyOutput());
}

TEST_F(TranscodeSupervisorTest, SpawnFailureLeavesIdle) {
    fakes::FakeProcessScript script;
    script.fail_spawn = true;
    factory_->SetScript(script);

    EXPECT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::SPAWN_FAILED);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_FALSE(registry_.Current().has_value());
}

TEST_F(TranscodeSupervisorTest, DoubleStopWhenIdleIsNoop) {
    Supervisor().Stop();
    Supervisor().Stop();
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(Supervisor().generation(), 0u);
    EXPECT_TRUE(factory_->log().Signals().empty());
}

TEST_F(TranscodeSupervisorTest, ForcedKillAfterGracePeriod) {
    fakes::FakeProcessScript script;
    script.ignore_sigterm = true;
    factory_->SetScript(script);

    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    Supervisor().Stop();

    EXPECT_EQ(factory_->log().Signals(), (std::vector<int>{SIGTERM, SIGKILL}));
    EXPECT_EQ(factory_->log().running, 0);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(CountHlsOutput(), 0u);
}

TEST_F(TranscodeSupervisorTest, DurationElapsedEndsSession) {
    ASSERT_EQ(Supervisor().Start(asset_, std::chrono::seconds(1)), transcode::StartResult::STARTED);

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(Supervisor().WaitForCompletion(), transcode::SessionOutcome::DURATION_ELAPSED);
    auto waited = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(waited, 3s);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(factory_->log().running, 0);
    EXPECT_EQ(CountHlsOutput(), 0u);
}

TEST_F(TranscodeSupervisorTest, CleanExitCompletes) {
    fakes::FakeProcessScript script;
    script.exit_after = 200ms;
    script.exit_code = 0;
    factory_->SetScript(script);

    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    EXPECT_EQ(Supervisor().WaitForCompletion(), transcode::SessionOutcome::COMPLETED);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
}

TEST_F(TranscodeSupervisorTest, AbnormalExitIsProcessFailure) {
    fakes::FakeProcessScript script;
    script.exit_after = 200ms;
    script.exit_code = 1;
    script.diagnostics = {"Error while decoding stream #0:0", "frame=1"};
    factory_->SetScript(script);

    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    EXPECT_EQ(Supervisor().WaitForCompletion(), transcode::SessionOutcome::PROCESS_FAILED);
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
}

TEST_F(TranscodeSupervisorTest, StopFromAnotherThreadUnblocksWait) {
    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);

    std::thread stopper([this] {
        std::this_thread::sleep_for(100ms);
        Supervisor().Stop();
    });

    EXPECT_EQ(Supervisor().WaitForCompletion(), transcode::SessionOutcome::STOPPED);
    stopper.join();
    EXPECT_EQ(Supervisor().GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(CountHlsOutput(), 0u);
}

TEST_F(TranscodeSupervisorTest, StopDuringVerificationCancelsStart) {
    config_.verify_delay = 2000ms;
    auto& supervisor = Supervisor();

    std::thread stopper([&supervisor] {
        std::this_thread::sleep_for(100ms);
        supervisor.Stop();
    });
    auto begin = std::chrono::steady_clock::now();
    auto result = supervisor.Start(asset_, std::nullopt);
    stopper.join();

    EXPECT_EQ(result, transcode::StartResult::CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1500ms);
    EXPECT_EQ(supervisor.GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(CountHlsOutput(), 0u);
    EXPECT_FALSE(registry_.Current().has_value());
    EXPECT_EQ(factory_->log().running, 0);
}

TEST_F(TranscodeSupervisorTest, StopWhileStartingCancelsStart) {
    config_.verify_delay = 2000ms;
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    fakes::FakeProcessScript script;
    script.on_start = [&entered, released] {
        entered.set_value();
        released.wait();
    };
    factory_->SetScript(script);
    auto& supervisor = Supervisor();

    transcode::StartResult result = transcode::StartResult::STARTED;
    std::thread starter([&] { result = supervisor.Start(asset_, std::nullopt); });
    entered.get_future().wait();
    EXPECT_EQ(supervisor.GetState(), transcode::SessionState::STARTING);

    std::thread stopper([&supervisor] { supervisor.Stop(); });
    // Stop() flags the session, then waits for Start() to give up the lifecycle lock
    std::this_thread::sleep_for(100ms);
    release.set_value();
    starter.join();
    stopper.join();

    EXPECT_EQ(result, transcode::StartResult::CANCELLED);
    EXPECT_EQ(supervisor.GetState(), transcode::SessionState::IDLE);
    EXPECT_EQ(CountHlsOutput(), 0u);
    EXPECT_FALSE(registry_.Current().has_value());
    EXPECT_EQ(factory_->log().running, 0);
}

TEST_F(TranscodeSupervisorTest, DiagnosticErrorsDoNotEndSession) {
    fakes::FakeProcessScript script;
    script.diagnostics = {"Error while decoding stream #0:0", "[aac @ 0x7f] decode failed"};
    factory_->SetScript(script);
    auto& supervisor = Supervisor();

    ASSERT_EQ(supervisor.Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(metrics_.transcode_diagnostic_errors_total().Value(), 2.0);
    EXPECT_EQ(supervisor.GetState(), transcode::SessionState::ACTIVE);
    EXPECT_EQ(factory_->log().running, 1);

    std::atomic<bool> finished{false};
    transcode::SessionOutcome outcome = transcode::SessionOutcome::COMPLETED;
    std::thread waiter([&] {
        outcome = supervisor.WaitForCompletion();
        finished = true;
    });
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(finished);

    supervisor.Stop();
    waiter.join();
    EXPECT_EQ(outcome, transcode::SessionOutcome::STOPPED);
}

TEST_F(TranscodeSupervisorTest, StopBeforeStartDoesNotCancelNextSession) {
    Supervisor().Stop();
    EXPECT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
}

TEST_F(TranscodeSupervisorTest, RestartPreemptsPreviousSession) {
    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);
    ASSERT_EQ(Supervisor().Start(asset_, std::nullopt), transcode::StartResult::STARTED);

    EXPECT_EQ(factory_->log().spawned, 2);
    EXPECT_EQ(factory_->log().max_running, 1);
    EXPECT_EQ(factory_->log().running, 1);
    EXPECT_EQ(Supervisor().generation(), 2u);
}

// Drives the supervisor with a real child: a shell script standing in for
// ffmpeg that writes a playlist and one segment, then exits on its own.
class PosixSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("jukebox_posix_supervisor_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "hls");

        asset_.path = root_ / "song.mp3";
        asset_.kind = acquisition::MediaKind::AUDIO;
        asset_.format = "audio/flac";
        std::ofstream(asset_.path) << "fLaC";

        fs::path script = root_ / "fake-ffmpeg.sh";
        std::ofstream(script) << "#!/bin/sh\n"
                                 "for last; do :; done\n"
                                 "printf '#EXTM3U\\n' > \"$last\"\n"
                                 ": > \"$(dirname \"$last\")/segment_000.ts\"\n"
                                 "echo 'frame=1' >&2\n"
                                 "sleep 0.3\n"
                                 "exit 0\n";
        fs::permissions(script, fs::perms::owner_all);

        config_.ffmpeg_path = script.string();
        config_.hls_dir = root_ / "hls";
        config_.verify_delay = 100ms;
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path root_;
    acquisition::MediaAsset asset_;
    transcode::SupervisorConfig config_;
    utils::Metrics metrics_;
    storage::ActiveAssetRegistry registry_;
    transcode::PosixProcessFactory factory_;
};

TEST_F(PosixSupervisorTest, NaturalExitCompletesWithZeroGracePeriod) {
    config_.grace_period = 0ms;
    transcode::TranscodeSupervisor supervisor(config_, factory_, registry_, metrics_);

    for (int run = 0; run < 5; ++run) {
        ASSERT_EQ(supervisor.Start(asset_, std::nullopt), transcode::StartResult::STARTED) << "run " << run;

        // Stop after 5s so a missed exit fails the test instead of hanging it
        std::atomic<bool> done{false};
        std::thread watchdog([&] {
            for (int i = 0; i < 500 && !done; ++i) std::this_thread::sleep_for(10ms);
            if (!done) supervisor.Stop();
        });
        auto outcome = supervisor.WaitForCompletion();
        done = true;
        watchdog.join();

        EXPECT_EQ(outcome, transcode::SessionOutcome::COMPLETED) << "run " << run;
        EXPECT_EQ(supervisor.GetState(), transcode::SessionState::IDLE);
    }
}
