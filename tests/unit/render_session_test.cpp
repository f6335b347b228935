#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "Apps/VinylGroove/EncodeJob.hpp"
#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/RenderSession.hpp"
#include "test_helpers.hpp"

using namespace VGR::Apps::VinylGroove;
using VGR::Tests::FakeTranscoder;
using VGR::Tests::ScratchDir;

namespace {
    constexpr auto kGenerous = std::chrono::seconds(10);

    Settings SmallSettings() {
        Settings settings;
        settings.Canvas.Size     = 64;
        settings.Video.FrameRate = 10;
        return settings;
    }

    SpiralParameters SmallSpiral() {
        return SpiralParameters { .InitialRadius = 8.f, .Pitch = 1.f, .AmpScale = 3.f };
    }

    // 0.2 s of audio at 8 kHz: two video frames at 10 fps.
    void PrimeTranscoder(FakeTranscoder & transcoder) {
        transcoder.SampleRate = 8000;
        transcoder.Channels   = 1;
        transcoder.Interleaved.resize(1600);
        for (std::size_t i = 0; i < transcoder.Interleaved.size(); ++i) {
            transcoder.Interleaved[i] = static_cast<std::int16_t>((i % 40) * 500 - 10000);
        }
    }

    std::filesystem::path TouchSource(ScratchDir const & dir, char const * name) {
        auto const path = dir / name;
        std::ofstream(path, std::ios::binary) << "stub";
        return path;
    }
}

TEST_CASE("A session loads, builds and previews", "[session]") {
    ScratchDir const dir;
    FakeTranscoder   transcoder;
    PrimeTranscoder(transcoder);
    RenderSession session(SmallSettings(), transcoder, VGR::Tests::TestLogger());

    CHECK_FALSE(session.HasAudio());
    CHECK_FALSE(session.HasPreview());

    auto const source = TouchSource(dir, "track.mp3");
    auto const & samples = session.Load(source);
    CHECK(samples.SampleRate == 8000);
    CHECK(samples.Samples.size() == 1600);
    CHECK(session.DurationSeconds() == Approx(0.2));
    CHECK(session.AudioPath() == source);

    auto const & preview = session.BuildAndRender(SmallSpiral());
    CHECK(session.HasPreview());
    CHECK(preview.Size == 64);
    CHECK(session.Points().Size() == 1600);
    CHECK(preview.CountPixels(SmallSettings().Canvas.ProgressColor) == 0);
    CHECK(preview.CountPixels(SmallSettings().Canvas.InitialColor) > 0);
    CHECK(session.GetSettings().Spiral.InitialRadius == 8.f);

    SECTION("default output names follow the audio stem") {
        CHECK(session.DefaultImagePath() == std::filesystem::path("track_vinyl.png"));
        CHECK(session.DefaultVideoPath() == std::filesystem::path("track_vinyl.mp4"));
    }

    SECTION("a failed rebuild keeps the previous spiral") {
        auto const before = session.Points().Points;
        CHECK_THROWS_AS(session.BuildAndRender(SpiralParameters { .Pitch = 0.f }), RenderError);
        CHECK(session.HasPreview());
        CHECK(session.Points().Points == before);
        CHECK(session.GetSettings().Spiral.Pitch == 1.f);
    }

    SECTION("loading new audio drops the spiral") {
        session.Load(TouchSource(dir, "other.wav"));
        CHECK(session.HasAudio());
        CHECK_FALSE(session.HasPreview());
        CHECK(session.Points().Empty());
    }

    SECTION("a failed load keeps the current audio") {
        transcoder.FailDecode = true;
        CHECK_THROWS_AS(session.Load(TouchSource(dir, "bad.wav")), DecodeError);
        CHECK(session.AudioPath() == source);
        CHECK(session.HasPreview());
    }

    SECTION("the preview can be saved") {
        auto const saved = session.SavePreview(dir / "still.png");
        CHECK(saved == dir / "still.png");
        CHECK(std::filesystem::file_size(saved) > 0);
    }
}

TEST_CASE("A session refuses out-of-order operations", "[session]") {
    FakeTranscoder transcoder;
    RenderSession  session(SmallSettings(), transcoder, VGR::Tests::TestLogger());

    CHECK_THROWS_AS(session.BuildAndRender(SmallSpiral()), std::logic_error);
    CHECK_THROWS_AS(session.StartEncode(), std::logic_error);
    CHECK_THROWS_AS(session.SavePreview(), std::logic_error);
}

TEST_CASE("A session runs one encode at a time", "[session][encode]") {
    ScratchDir const dir;
    FakeTranscoder   transcoder;
    PrimeTranscoder(transcoder);
    RenderSession session(SmallSettings(), transcoder, VGR::Tests::TestLogger());
    session.Load(TouchSource(dir, "loop.flac"));
    session.BuildAndRender(SmallSpiral());

    std::promise<void>       gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool>        firstFrameSent { false };
    transcoder.Log->OnFrame = [opened, &firstFrameSent](std::size_t written) {
        if (written == 1) {
            firstFrameSent.store(true);
            opened.wait();
        }
    };

    std::vector<std::size_t> reported;
    auto job = session.StartEncode([&reported](std::size_t sent, std::size_t) { reported.push_back(sent); }, dir / "loop.mp4");
    REQUIRE(job);
    CHECK(session.ActiveJob() == job);

    auto const deadline = std::chrono::steady_clock::now() + kGenerous;
    while (! firstFrameSent.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(firstFrameSent.load());
    CHECK(session.Encoding());
    CHECK(job->IsRunning());
    CHECK_THROWS_AS(session.StartEncode(), std::logic_error);
    CHECK_THROWS_AS(session.SetSettings(SmallSettings()), std::logic_error);

    SECTION("completes when left alone") {
        gate.set_value();
        CHECK(job->Wait() == EncodeOutcome::Completed);
        CHECK_FALSE(session.Encoding());
        CHECK(session.ActiveJob() == nullptr);
        CHECK(job->FramesSent() == 2);
        CHECK(job->TotalFrames() == 2);
        CHECK(reported.back() == 2);
        CHECK(transcoder.Log->Finished);
        CHECK(transcoder.LastRequest.OutputPath == dir / "loop.mp4");
        CHECK(transcoder.LastRequest.AudioPath == dir / "loop.flac");

        SECTION("and a second encode may follow") {
            auto again = session.StartEncode({}, dir / "again.mp4");
            CHECK(again->Wait() == EncodeOutcome::Completed);
            CHECK(transcoder.EncoderOpens == 2);
        }
    }

    SECTION("stops at the next frame when cancelled") {
        job->Cancel();
        CHECK(job->CancelRequested());
        gate.set_value();
        CHECK(job->Wait() == EncodeOutcome::Cancelled);
        CHECK(transcoder.Log->FramesWritten == 1);
        CHECK(transcoder.Log->Aborted);
        CHECK_FALSE(transcoder.Log->Finished);
    }
}

TEST_CASE("EncodeJob publishes progress and results", "[encode]") {
    SECTION("progress counters follow the worker") {
        std::atomic<std::size_t> callbacks { 0 };
        auto job = EncodeJob::Start(
            [](ProgressCallback const & progress, CancellationToken const &) {
                for (std::size_t i = 1; i <= 4; ++i) {
                    progress(i, 4);
                }
                return EncodeOutcome::Completed;
            },
            [&callbacks](std::size_t, std::size_t) { ++callbacks; });

        CHECK(job->WaitFor(kGenerous));
        CHECK(job->Wait() == EncodeOutcome::Completed);
        CHECK_FALSE(job->IsRunning());
        CHECK(job->FramesSent() == 4);
        CHECK(job->TotalFrames() == 4);
        CHECK(callbacks.load() == 4);
    }

    SECTION("errors are rethrown from Wait") {
        auto job = EncodeJob::Start([](ProgressCallback const &, CancellationToken const &) -> EncodeOutcome {
            throw EncodeError("encoder exited with code 1");
        });
        CHECK_THROWS_AS(job->Wait(), EncodeError);
        CHECK_FALSE(job->IsRunning());
    }

    SECTION("cancellation reaches the worker") {
        auto job = EncodeJob::Start([](ProgressCallback const &, CancellationToken const & cancel) {
            auto const deadline = std::chrono::steady_clock::now() + kGenerous;
            while (! cancel.IsCancellationRequested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return cancel.IsCancellationRequested() ? EncodeOutcome::Cancelled : EncodeOutcome::Completed;
        });
        CHECK_FALSE(job->WaitFor(std::chrono::milliseconds(20)));
        job->Cancel();
        CHECK(job->Wait() == EncodeOutcome::Cancelled);
    }
}
