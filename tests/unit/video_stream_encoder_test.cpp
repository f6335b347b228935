#include <catch2/catch.hpp>

#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "Apps/VinylGroove/CancellationToken.hpp"
#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/VideoStreamEncoder.hpp"
#include "test_helpers.hpp"

using namespace VGR::Apps::VinylGroove;
using VGR::Tests::FakeTranscoder;

namespace {
    CanvasSettings TinyCanvas() {
        CanvasSettings canvas;
        canvas.Size = 32;
        return canvas;
    }

    VideoSettings TenFps() {
        VideoSettings video;
        video.FrameRate = 10;
        video.Quality   = 30;
        return video;
    }

    std::vector<glm::vec2> Diagonal() {
        std::vector<glm::vec2> points;
        for (int i = 2; i < 30; ++i) {
            points.emplace_back(float(i), float(i));
        }
        return points;
    }

    using ProgressLog = std::vector<std::pair<std::size_t, std::size_t>>;
}

TEST_CASE("FrameCount floors duration times frame rate", "[encoder]") {
    CHECK(VideoStreamEncoder::FrameCount(2.5, 10) == 25);
    CHECK(VideoStreamEncoder::FrameCount(0.99, 10) == 9);
    CHECK(VideoStreamEncoder::FrameCount(0.05, 10) == 0);
    CHECK(VideoStreamEncoder::FrameCount(0.0, 10) == 0);
    CHECK(VideoStreamEncoder::FrameCount(5.0, 0) == 0);
    CHECK(VideoStreamEncoder::FrameCount(std::numeric_limits<double>::infinity(), 10) == 0);
}

TEST_CASE("ProgressInterval reports about once per percent", "[encoder]") {
    CHECK(VideoStreamEncoder::ProgressInterval(1) == 1);
    CHECK(VideoStreamEncoder::ProgressInterval(99) == 1);
    CHECK(VideoStreamEncoder::ProgressInterval(1000) == 10);
    CHECK(VideoStreamEncoder::ProgressInterval(12345) == 123);
}

TEST_CASE("A full encode streams every frame and finishes", "[encoder]") {
    FakeTranscoder           transcoder;
    VideoStreamEncoder const encoder(transcoder, TinyCanvas(), TenFps(), VGR::Tests::TestLogger());
    CancellationToken        cancel;
    ProgressLog              progress;
    auto const               points = Diagonal();

    auto const outcome = encoder.Encode("song.flac", points, 2.0, "song_vinyl.mp4",
        [&progress](std::size_t sent, std::size_t total) { progress.emplace_back(sent, total); }, cancel);

    CHECK(outcome == EncodeOutcome::Completed);
    CHECK(transcoder.EncoderOpens == 1);
    CHECK(transcoder.Log->FramesWritten == 20);
    CHECK(transcoder.Log->LastFrameBytes == 32 * 32 * 3);
    CHECK(transcoder.Log->Finished);
    CHECK_FALSE(transcoder.Log->Aborted);

    SECTION("the request mirrors the settings") {
        auto const & request = transcoder.LastRequest;
        CHECK(request.AudioPath == "song.flac");
        CHECK(request.OutputPath == "song_vinyl.mp4");
        CHECK(request.Width == 32);
        CHECK(request.Height == 32);
        CHECK(request.FrameRate == 10);
        CHECK(request.Quality == 30);
        CHECK(request.VideoCodec == "libx264");
        CHECK(request.PixelFormat == "yuv420p");
    }

    SECTION("progress starts at the first frame and ends at the total") {
        REQUIRE_FALSE(progress.empty());
        CHECK(progress.front() == std::make_pair(std::size_t(1), std::size_t(20)));
        CHECK(progress.back() == std::make_pair(std::size_t(20), std::size_t(20)));
        for (std::size_t i = 1; i < progress.size(); ++i) {
            CHECK(progress[i].first > progress[i - 1].first);
        }
    }

    SECTION("the first frame is unplayed and the last is nearly all played") {
        FrameRasterizer const rasterizer(TinyCanvas());
        CHECK(transcoder.Log->FirstFrame == rasterizer.Render(points, 0.0).Pixels);
        CHECK(transcoder.Log->LastFrame == rasterizer.Render(points, 19.0 / 20.0).Pixels);
    }
}

TEST_CASE("Long encodes report sparsely but always end on the total", "[encoder]") {
    FakeTranscoder           transcoder;
    VideoStreamEncoder const encoder(transcoder, TinyCanvas(), TenFps(), VGR::Tests::TestLogger());
    CancellationToken        cancel;
    ProgressLog              progress;

    // 25.05 s at 10 fps: 250 frames, reported every 2nd frame up to 249.
    auto const outcome = encoder.Encode("a.wav", Diagonal(), 25.05, "a_vinyl.mp4",
        [&progress](std::size_t sent, std::size_t total) { progress.emplace_back(sent, total); }, cancel);

    CHECK(outcome == EncodeOutcome::Completed);
    CHECK(transcoder.Log->FramesWritten == 250);
    REQUIRE(progress.size() == 126);
    CHECK(progress[124].first == 249);
    CHECK(progress.back().first == 250);
    CHECK(progress.back().second == 250);
}

TEST_CASE("A cancel requested before the first frame sends nothing", "[encoder]") {
    FakeTranscoder           transcoder;
    VideoStreamEncoder const encoder(transcoder, TinyCanvas(), TenFps(), VGR::Tests::TestLogger());
    CancellationToken        cancel;
    cancel.RequestCancel();
    std::size_t calls = 0;

    auto const outcome = encoder.Encode("a.wav", Diagonal(), 3.0, "a_vinyl.mp4",
        [&calls](std::size_t, std::size_t) { ++calls; }, cancel);

    CHECK(outcome == EncodeOutcome::Cancelled);
    CHECK(transcoder.Log->FramesWritten == 0);
    CHECK(transcoder.Log->Aborted);
    CHECK_FALSE(transcoder.Log->Finished);
    CHECK(calls == 0);
}

TEST_CASE("A cancel mid-stream stops before the next frame", "[encoder]") {
    FakeTranscoder           transcoder;
    VideoStreamEncoder const encoder(transcoder, TinyCanvas(), TenFps(), VGR::Tests::TestLogger());
    CancellationToken        cancel;
    transcoder.Log->OnFrame = [&cancel](std::size_t written) {
        if (written == 5) cancel.RequestCancel();
    };

    auto const outcome = encoder.Encode("a.wav", Diagonal(), 3.0, "a_vinyl.mp4", {}, cancel);

    CHECK(outcome == EncodeOutcome::Cancelled);
    CHECK(transcoder.Log->FramesWritten == 5);
    CHECK(transcoder.Log->Aborted);
    CHECK_FALSE(transcoder.Log->Finished);
}

TEST_CASE("Encoder failures surface as EncodeError", "[encoder]") {
    FakeTranscoder           transcoder;
    VideoStreamEncoder const encoder(transcoder, TinyCanvas(), TenFps(), VGR::Tests::TestLogger());
    CancellationToken        cancel;

    SECTION("a broken frame pipe aborts the encoder") {
        transcoder.Log->FailOnFrame = 3;
        CHECK_THROWS_AS(encoder.Encode("a.wav", Diagonal(), 1.0, "a_vinyl.mp4", {}, cancel), EncodeError);
        CHECK(transcoder.Log->FramesWritten == 3);
        CHECK(transcoder.Log->Aborted);
    }

    SECTION("a failing encoder exit is reported") {
        transcoder.Log->FailOnFinish = true;
        CHECK_THROWS_AS(encoder.Encode("a.wav", Diagonal(), 1.0, "a_vinyl.mp4", {}, cancel), EncodeError);
        CHECK(transcoder.Log->FramesWritten == 10);
        CHECK(transcoder.Log->Aborted);
    }

    SECTION("audio too short for a single frame") {
        CHECK_THROWS_AS(encoder.Encode("a.wav", Diagonal(), 0.05, "a_vinyl.mp4", {}, cancel), EncodeError);
        CHECK(transcoder.EncoderOpens == 0);
    }

    SECTION("no points") {
        CHECK_THROWS_AS(encoder.Encode("a.wav", {}, 1.0, "a_vinyl.mp4", {}, cancel), EncodeError);
        CHECK(transcoder.EncoderOpens == 0);
    }
}

TEST_CASE("EncodeOutcomeName", "[encoder]") {
    CHECK(std::string(EncodeOutcomeName(EncodeOutcome::Completed)) == "Completed");
    CHECK(std::string(EncodeOutcomeName(EncodeOutcome::Cancelled)) == "Cancelled");
}
