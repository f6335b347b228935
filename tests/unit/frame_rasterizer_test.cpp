#include <catch2/catch.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <vector>

#include <glm/glm.hpp>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/FrameRasterizer.hpp"
#include "Apps/VinylGroove/SpiralGeometry.hpp"
#include "test_helpers.hpp"

using namespace VGR::Apps::VinylGroove;

namespace {
    CanvasSettings SmallCanvas() {
        return CanvasSettings {
            .Size          = 64,
            .Background    = Color(0, 0, 0),
            .InitialColor  = Color(0xCC, 0xCC, 0xCC),
            .ProgressColor = Color(0xFF, 0, 0),
        };
    }

    // 51 points on row 10, one per pixel from x = 5 to x = 55.
    std::vector<glm::vec2> HorizontalLine() {
        std::vector<glm::vec2> points;
        for (int x = 5; x <= 55; ++x) {
            points.emplace_back(float(x), 10.f);
        }
        return points;
    }
}

TEST_CASE("Progress zero draws only the unplayed color", "[rasterizer]") {
    FrameRasterizer const rasterizer(SmallCanvas());
    auto const            points = HorizontalLine();

    auto const frame = rasterizer.Render(points, 0.0);
    CHECK(frame.Size == 64);
    CHECK(frame.ByteSize() == 64 * 64 * 3);
    CHECK(frame.CountPixels(SmallCanvas().ProgressColor) == 0);
    CHECK(frame.CountPixels(SmallCanvas().InitialColor) == 51);
}

TEST_CASE("Progress one draws only the played color", "[rasterizer]") {
    FrameRasterizer const rasterizer(SmallCanvas());
    auto const            points = HorizontalLine();

    auto const frame = rasterizer.Render(points, 1.0);
    CHECK(frame.CountPixels(SmallCanvas().InitialColor) == 0);
    CHECK(frame.CountPixels(SmallCanvas().ProgressColor) == 51);
}

TEST_CASE("The played and unplayed halves meet at the split", "[rasterizer]") {
    FrameRasterizer const rasterizer(SmallCanvas());
    auto const            points = HorizontalLine();

    // split = floor(51 * 0.5) = 25, i.e. x = 30.
    auto const frame = rasterizer.Render(points, 0.5);
    for (std::size_t x = 5; x <= 55; ++x) {
        INFO("x = " << x);
        CHECK(frame.At(x, 10) != SmallCanvas().Background);
    }
    CHECK(frame.At(5, 10) == SmallCanvas().ProgressColor);
    CHECK(frame.At(29, 10) == SmallCanvas().ProgressColor);
    CHECK(frame.At(55, 10) == SmallCanvas().InitialColor);
    CHECK(frame.CountPixels(SmallCanvas().ProgressColor) + frame.CountPixels(SmallCanvas().InitialColor) == 51);
}

TEST_CASE("Rendering is a pure function of points and progress", "[rasterizer]") {
    SpiralGeometryBuilder const builder(64, VGR::Tests::TestLogger());
    std::vector<std::int16_t>   samples(500);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<std::int16_t>((i % 17) * 300 - 2400);
    }
    auto const sequence = builder.Build(samples, 8000, SpiralParameters { .InitialRadius = 5.f, .Pitch = 1.f, .AmpScale = 2.f });

    FrameRasterizer const rasterizer(SmallCanvas());
    auto const            a = rasterizer.Render(sequence.Points, 0.37);
    auto const            b = rasterizer.Render(sequence.Points, 0.37);
    CHECK(a.Pixels == b.Pixels);

    SECTION("only the three palette colors appear") {
        auto const palette = SmallCanvas();
        CHECK(a.CountPixels(palette.Background) + a.CountPixels(palette.InitialColor) + a.CountPixels(palette.ProgressColor)
              == a.Size * a.Size);
    }
}

TEST_CASE("Points off the canvas are clipped", "[rasterizer]") {
    FrameRasterizer const        rasterizer(SmallCanvas());
    std::vector<glm::vec2> const points { { -100.f, 20.f }, { 200.f, 20.f } };

    auto const frame = rasterizer.Render(points, 0.0);
    CHECK(frame.CountPixels(SmallCanvas().InitialColor) == 64);
}

TEST_CASE("Render clamps progress and rejects NaN", "[rasterizer]") {
    FrameRasterizer const rasterizer(SmallCanvas());
    auto const            points = HorizontalLine();

    CHECK(rasterizer.Render(points, -0.5).Pixels == rasterizer.Render(points, 0.0).Pixels);
    CHECK(rasterizer.Render(points, 7.0).Pixels == rasterizer.Render(points, 1.0).Pixels);
    CHECK_THROWS_AS(rasterizer.Render(points, std::numeric_limits<double>::quiet_NaN()), RenderError);
}

TEST_CASE("An empty point sequence renders the background", "[rasterizer]") {
    FrameRasterizer const rasterizer(SmallCanvas());

    auto const frame = rasterizer.Render({}, 0.5);
    CHECK(frame.CountPixels(SmallCanvas().Background) == 64 * 64);
}

TEST_CASE("WritePng stores an RGB image", "[rasterizer][png]") {
    VGR::Tests::ScratchDir const dir;
    FrameRasterizer const        rasterizer(SmallCanvas());
    auto const                   frame = rasterizer.Render(HorizontalLine(), 0.5);

    auto const path = dir / "preview.png";
    WritePng(frame, path);
    REQUIRE(std::filesystem::exists(path));

    std::array<unsigned char, 8> signature {};
    std::ifstream                in(path, std::ios::binary);
    in.read(reinterpret_cast<char *>(signature.data()), signature.size());
    std::array<unsigned char, 8> const expected { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' };
    CHECK(signature == expected);

    SECTION("an unwritable path is reported") {
        CHECK_THROWS_AS(WritePng(frame, dir / "missing" / "preview.png"), ExportError);
    }
    SECTION("an empty frame is rejected") {
        CHECK_THROWS_AS(WritePng(Frame {}, dir / "empty.png"), ExportError);
    }
}
