#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include <glm/glm.hpp>

#include "Apps/VinylGroove/Settings.hpp"

namespace VGR::Apps::VinylGroove {
    // Square RGB24 raster, row-major, three bytes per pixel. The byte layout
    // matches the encoder's rgb24 raw-video input.
    struct Frame {
        std::size_t               Size = 0;
        std::vector<std::uint8_t> Pixels;

        Frame() = default;
        Frame(std::size_t size, Color const & fill);

        Color At(std::size_t x, std::size_t y) const;
        void  Set(std::size_t x, std::size_t y, Color const & color);

        std::span<std::uint8_t const> Bytes() const { return Pixels; }
        std::size_t                   ByteSize() const { return Pixels.size(); }
        std::size_t                   CountPixels(Color const & color) const;
    };

    class FrameRasterizer {
    public:
        explicit FrameRasterizer(CanvasSettings settings);

        CanvasSettings const & GetSettings() const;

        /**
         * Draws the spiral with points[0..split] in the progress color and
         * points[split..] in the initial color, split = floor(count * progress).
         * The played polyline runs through points[split] so the two halves join.
         * @throw RenderError when progress is not finite.
         */
        Frame Render(std::span<glm::vec2 const> points, double progress) const;

    private:
        void DrawPolyline(Frame & frame, std::span<glm::vec2 const> points, Color const & color) const;
        void DrawLine(Frame & frame, glm::ivec2 from, glm::ivec2 to, Color const & color) const;

        CanvasSettings _settings;
    };

    // Lossless 8-bit RGB PNG.
    void WritePng(Frame const & frame, std::filesystem::path const & path);
} // namespace VGR::Apps::VinylGroove
