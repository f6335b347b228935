#include "Apps/VinylGroove/FrameRasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <utility>

#include <png.h>
#include <spdlog/fmt/fmt.h>

#include "Apps/VinylGroove/Errors.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr std::size_t kChannels = 3;

        // Liang-Barsky clip of a segment against [lo, hi] on both axes.
        bool ClipSegment(glm::dvec2 & a, glm::dvec2 & b, double lo, double hi) {
            double t0 = 0.0;
            double t1 = 1.0;
            glm::dvec2 const d = b - a;
            double const p[4] = { -d.x, d.x, -d.y, d.y };
            double const q[4] = { a.x - lo, hi - a.x, a.y - lo, hi - a.y };
            for (int i = 0; i < 4; ++i) {
                if (p[i] == 0.0) {
                    if (q[i] < 0.0) return false;
                    continue;
                }
                double const r = q[i] / p[i];
                if (p[i] < 0.0) {
                    if (r > t1) return false;
                    t0 = std::max(t0, r);
                } else {
                    if (r < t0) return false;
                    t1 = std::min(t1, r);
                }
            }
            glm::dvec2 const start = a;
            a = start + t0 * d;
            b = start + t1 * d;
            return true;
        }

        glm::ivec2 ToPixel(glm::dvec2 const & p) {
            return glm::ivec2(int(std::lround(p.x)), int(std::lround(p.y)));
        }
    }

    Frame::Frame(std::size_t size, Color const & fill):
        Size(size),
        Pixels(size * size * kChannels) {
        for (std::size_t i = 0; i < Pixels.size(); i += kChannels) {
            Pixels[i]     = fill.r;
            Pixels[i + 1] = fill.g;
            Pixels[i + 2] = fill.b;
        }
    }

    Color Frame::At(std::size_t x, std::size_t y) const {
        auto const offset = (y * Size + x) * kChannels;
        return Color(Pixels[offset], Pixels[offset + 1], Pixels[offset + 2]);
    }

    void Frame::Set(std::size_t x, std::size_t y, Color const & color) {
        auto const offset = (y * Size + x) * kChannels;
        Pixels[offset]     = color.r;
        Pixels[offset + 1] = color.g;
        Pixels[offset + 2] = color.b;
    }

    std::size_t Frame::CountPixels(Color const & color) const {
        std::size_t count = 0;
        for (std::size_t i = 0; i + 2 < Pixels.size(); i += kChannels) {
            if (Pixels[i] == color.r && Pixels[i + 1] == color.g && Pixels[i + 2] == color.b) {
                ++count;
            }
        }
        return count;
    }

    FrameRasterizer::FrameRasterizer(CanvasSettings settings):
        _settings(std::move(settings)) {
    }

    CanvasSettings const & FrameRasterizer::GetSettings() const {
        return _settings;
    }

    Frame FrameRasterizer::Render(std::span<glm::vec2 const> points, double progress) const {
        if (! std::isfinite(progress)) {
            throw RenderError("Render progress must be a finite number");
        }
        progress = std::clamp(progress, 0.0, 1.0);

        Frame frame(_settings.Size, _settings.Background);
        auto const count = points.size();
        auto const split = std::min(count, static_cast<std::size_t>(std::floor(double(count) * progress)));

        if (split > 1) {
            DrawPolyline(frame, points.first(std::min(split + 1, count)), _settings.ProgressColor);
        }
        if (split < count) {
            DrawPolyline(frame, points.subspan(split), _settings.InitialColor);
        }
        return frame;
    }

    void FrameRasterizer::DrawPolyline(Frame & frame, std::span<glm::vec2 const> points, Color const & color) const {
        if (points.empty() || frame.Size == 0) {
            return;
        }
        double const lo = -1.0;
        double const hi = double(frame.Size);
        if (points.size() == 1) {
            glm::dvec2 a(points[0]);
            glm::dvec2 b(points[0]);
            if (ClipSegment(a, b, lo, hi)) {
                DrawLine(frame, ToPixel(a), ToPixel(b), color);
            }
            return;
        }
        for (std::size_t i = 0; i + 1 < points.size(); ++i) {
            glm::dvec2 a(points[i]);
            glm::dvec2 b(points[i + 1]);
            if (! ClipSegment(a, b, lo, hi)) {
                continue;
            }
            DrawLine(frame, ToPixel(a), ToPixel(b), color);
        }
    }

    void FrameRasterizer::DrawLine(Frame & frame, glm::ivec2 from, glm::ivec2 to, Color const & color) const {
        int const size = int(frame.Size);
        int const dx   = std::abs(to.x - from.x);
        int const dy   = -std::abs(to.y - from.y);
        int const sx   = from.x < to.x ? 1 : -1;
        int const sy   = from.y < to.y ? 1 : -1;
        int       err  = dx + dy;
        glm::ivec2 p   = from;
        while (true) {
            if (p.x >= 0 && p.y >= 0 && p.x < size && p.y < size) {
                frame.Set(std::size_t(p.x), std::size_t(p.y), color);
            }
            if (p == to) break;
            int const e2 = 2 * err;
            if (e2 >= dy) {
                err += dy;
                p.x += sx;
            }
            if (e2 <= dx) {
                err += dx;
                p.y += sy;
            }
        }
    }

    void WritePng(Frame const & frame, std::filesystem::path const & path) {
        if (frame.Size == 0 || frame.Pixels.size() != frame.Size * frame.Size * kChannels) {
            throw ExportError("Cannot save an empty frame");
        }

        std::unique_ptr<std::FILE, int (*)(std::FILE *)> file(std::fopen(path.string().c_str(), "wb"), &std::fclose);
        if (! file) {
            throw ExportError(fmt::format("Unable to open {} for writing", path.string()));
        }

        png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (! png) {
            throw ExportError("png_create_write_struct failed");
        }
        png_infop info = png_create_info_struct(png);
        if (! info) {
            png_destroy_write_struct(&png, nullptr);
            throw ExportError("png_create_info_struct failed");
        }

        auto const height = static_cast<png_uint_32>(frame.Size);
        std::vector<png_bytep> rows(frame.Size);
        for (std::size_t y = 0; y < frame.Size; ++y) {
            rows[y] = const_cast<png_bytep>(frame.Pixels.data() + y * frame.Size * kChannels);
        }

        if (setjmp(png_jmpbuf(png))) {
            png_destroy_write_struct(&png, &info);
            throw ExportError(fmt::format("libpng failed while writing {}", path.string()));
        }

        png_init_io(png, file.get());
        png_set_IHDR(png, info, height, height, 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
            PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        png_write_info(png, info);
        png_write_image(png, rows.data());
        png_write_end(png, nullptr);
        png_destroy_write_struct(&png, &info);
    }
} // namespace VGR::Apps::VinylGroove
