#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <glm/gtc/type_precision.hpp>
#include <spdlog/logger.h>

#include "Apps/VinylGroove/SpiralGeometry.hpp"

namespace VGR::Apps::VinylGroove {
    using Color = glm::u8vec3;

    struct CanvasSettings {
        std::size_t Size          = 2000;
        Color       Background    { 0x00, 0x00, 0x00 };
        Color       InitialColor  { 0xCC, 0xCC, 0xCC };
        Color       ProgressColor { 0xFF, 0x00, 0x00 };
    };

    struct VideoSettings {
        int         FrameRate   = 10;
        int         Quality     = 23; // CRF, 0-51, lower is better
        std::string Preset      = "ultrafast";
        std::string VideoCodec  = "libx264";
        std::string AudioCodec  = "aac";
        std::string PixelFormat = "yuv420p";
    };

    struct MediaSettings {
        std::string FfmpegPath = "ffmpeg";
    };

    struct OutputSettings {
        std::string Suffix = "_vinyl";
    };

    struct LogSettings {
        std::string Level = "info";
        std::string File  = "logs/vinylgroove.log";
    };

    struct Settings {
        CanvasSettings   Canvas;
        VideoSettings    Video;
        SpiralParameters Spiral;
        MediaSettings    Media;
        OutputSettings   Output;
        LogSettings      Log;
    };

    std::filesystem::path DefaultConfigPath();

    // Overlays the YAML file on top of defaults. A missing or malformed file
    // leaves the defaults in place.
    Settings LoadSettings(std::filesystem::path const & path, spdlog::logger & logger);
    bool     SaveSettings(Settings const & settings, std::filesystem::path const & path, spdlog::logger & logger);

    // Accepts "#RRGGBB" or a handful of color names.
    bool        TryParseColor(std::string const & value, Color & out);
    std::string ColorName(Color const & color);

    // Clamps every numeric field into its supported range.
    void Sanitize(Settings & settings);
} // namespace VGR::Apps::VinylGroove
