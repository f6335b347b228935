#include "Apps/VinylGroove/Settings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr std::size_t kMinCanvasSize = 16;
        constexpr std::size_t kMaxCanvasSize = 8192;
        constexpr int         kMinFrameRate  = 1;
        constexpr int         kMaxFrameRate  = 120;
        constexpr int         kMinQuality    = 0;
        constexpr int         kMaxQuality    = 51;

        std::array<std::pair<std::string_view, Color>, 6> const kNamedColors {
            std::pair<std::string_view, Color> { "black", Color(0x00, 0x00, 0x00) },
            std::pair<std::string_view, Color> { "white", Color(0xFF, 0xFF, 0xFF) },
            std::pair<std::string_view, Color> { "red",   Color(0xFF, 0x00, 0x00) },
            std::pair<std::string_view, Color> { "green", Color(0x00, 0x80, 0x00) },
            std::pair<std::string_view, Color> { "blue",  Color(0x00, 0x00, 0xFF) },
            std::pair<std::string_view, Color> { "gray",  Color(0x80, 0x80, 0x80) },
        };

        int HexDigit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        void ReadColor(YAML::Node const & node, Color & dst, char const * key, spdlog::logger & logger) {
            if (! node) {
                return;
            }
            auto const text = node.as<std::string>("");
            if (! TryParseColor(text, dst)) {
                logger.warn("Config color {} '{}' not recognized, keeping {}", key, text, ColorName(dst));
            }
        }
    }

    std::filesystem::path DefaultConfigPath() {
        return std::filesystem::current_path() / "VinylGrooveConfig.yaml";
    }

    bool TryParseColor(std::string const & value, Color & out) {
        if (value.size() == 7 && value[0] == '#') {
            std::array<int, 6> digits {};
            for (std::size_t i = 0; i < digits.size(); ++i) {
                digits[i] = HexDigit(value[i + 1]);
                if (digits[i] < 0) {
                    return false;
                }
            }
            out = Color(
                static_cast<std::uint8_t>(digits[0] * 16 + digits[1]),
                static_cast<std::uint8_t>(digits[2] * 16 + digits[3]),
                static_cast<std::uint8_t>(digits[4] * 16 + digits[5]));
            return true;
        }

        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        for (auto const & [name, color] : kNamedColors) {
            if (lowered == name) {
                out = color;
                return true;
            }
        }
        return false;
    }

    std::string ColorName(Color const & color) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", color.r, color.g, color.b);
        return buffer;
    }

    void Sanitize(Settings & settings) {
        settings.Canvas.Size     = std::clamp(settings.Canvas.Size, kMinCanvasSize, kMaxCanvasSize);
        settings.Video.FrameRate = std::clamp(settings.Video.FrameRate, kMinFrameRate, kMaxFrameRate);
        settings.Video.Quality   = std::clamp(settings.Video.Quality, kMinQuality, kMaxQuality);
        if (settings.Media.FfmpegPath.empty()) {
            settings.Media.FfmpegPath = "ffmpeg";
        }
    }

    Settings LoadSettings(std::filesystem::path const & path, spdlog::logger & logger) {
        Settings settings;
        if (! std::filesystem::exists(path)) {
            logger.info("Config {} missing, using defaults.", path.string());
            return settings;
        }

        try {
            auto const root = YAML::LoadFile(path.string());

            if (auto canvasNode = root["canvas"]) {
                auto const size      = canvasNode["size"].as<int>(static_cast<int>(settings.Canvas.Size));
                settings.Canvas.Size = static_cast<std::size_t>(std::max(size, 0));
                ReadColor(canvasNode["background"], settings.Canvas.Background, "background", logger);
                ReadColor(canvasNode["initialColor"], settings.Canvas.InitialColor, "initialColor", logger);
                ReadColor(canvasNode["progressColor"], settings.Canvas.ProgressColor, "progressColor", logger);
            }

            if (auto videoNode = root["video"]) {
                settings.Video.FrameRate   = videoNode["frameRate"].as<int>(settings.Video.FrameRate);
                settings.Video.Quality     = videoNode["quality"].as<int>(settings.Video.Quality);
                settings.Video.Preset      = videoNode["preset"].as<std::string>(settings.Video.Preset);
                settings.Video.VideoCodec  = videoNode["videoCodec"].as<std::string>(settings.Video.VideoCodec);
                settings.Video.AudioCodec  = videoNode["audioCodec"].as<std::string>(settings.Video.AudioCodec);
                settings.Video.PixelFormat = videoNode["pixelFormat"].as<std::string>(settings.Video.PixelFormat);
            }

            if (auto spiralNode = root["spiral"]) {
                settings.Spiral.InitialRadius = spiralNode["initialRadius"].as<float>(settings.Spiral.InitialRadius);
                settings.Spiral.Pitch         = spiralNode["pitch"].as<float>(settings.Spiral.Pitch);
                settings.Spiral.AmpScale      = spiralNode["ampScale"].as<float>(settings.Spiral.AmpScale);
            }

            if (auto mediaNode = root["media"]) {
                settings.Media.FfmpegPath = mediaNode["ffmpegPath"].as<std::string>(settings.Media.FfmpegPath);
            }

            if (auto outputNode = root["output"]) {
                settings.Output.Suffix = outputNode["suffix"].as<std::string>(settings.Output.Suffix);
            }

            if (auto logNode = root["log"]) {
                settings.Log.Level = logNode["level"].as<std::string>(settings.Log.Level);
                settings.Log.File  = logNode["file"].as<std::string>(settings.Log.File);
            }

            Sanitize(settings);
            logger.info("Config loaded from {} (canvas {}, fps {}, crf {}, r0 {:.1f}, b {:.2f}, amp {:.1f})",
                path.string(),
                settings.Canvas.Size,
                settings.Video.FrameRate,
                settings.Video.Quality,
                settings.Spiral.InitialRadius,
                settings.Spiral.Pitch,
                settings.Spiral.AmpScale);
        } catch (YAML::Exception const & ex) {
            logger.error("Config load failed {}: {}", path.string(), ex.what());
            settings = Settings {};
        }
        return settings;
    }

    bool SaveSettings(Settings const & settings, std::filesystem::path const & path, spdlog::logger & logger) {
        try {
            if (auto const parent = path.parent_path(); ! parent.empty() && ! std::filesystem::exists(parent)) {
                std::filesystem::create_directories(parent);
            }

            YAML::Node root;
            YAML::Node canvasNode;
            canvasNode["size"]          = static_cast<int>(settings.Canvas.Size);
            canvasNode["background"]    = ColorName(settings.Canvas.Background);
            canvasNode["initialColor"]  = ColorName(settings.Canvas.InitialColor);
            canvasNode["progressColor"] = ColorName(settings.Canvas.ProgressColor);
            root["canvas"] = canvasNode;

            YAML::Node videoNode;
            videoNode["frameRate"]   = settings.Video.FrameRate;
            videoNode["quality"]     = settings.Video.Quality;
            videoNode["preset"]      = settings.Video.Preset;
            videoNode["videoCodec"]  = settings.Video.VideoCodec;
            videoNode["audioCodec"]  = settings.Video.AudioCodec;
            videoNode["pixelFormat"] = settings.Video.PixelFormat;
            root["video"] = videoNode;

            YAML::Node spiralNode;
            spiralNode["initialRadius"] = settings.Spiral.InitialRadius;
            spiralNode["pitch"]         = settings.Spiral.Pitch;
            spiralNode["ampScale"]      = settings.Spiral.AmpScale;
            root["spiral"] = spiralNode;

            YAML::Node mediaNode;
            mediaNode["ffmpegPath"] = settings.Media.FfmpegPath;
            root["media"] = mediaNode;

            YAML::Node outputNode;
            outputNode["suffix"] = settings.Output.Suffix;
            root["output"] = outputNode;

            YAML::Node logNode;
            logNode["level"] = settings.Log.Level;
            logNode["file"]  = settings.Log.File;
            root["log"] = logNode;

            std::ofstream out(path);
            out << root;
            if (! out) {
                logger.error("Config save failed {}: write error", path.string());
                return false;
            }
            logger.info("Config saved to {}", path.string());
            return true;
        } catch (std::exception const & ex) {
            logger.error("Config save failed {}: {}", path.string(), ex.what());
            return false;
        }
    }
} // namespace VGR::Apps::VinylGroove
