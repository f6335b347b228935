#include "Apps/VinylGroove/App.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/FfmpegTranscoder.hpp"
#include "Apps/VinylGroove/Logging.hpp"
#include "Apps/VinylGroove/RenderSession.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr auto kPollInterval = std::chrono::milliseconds(200);

        std::atomic<bool> g_interruptRequested { false };

        void OnInterrupt(int) {
            g_interruptRequested.store(true);
        }

        bool ParseFloat(std::string const & text, float & out) {
            char * end = nullptr;
            errno      = 0;
            float const value = std::strtof(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
                return false;
            }
            out = value;
            return true;
        }

        bool ParseInt(std::string const & text, long & out) {
            char * end = nullptr;
            errno      = 0;
            long const value = std::strtol(text.c_str(), &end, 10);
            if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
                return false;
            }
            out = value;
            return true;
        }
    }

    std::string Usage(char const * program) {
        return fmt::format(
            "Usage: {} <audio file> [options]\n"
            "  --config <file>     YAML settings (default VinylGrooveConfig.yaml)\n"
            "  --r0 <radius>       initial radius, 100 up to the canvas edge limit\n"
            "  --pitch <b>         spiral pitch, recommended 1-10\n"
            "  --amp <scale>       amplitude scale, recommended 10-100\n"
            "  --fps <n>           video frame rate\n"
            "  --crf <n>           video quality, 0-51, lower is better\n"
            "  --size <px>         canvas side length\n"
            "  --output <file>     video path (default <audio>_vinyl.mp4)\n"
            "  --preview-only      save the still image and stop\n"
            "  --no-preview        do not save the still image\n"
            "  --save-config       write the effective settings back to the config file\n"
            "  --log-level <lvl>   trace, debug, info, warn, error, critical, off\n",
            program ? program : "vinylgroove");
    }

    CommandLine ParseCommandLine(int argc, char * argv[]) {
        CommandLine result;
        auto fail = [&result](std::string message) {
            if (result.Error.empty()) {
                result.Error = std::move(message);
            }
        };

        for (int i = 1; i < argc; ++i) {
            std::string_view arg { argv[i] ? argv[i] : "" };
            std::string      value;
            bool             hasInlineValue = false;
            if (arg.starts_with("--")) {
                if (auto const eq = arg.find('='); eq != std::string_view::npos) {
                    value          = std::string(arg.substr(eq + 1));
                    arg            = arg.substr(0, eq);
                    hasInlineValue = true;
                }
            }

            auto takeValue = [&]() -> bool {
                if (hasInlineValue) return true;
                if (i + 1 < argc) {
                    value = argv[++i];
                    return true;
                }
                fail(fmt::format("Missing value for {}", arg));
                return false;
            };
            auto takeFloat = [&](std::optional<float> & dst) {
                float parsed = 0.f;
                if (! takeValue()) return;
                if (! ParseFloat(value, parsed)) {
                    fail(fmt::format("Invalid number '{}' for {}", value, arg));
                    return;
                }
                dst = parsed;
            };
            auto takeInt = [&](auto & dst) {
                long parsed = 0;
                if (! takeValue()) return;
                if (! ParseInt(value, parsed) || parsed < 0) {
                    fail(fmt::format("Invalid integer '{}' for {}", value, arg));
                    return;
                }
                dst = static_cast<typename std::decay_t<decltype(dst)>::value_type>(parsed);
            };

            if (arg == "--help" || arg == "-h") {
                result.ShowHelp = true;
            } else if (arg == "--config") {
                if (takeValue()) result.ConfigPath = value;
            } else if (arg == "--output") {
                if (takeValue()) result.OutputPath = value;
            } else if (arg == "--r0") {
                takeFloat(result.InitialRadius);
            } else if (arg == "--pitch") {
                takeFloat(result.Pitch);
            } else if (arg == "--amp") {
                takeFloat(result.AmpScale);
            } else if (arg == "--fps") {
                takeInt(result.FrameRate);
            } else if (arg == "--crf") {
                takeInt(result.Quality);
            } else if (arg == "--size") {
                takeInt(result.CanvasSize);
            } else if (arg == "--log-level") {
                if (takeValue()) result.LogLevel = value;
            } else if (arg == "--preview-only") {
                result.PreviewOnly = true;
            } else if (arg == "--no-preview") {
                result.SavePreview = false;
            } else if (arg == "--save-config") {
                result.SaveConfig = true;
            } else if (arg.starts_with("-")) {
                fail(fmt::format("Unknown option {}", arg));
            } else if (result.AudioPath.empty()) {
                result.AudioPath = std::string(arg);
            } else {
                fail(fmt::format("Unexpected argument {}", arg));
            }
        }

        if (result.AudioPath.empty() && ! result.ShowHelp) {
            fail("No audio file given");
        }
        if (result.ConfigPath.empty()) {
            result.ConfigPath = DefaultConfigPath();
        }
        return result;
    }

    void ApplyOverrides(CommandLine const & commandLine, Settings & settings) {
        if (commandLine.InitialRadius) settings.Spiral.InitialRadius = *commandLine.InitialRadius;
        if (commandLine.Pitch) settings.Spiral.Pitch = *commandLine.Pitch;
        if (commandLine.AmpScale) settings.Spiral.AmpScale = *commandLine.AmpScale;
        if (commandLine.FrameRate) settings.Video.FrameRate = *commandLine.FrameRate;
        if (commandLine.Quality) settings.Video.Quality = *commandLine.Quality;
        if (commandLine.CanvasSize) settings.Canvas.Size = *commandLine.CanvasSize;
        if (commandLine.LogLevel) settings.Log.Level = *commandLine.LogLevel;
        Sanitize(settings);
    }

    int RunApp(int argc, char * argv[]) {
        auto const commandLine = ParseCommandLine(argc, argv);
        if (commandLine.ShowHelp) {
            std::cout << Usage(argc > 0 ? argv[0] : nullptr);
            return 0;
        }
        if (! commandLine.Error.empty()) {
            std::cerr << commandLine.Error << "\n\n" << Usage(argc > 0 ? argv[0] : nullptr);
            return 2;
        }

        // Console only until the config names the log file.
        auto logger   = MakeLogger("vinylgroove", LogSettings { .File = "" });
        auto settings = LoadSettings(commandLine.ConfigPath, *logger);
        ApplyOverrides(commandLine, settings);
        logger = MakeLogger("vinylgroove", settings.Log);

        if (commandLine.SaveConfig) {
            SaveSettings(settings, commandLine.ConfigPath, *logger);
        }

        FfmpegTranscoder transcoder(settings.Media.FfmpegPath, logger);
        RenderSession    session(settings, transcoder, logger);

        try {
            session.Load(commandLine.AudioPath);
        } catch (DecodeError const & ex) {
            logger->error("Failed to process audio: {}", ex.what());
            return 1;
        }

        try {
            session.BuildAndRender(settings.Spiral);
        } catch (RenderError const & ex) {
            logger->error("Render error: {}", ex.what());
            return 1;
        }

        if (commandLine.SavePreview || commandLine.PreviewOnly) {
            try {
                session.SavePreview();
            } catch (ExportError const & ex) {
                logger->error("Failed to save image: {}", ex.what());
                if (commandLine.PreviewOnly) return 1;
            }
        }
        if (commandLine.PreviewOnly) {
            return 0;
        }

        g_interruptRequested.store(false);
        auto const previousHandler = std::signal(SIGINT, &OnInterrupt);

        auto const outputPath = commandLine.OutputPath.empty() ? session.DefaultVideoPath() : commandLine.OutputPath;
        auto       job        = session.StartEncode({}, outputPath);
        std::size_t lastPercent = 0;
        while (! job->WaitFor(kPollInterval)) {
            if (g_interruptRequested.load() && ! job->CancelRequested()) {
                logger->info("Interrupt received, stopping video generation");
                job->Cancel();
            }
            auto const total = job->TotalFrames();
            if (total > 0) {
                auto const percent = job->FramesSent() * 100 / total;
                if (percent != lastPercent) {
                    lastPercent = percent;
                    logger->info("Progress {}% ({}/{} frames)", percent, job->FramesSent(), total);
                }
            }
        }
        if (previousHandler != SIG_ERR) {
            std::signal(SIGINT, previousHandler);
        }

        try {
            auto const outcome = job->Wait();
            if (outcome == EncodeOutcome::Cancelled) {
                logger->warn("Video generation was stopped by user");
                return 130;
            }
            logger->info("Video saved as {}", outputPath.string());
        } catch (Error const & ex) {
            logger->error("Video generation error: {}", ex.what());
            return 1;
        }
        return 0;
    }
} // namespace VGR::Apps::VinylGroove
