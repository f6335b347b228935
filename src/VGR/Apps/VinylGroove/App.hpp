#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "Apps/VinylGroove/Settings.hpp"

namespace VGR::Apps::VinylGroove {
    struct CommandLine {
        std::filesystem::path      AudioPath;
        std::filesystem::path      ConfigPath;
        std::filesystem::path      OutputPath;
        std::optional<float>       InitialRadius;
        std::optional<float>       Pitch;
        std::optional<float>       AmpScale;
        std::optional<int>         FrameRate;
        std::optional<int>         Quality;
        std::optional<std::size_t> CanvasSize;
        std::optional<std::string> LogLevel;
        bool                       PreviewOnly = false;
        bool                       SavePreview = true;
        bool                       SaveConfig  = false;
        bool                       ShowHelp    = false;
        std::string                Error;
    };

    CommandLine ParseCommandLine(int argc, char * argv[]);
    void        ApplyOverrides(CommandLine const & commandLine, Settings & settings);
    std::string Usage(char const * program);

    int RunApp(int argc, char * argv[]);
} // namespace VGR::Apps::VinylGroove
