#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "Apps/VinylGroove/Settings.hpp"

namespace VGR::Apps::VinylGroove {
    // Console plus truncating file sink; an empty File gives a console-only
    // logger. The file falls back to the working directory when its parent
    // cannot be created.
    std::shared_ptr<spdlog::logger> MakeLogger(std::string const & name, LogSettings const & settings);

    // Applies a textual level ("trace" .. "off"); unknown names are ignored.
    bool ApplyLogLevel(spdlog::logger & logger, std::string const & level);

    std::shared_ptr<spdlog::logger> LoggerOrDefault(std::shared_ptr<spdlog::logger> logger);
} // namespace VGR::Apps::VinylGroove
