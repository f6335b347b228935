#include "Apps/VinylGroove/Logging.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace VGR::Apps::VinylGroove {
    namespace {
        std::filesystem::path ResolveLogPath(std::string const & file) {
            auto path = std::filesystem::path(file);
            if (auto parent = path.parent_path(); ! parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    return path.filename();
                }
            }
            return path;
        }
    }

    std::shared_ptr<spdlog::logger> MakeLogger(std::string const & name, LogSettings const & settings) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        std::filesystem::path logPath;
        if (! settings.File.empty()) {
            logPath = ResolveLogPath(settings.File);
            try {
                sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true));
            } catch (spdlog::spdlog_ex const & ex) {
                spdlog::warn("Log file {} unavailable: {}", logPath.string(), ex.what());
                logPath.clear();
            }
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::info);
        if (! ApplyLogLevel(*logger, settings.Level)) {
            logger->set_level(spdlog::level::info);
            logger->warn("Unknown log level '{}', using info", settings.Level);
        }
        if (! logPath.empty()) {
            logger->debug("{} logging to {}", name, logPath.string());
        }
        return logger;
    }

    bool ApplyLogLevel(spdlog::logger & logger, std::string const & level) {
        auto const parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to off; only accept off when asked for.
        if (parsed == spdlog::level::off && level != "off") {
            return false;
        }
        logger.set_level(parsed);
        return true;
    }

    std::shared_ptr<spdlog::logger> LoggerOrDefault(std::shared_ptr<spdlog::logger> logger) {
        return logger ? std::move(logger) : spdlog::default_logger();
    }
} // namespace VGR::Apps::VinylGroove
