#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "Apps/VinylGroove/MediaTranscoder.hpp"

namespace VGR::Apps::VinylGroove {
    // MediaTranscoder backed by an ffmpeg executable found on PATH or given explicitly.
    class FfmpegTranscoder : public MediaTranscoder {
    public:
        explicit FfmpegTranscoder(std::string executable = "ffmpeg", std::shared_ptr<spdlog::logger> logger = nullptr);

        void DecodeToPcm(std::filesystem::path const & source, std::filesystem::path const & destination) override;
        std::unique_ptr<VideoEncodeSession> OpenVideoEncoder(VideoEncodeRequest const & request) override;

        std::vector<std::string> DecodeCommand(std::filesystem::path const & source, std::filesystem::path const & destination) const;
        std::vector<std::string> EncodeCommand(VideoEncodeRequest const & request) const;

    private:
        std::string                     _executable;
        std::shared_ptr<spdlog::logger> _logger;
    };
} // namespace VGR::Apps::VinylGroove
