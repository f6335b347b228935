#pragma once

#include <filesystem>
#include <memory>

#include <spdlog/logger.h>

#include "Apps/VinylGroove/MediaTranscoder.hpp"
#include "Apps/VinylGroove/SampleBuffer.hpp"

namespace VGR::Apps::VinylGroove {
    class AudioNormalizer {
    public:
        explicit AudioNormalizer(MediaTranscoder & transcoder, std::shared_ptr<spdlog::logger> logger = nullptr);

        /**
         * Transcodes any supported input to a temporary mono 16-bit WAV, reads it
         * back and removes the temporary file before returning.
         * @throw DecodeError when the source is missing, conversion fails, or the
         *        decoded stream is unreadable or empty.
         */
        SampleBuffer Normalize(std::filesystem::path const & source) const;

        // Reads a PCM file at its native rate, keeping only the first channel.
        // @throw DecodeError
        static SampleBuffer ReadPcmFile(std::filesystem::path const & path);

    private:
        MediaTranscoder &               _transcoder;
        std::shared_ptr<spdlog::logger> _logger;
    };
} // namespace VGR::Apps::VinylGroove
