#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>

#include <glm/glm.hpp>
#include <spdlog/logger.h>

#include "Apps/VinylGroove/CancellationToken.hpp"
#include "Apps/VinylGroove/FrameRasterizer.hpp"
#include "Apps/VinylGroove/MediaTranscoder.hpp"
#include "Apps/VinylGroove/Settings.hpp"

namespace VGR::Apps::VinylGroove {
    enum class EncodeOutcome {
        Completed,
        Cancelled,
    };

    char const * EncodeOutcomeName(EncodeOutcome outcome);

    // (framesSent, frameCount)
    using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

    class VideoStreamEncoder {
    public:
        VideoStreamEncoder(MediaTranscoder & transcoder, CanvasSettings canvas, VideoSettings video, std::shared_ptr<spdlog::logger> logger = nullptr);

        static std::size_t FrameCount(double durationSeconds, int frameRate);
        static std::size_t ProgressInterval(std::size_t frameCount);

        /**
         * Streams one rasterized frame per video tick into the encoder, with the
         * audio file muxed in. Cancellation is checked before every frame; a
         * cancelled encode kills the encoder and leaves no usable output.
         * @throw EncodeError when the duration yields no frames, the encoder
         *        cannot start, the frame pipe breaks, or the encoder fails.
         */
        EncodeOutcome Encode(
            std::filesystem::path const &   audioPath,
            std::span<glm::vec2 const>      points,
            double                          durationSeconds,
            std::filesystem::path const &   outputPath,
            ProgressCallback const &        onProgress,
            CancellationToken const &       cancel) const;

    private:
        MediaTranscoder &               _transcoder;
        FrameRasterizer                 _rasterizer;
        VideoSettings                   _video;
        std::shared_ptr<spdlog::logger> _logger;
    };
} // namespace VGR::Apps::VinylGroove
