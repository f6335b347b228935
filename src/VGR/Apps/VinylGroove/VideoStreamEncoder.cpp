#include "Apps/VinylGroove/VideoStreamEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/Logging.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr std::size_t kProgressSteps = 100;
    }

    char const * EncodeOutcomeName(EncodeOutcome outcome) {
        switch (outcome) {
        case EncodeOutcome::Cancelled:
            return "Cancelled";
        case EncodeOutcome::Completed:
        default:
            return "Completed";
        }
    }

    VideoStreamEncoder::VideoStreamEncoder(MediaTranscoder & transcoder, CanvasSettings canvas, VideoSettings video, std::shared_ptr<spdlog::logger> logger):
        _transcoder(transcoder),
        _rasterizer(std::move(canvas)),
        _video(std::move(video)),
        _logger(LoggerOrDefault(std::move(logger))) {
    }

    std::size_t VideoStreamEncoder::FrameCount(double durationSeconds, int frameRate) {
        if (! std::isfinite(durationSeconds) || durationSeconds <= 0.0 || frameRate <= 0) {
            return 0;
        }
        return static_cast<std::size_t>(std::floor(durationSeconds * double(frameRate)));
    }

    std::size_t VideoStreamEncoder::ProgressInterval(std::size_t frameCount) {
        return std::max<std::size_t>(1, frameCount / kProgressSteps);
    }

    EncodeOutcome VideoStreamEncoder::Encode(
        std::filesystem::path const & audioPath,
        std::span<glm::vec2 const>    points,
        double                        durationSeconds,
        std::filesystem::path const & outputPath,
        ProgressCallback const &      onProgress,
        CancellationToken const &     cancel) const {
        auto const frameCount = FrameCount(durationSeconds, _video.FrameRate);
        if (frameCount == 0) {
            throw EncodeError(fmt::format("Audio of {:.3f}s is too short for a {} fps video", durationSeconds, _video.FrameRate));
        }
        if (points.empty()) {
            throw EncodeError("No spiral points to animate");
        }

        auto const & canvas = _rasterizer.GetSettings();
        _logger->info("Starting video generation: {} ({} frames at {} fps, {}x{})",
            outputPath.string(), frameCount, _video.FrameRate, canvas.Size, canvas.Size);

        auto session = _transcoder.OpenVideoEncoder(VideoEncodeRequest {
            .AudioPath   = audioPath,
            .OutputPath  = outputPath,
            .Width       = canvas.Size,
            .Height      = canvas.Size,
            .FrameRate   = _video.FrameRate,
            .Quality     = _video.Quality,
            .Preset      = _video.Preset,
            .VideoCodec  = _video.VideoCodec,
            .AudioCodec  = _video.AudioCodec,
            .PixelFormat = _video.PixelFormat,
        });

        auto const  interval     = ProgressInterval(frameCount);
        std::size_t lastReported = 0;
        try {
            for (std::size_t i = 0; i < frameCount; ++i) {
                if (cancel.IsCancellationRequested()) {
                    _logger->info("Video generation stopped by user at frame {}/{}", i, frameCount);
                    session->Abort();
                    return EncodeOutcome::Cancelled;
                }

                double const progress = double(i) / double(frameCount);
                auto const   frame    = _rasterizer.Render(points, progress);
                session->WriteFrame(frame.Bytes());

                if (i % interval == 0) {
                    lastReported = i + 1;
                    if (onProgress) onProgress(lastReported, frameCount);
                    _logger->debug("Frame {}/{} sent", lastReported, frameCount);
                }
            }

            if (lastReported != frameCount && onProgress) {
                onProgress(frameCount, frameCount);
            }
            session->Finish();
        } catch (std::exception const & ex) {
            _logger->error("Video generation failed: {}", ex.what());
            session->Abort();
            throw;
        }

        _logger->info("Video created: {}", outputPath.string());
        return EncodeOutcome::Completed;
    }
} // namespace VGR::Apps::VinylGroove
