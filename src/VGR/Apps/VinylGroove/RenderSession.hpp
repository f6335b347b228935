#pragma once

#include <filesystem>
#include <memory>

#include <spdlog/logger.h>

#include "Apps/VinylGroove/EncodeJob.hpp"
#include "Apps/VinylGroove/FrameRasterizer.hpp"
#include "Apps/VinylGroove/MediaTranscoder.hpp"
#include "Apps/VinylGroove/SampleBuffer.hpp"
#include "Apps/VinylGroove/Settings.hpp"
#include "Apps/VinylGroove/SpiralGeometry.hpp"

namespace VGR::Apps::VinylGroove {
    // The loaded audio, its spiral, the preview frame and at most one encode job.
    class RenderSession {
    public:
        RenderSession(Settings settings, MediaTranscoder & transcoder, std::shared_ptr<spdlog::logger> logger = nullptr);
        ~RenderSession();

        RenderSession(RenderSession const &)             = delete;
        RenderSession & operator=(RenderSession const &) = delete;

        Settings const & GetSettings() const;
        // @throw std::logic_error while an encode is running.
        void SetSettings(Settings settings);

        // Replaces the sample buffer wholesale and drops the spiral and preview.
        // @throw DecodeError; the previous audio stays loaded on failure.
        SampleBuffer const & Load(std::filesystem::path const & audioPath);

        // Rebuilds the spiral and the progress-0 preview.
        // @throw RenderError; the previous spiral and preview stay in place on failure.
        Frame const & BuildAndRender(SpiralParameters const & params);

        bool HasAudio() const;
        bool HasPreview() const;

        SampleBuffer const &          Samples() const;
        PointSequence const &         Points() const;
        Frame const &                 Preview() const;
        std::filesystem::path const & AudioPath() const;
        double                        DurationSeconds() const;

        // <audio stem><suffix>.png / .mp4 in the working directory.
        std::filesystem::path DefaultImagePath() const;
        std::filesystem::path DefaultVideoPath() const;

        // @throw ExportError, std::logic_error without a preview.
        std::filesystem::path SavePreview(std::filesystem::path path = {}) const;

        /**
         * Launches the encode on a background worker and returns its handle.
         * @throw std::logic_error when no spiral exists or a job is still running.
         */
        std::shared_ptr<EncodeJob> StartEncode(ProgressCallback onProgress = {}, std::filesystem::path outputPath = {});
        std::shared_ptr<EncodeJob> ActiveJob() const;
        bool                       Encoding() const;

    private:
        std::filesystem::path OutputPath(char const * extension) const;

        Settings                             _settings;
        MediaTranscoder &                    _transcoder;
        std::shared_ptr<spdlog::logger>      _logger;
        std::filesystem::path                _audioPath;
        SampleBuffer                         _samples;
        std::shared_ptr<PointSequence const> _points;
        Frame                                _preview;
        std::shared_ptr<EncodeJob>           _job;
    };
} // namespace VGR::Apps::VinylGroove
