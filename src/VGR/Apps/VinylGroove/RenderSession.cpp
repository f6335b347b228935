#include "Apps/VinylGroove/RenderSession.hpp"

#include <stdexcept>
#include <utility>

#include "Apps/VinylGroove/AudioNormalizer.hpp"
#include "Apps/VinylGroove/Logging.hpp"
#include "Apps/VinylGroove/VideoStreamEncoder.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        PointSequence const & EmptyPoints() {
            static PointSequence const empty;
            return empty;
        }
    }

    RenderSession::RenderSession(Settings settings, MediaTranscoder & transcoder, std::shared_ptr<spdlog::logger> logger):
        _settings(std::move(settings)),
        _transcoder(transcoder),
        _logger(LoggerOrDefault(std::move(logger))) {
        Sanitize(_settings);
    }

    RenderSession::~RenderSession() {
        if (_job) {
            _job->Cancel();
            try {
                _job->Wait();
            } catch (std::exception const & ex) {
                _logger->warn("Encode job ended with error during shutdown: {}", ex.what());
            }
        }
    }

    Settings const & RenderSession::GetSettings() const {
        return _settings;
    }

    void RenderSession::SetSettings(Settings settings) {
        if (Encoding()) {
            throw std::logic_error("Settings cannot change while a video is being generated");
        }
        Sanitize(settings);
        _settings = std::move(settings);
    }

    SampleBuffer const & RenderSession::Load(std::filesystem::path const & audioPath) {
        AudioNormalizer normalizer(_transcoder, _logger);
        auto buffer = normalizer.Normalize(audioPath);

        _audioPath = audioPath;
        _samples   = std::move(buffer);
        _points.reset();
        _preview = Frame {};
        return _samples;
    }

    Frame const & RenderSession::BuildAndRender(SpiralParameters const & params) {
        if (! HasAudio()) {
            throw std::logic_error("Load an audio file before rendering");
        }
        SpiralGeometryBuilder const builder(_settings.Canvas.Size, _logger);
        auto points = std::make_shared<PointSequence const>(builder.Build(_samples.Samples, _samples.SampleRate, params));

        FrameRasterizer const rasterizer(_settings.Canvas);
        auto preview = rasterizer.Render(points->Points, 0.0);

        _settings.Spiral = params;
        _points          = std::move(points);
        _preview         = std::move(preview);
        return _preview;
    }

    bool RenderSession::HasAudio() const {
        return ! _samples.Empty();
    }

    bool RenderSession::HasPreview() const {
        return _points != nullptr && _preview.Size != 0;
    }

    SampleBuffer const & RenderSession::Samples() const {
        return _samples;
    }

    PointSequence const & RenderSession::Points() const {
        return _points ? *_points : EmptyPoints();
    }

    Frame const & RenderSession::Preview() const {
        return _preview;
    }

    std::filesystem::path const & RenderSession::AudioPath() const {
        return _audioPath;
    }

    double RenderSession::DurationSeconds() const {
        return _samples.DurationSeconds();
    }

    std::filesystem::path RenderSession::OutputPath(char const * extension) const {
        return std::filesystem::path(_audioPath.stem().string() + _settings.Output.Suffix + extension);
    }

    std::filesystem::path RenderSession::DefaultImagePath() const {
        return OutputPath(".png");
    }

    std::filesystem::path RenderSession::DefaultVideoPath() const {
        return OutputPath(".mp4");
    }

    std::filesystem::path RenderSession::SavePreview(std::filesystem::path path) const {
        if (! HasPreview()) {
            throw std::logic_error("Nothing rendered yet");
        }
        if (path.empty()) {
            path = DefaultImagePath();
        }
        WritePng(_preview, path);
        _logger->info("Image saved as {}", path.string());
        return path;
    }

    std::shared_ptr<EncodeJob> RenderSession::StartEncode(ProgressCallback onProgress, std::filesystem::path outputPath) {
        if (! HasPreview()) {
            throw std::logic_error("Render the spiral before generating a video");
        }
        if (Encoding()) {
            throw std::logic_error("A video is already being generated");
        }
        if (outputPath.empty()) {
            outputPath = DefaultVideoPath();
        }

        auto work = [&transcoder = _transcoder,
                     canvas      = _settings.Canvas,
                     video       = _settings.Video,
                     logger      = _logger,
                     audioPath   = _audioPath,
                     points      = _points,
                     duration    = DurationSeconds(),
                     outputPath](ProgressCallback const & progress, CancellationToken const & cancel) {
            VideoStreamEncoder const encoder(transcoder, canvas, video, logger);
            return encoder.Encode(audioPath, points->Points, duration, outputPath, progress, cancel);
        };

        _job = EncodeJob::Start(std::move(work), std::move(onProgress));
        return _job;
    }

    std::shared_ptr<EncodeJob> RenderSession::ActiveJob() const {
        return Encoding() ? _job : nullptr;
    }

    bool RenderSession::Encoding() const {
        return _job != nullptr && _job->IsRunning();
    }
} // namespace VGR::Apps::VinylGroove
