#include "Apps/VinylGroove/FfmpegTranscoder.hpp"

#include <system_error>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/Logging.hpp"
#include "Apps/VinylGroove/Subprocess.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr std::size_t kMaxStderrInMessage = 512;

        std::string TrimDiagnostics(std::string text) {
            while (! text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
                text.pop_back();
            }
            if (text.size() > kMaxStderrInMessage) {
                text = "..." + text.substr(text.size() - kMaxStderrInMessage);
            }
            return text;
        }

        class FfmpegEncodeSession : public VideoEncodeSession {
        public:
            FfmpegEncodeSession(std::unique_ptr<Subprocess> process, std::shared_ptr<spdlog::logger> logger):
                _process(std::move(process)),
                _logger(std::move(logger)) {
            }

            ~FfmpegEncodeSession() override {
                Abort();
            }

            void WriteFrame(std::span<std::uint8_t const> bytes) override {
                bool ok = false;
                try {
                    ok = _process->Write(bytes);
                } catch (std::system_error const & ex) {
                    throw EncodeError(fmt::format("Writing frame to ffmpeg failed: {}", ex.what()));
                }
                if (! ok) {
                    int code = 0;
                    try {
                        code = _process->Wait();
                    } catch (std::system_error const & ex) {
                        throw EncodeError(fmt::format("ffmpeg closed its frame input; waiting for it failed: {}", ex.what()));
                    }
                    throw EncodeError(fmt::format("ffmpeg closed its frame input (exit code {})", code));
                }
            }

            void Finish() override {
                _process->CloseInput();
                int code = 0;
                try {
                    code = _process->Wait();
                } catch (std::system_error const & ex) {
                    throw EncodeError(fmt::format("Waiting for ffmpeg failed: {}", ex.what()));
                }
                if (code != 0) {
                    throw EncodeError(fmt::format("ffmpeg exited with code {}", code));
                }
            }

            void Abort() noexcept override {
                if (_process->Running()) {
                    _logger->debug("Terminating ffmpeg (pid {})", _process->Pid());
                    _process->Terminate();
                }
            }

        private:
            std::unique_ptr<Subprocess>     _process;
            std::shared_ptr<spdlog::logger> _logger;
        };
    }

    FfmpegTranscoder::FfmpegTranscoder(std::string executable, std::shared_ptr<spdlog::logger> logger):
        _executable(std::move(executable)),
        _logger(LoggerOrDefault(std::move(logger))) {
    }

    std::vector<std::string> FfmpegTranscoder::DecodeCommand(std::filesystem::path const & source, std::filesystem::path const & destination) const {
        return {
            _executable,
            "-hide_banner", "-nostdin", "-loglevel", "error",
            "-y",
            "-i", source.string(),
            "-map", "0:a:0",
            "-ac", "1",
            "-acodec", "pcm_s16le",
            "-f", "wav",
            destination.string(),
        };
    }

    std::vector<std::string> FfmpegTranscoder::EncodeCommand(VideoEncodeRequest const & request) const {
        return {
            _executable,
            "-hide_banner", "-loglevel", "error",
            "-y",
            "-f", "rawvideo",
            "-pix_fmt", "rgb24",
            "-s", fmt::format("{}x{}", request.Width, request.Height),
            "-framerate", std::to_string(request.FrameRate),
            "-i", "pipe:0",
            "-i", request.AudioPath.string(),
            "-map", "0:v:0",
            "-map", "1:a:0",
            "-c:v", request.VideoCodec,
            "-crf", std::to_string(request.Quality),
            "-preset", request.Preset,
            "-pix_fmt", request.PixelFormat,
            "-c:a", request.AudioCodec,
            "-threads", "0",
            request.OutputPath.string(),
        };
    }

    void FfmpegTranscoder::DecodeToPcm(std::filesystem::path const & source, std::filesystem::path const & destination) {
        _logger->info("Converting audio: {}", source.string());
        std::unique_ptr<Subprocess> process;
        try {
            process = std::make_unique<Subprocess>(DecodeCommand(source, destination), Subprocess::Options { .CaptureStderr = true });
        } catch (std::system_error const & ex) {
            throw DecodeError(fmt::format("Unable to start {}: {}", _executable, ex.what()));
        }

        auto const diagnostics = TrimDiagnostics(process->ReadStderr());
        int code = 0;
        try {
            code = process->Wait();
        } catch (std::system_error const & ex) {
            throw DecodeError(fmt::format("Waiting for {} failed: {}", _executable, ex.what()));
        }
        if (code != 0) {
            throw DecodeError(diagnostics.empty()
                ? fmt::format("Audio conversion failed (exit code {})", code)
                : fmt::format("Audio conversion failed (exit code {}): {}", code, diagnostics));
        }
        _logger->info("Conversion finished: {}", destination.string());
    }

    std::unique_ptr<VideoEncodeSession> FfmpegTranscoder::OpenVideoEncoder(VideoEncodeRequest const & request) {
        auto command = EncodeCommand(request);
        _logger->debug("Starting encoder: {}", fmt::join(command, " "));
        try {
            auto process = std::make_unique<Subprocess>(std::move(command), Subprocess::Options { .PipeStdin = true });
            return std::make_unique<FfmpegEncodeSession>(std::move(process), _logger);
        } catch (std::system_error const & ex) {
            throw EncodeError(fmt::format("Unable to start {}: {}", _executable, ex.what()));
        }
    }
} // namespace VGR::Apps::VinylGroove
