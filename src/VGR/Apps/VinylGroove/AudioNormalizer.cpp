#define MA_NO_DEVICE_IO
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include "Apps/VinylGroove/AudioNormalizer.hpp"

#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/Logging.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr ma_uint64 kReadChunkFrames = 16384;

        // Reserves a unique .wav path in the temp directory and removes it on scope exit.
        class TemporaryFile {
        public:
            TemporaryFile() {
                std::error_code ec;
                auto dir = std::filesystem::temp_directory_path(ec);
                if (ec) {
                    dir = "/tmp";
                }
                std::string pattern = (dir / "vinylgroove-XXXXXX.wav").string();
                int const fd = ::mkstemps(pattern.data(), 4);
                if (fd < 0) {
                    throw DecodeError(fmt::format("Unable to create temporary file in {}", dir.string()));
                }
                ::close(fd);
                _path = pattern;
            }

            ~TemporaryFile() {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }

            TemporaryFile(TemporaryFile const &)             = delete;
            TemporaryFile & operator=(TemporaryFile const &) = delete;

            std::filesystem::path const & Path() const { return _path; }

        private:
            std::filesystem::path _path;
        };

        struct DecoderGuard {
            ma_decoder * Decoder;
            ~DecoderGuard() { ma_decoder_uninit(Decoder); }
        };
    }

    AudioNormalizer::AudioNormalizer(MediaTranscoder & transcoder, std::shared_ptr<spdlog::logger> logger):
        _transcoder(transcoder),
        _logger(LoggerOrDefault(std::move(logger))) {
    }

    SampleBuffer AudioNormalizer::Normalize(std::filesystem::path const & source) const {
        std::error_code ec;
        if (! std::filesystem::is_regular_file(source, ec)) {
            throw DecodeError(fmt::format("Audio file not found: {}", source.string()));
        }

        SampleBuffer buffer;
        {
            TemporaryFile wav;
            _logger->debug("Decoding {} via {}", source.string(), wav.Path().string());
            _transcoder.DecodeToPcm(source, wav.Path());
            buffer = ReadPcmFile(wav.Path());
        }

        _logger->info("Audio loaded: {} ({} Hz, {} samples, {:.2f}s)",
            source.filename().string(), buffer.SampleRate, buffer.Samples.size(), buffer.DurationSeconds());
        return buffer;
    }

    SampleBuffer AudioNormalizer::ReadPcmFile(std::filesystem::path const & path) {
        ma_decoder_config config = ma_decoder_config_init(ma_format_s16, 0, 0);
        ma_decoder        decoder;
        ma_result const   res = ma_decoder_init_file(path.string().c_str(), &config, &decoder);
        if (res != MA_SUCCESS) {
            throw DecodeError(fmt::format("Unreadable PCM stream {} (code {})", path.string(), static_cast<int>(res)));
        }
        DecoderGuard const guard { &decoder };

        ma_uint32 const channels = decoder.outputChannels;
        if (channels == 0 || decoder.outputSampleRate == 0) {
            throw DecodeError(fmt::format("PCM stream {} has no channels", path.string()));
        }

        SampleBuffer buffer;
        buffer.SampleRate = decoder.outputSampleRate;

        ma_uint64 totalFrames = 0;
        if (ma_decoder_get_length_in_pcm_frames(&decoder, &totalFrames) == MA_SUCCESS) {
            buffer.Samples.reserve(static_cast<std::size_t>(totalFrames));
        }

        std::vector<ma_int16> chunk(static_cast<std::size_t>(kReadChunkFrames) * channels);
        while (true) {
            ma_uint64       framesRead = 0;
            ma_result const status     = ma_decoder_read_pcm_frames(&decoder, chunk.data(), kReadChunkFrames, &framesRead);
            for (ma_uint64 frame = 0; frame < framesRead; ++frame) {
                buffer.Samples.push_back(chunk[static_cast<std::size_t>(frame * channels)]);
            }
            if (status == MA_AT_END || framesRead == 0) {
                break;
            }
            if (status != MA_SUCCESS) {
                throw DecodeError(fmt::format("PCM read failed for {} (code {})", path.string(), static_cast<int>(status)));
            }
        }

        if (buffer.Samples.empty()) {
            throw DecodeError(fmt::format("Decoded audio {} contains no samples", path.string()));
        }
        return buffer;
    }
} // namespace VGR::Apps::VinylGroove
