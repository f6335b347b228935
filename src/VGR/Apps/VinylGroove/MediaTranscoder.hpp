#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace VGR::Apps::VinylGroove {
    struct VideoEncodeRequest {
        std::filesystem::path AudioPath;
        std::filesystem::path OutputPath;
        std::size_t           Width       = 0;
        std::size_t           Height      = 0;
        int                   FrameRate   = 10;
        int                   Quality     = 23;
        std::string           Preset      = "ultrafast";
        std::string           VideoCodec  = "libx264";
        std::string           AudioCodec  = "aac";
        std::string           PixelFormat = "yuv420p";
    };

    // A running encode that accepts raw rgb24 frames until finished or aborted.
    class VideoEncodeSession {
    public:
        virtual ~VideoEncodeSession() = default;

        // Blocks while the encoder is behind. @throw EncodeError on a broken stream.
        virtual void WriteFrame(std::span<std::uint8_t const> bytes) = 0;

        // Closes the frame stream and waits. @throw EncodeError on non-zero exit.
        virtual void Finish() = 0;

        // Stops the encoder without finishing the output; never throws.
        virtual void Abort() noexcept = 0;
    };

    class MediaTranscoder {
    public:
        virtual ~MediaTranscoder() = default;

        // Mono, signed 16-bit PCM WAV of the first audio stream; overwrites destination.
        // @throw DecodeError
        virtual void DecodeToPcm(std::filesystem::path const & source, std::filesystem::path const & destination) = 0;

        // @throw EncodeError when the encoder cannot be started.
        virtual std::unique_ptr<VideoEncodeSession> OpenVideoEncoder(VideoEncodeRequest const & request) = 0;
    };
} // namespace VGR::Apps::VinylGroove
