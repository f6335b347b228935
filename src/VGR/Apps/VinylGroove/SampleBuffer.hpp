#pragma once

#include <cstdint>
#include <vector>

namespace VGR::Apps::VinylGroove {
    // Mono 16-bit PCM at the source's native rate.
    struct SampleBuffer {
        std::uint32_t             SampleRate = 0;
        std::vector<std::int16_t> Samples;

        bool Empty() const { return Samples.empty(); }

        double DurationSeconds() const {
            return SampleRate == 0 ? 0.0 : double(Samples.size()) / double(SampleRate);
        }
    };
} // namespace VGR::Apps::VinylGroove
