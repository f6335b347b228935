#include "Apps/VinylGroove/SpiralGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "Apps/VinylGroove/Errors.hpp"
#include "Apps/VinylGroove/Logging.hpp"

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr float kRecommendedMinRadius = 100.f;
        constexpr float kRecommendedMinPitch  = 1.f;
        constexpr float kRecommendedMaxPitch  = 10.f;
        constexpr float kRecommendedMinAmp    = 10.f;
        constexpr float kRecommendedMaxAmp    = 100.f;

        bool OutsideRange(float value, float lo, float hi) {
            return value < lo || value > hi;
        }
    }

    SpiralGeometryBuilder::SpiralGeometryBuilder(std::size_t canvasSize, std::shared_ptr<spdlog::logger> logger):
        _canvasSize(canvasSize),
        _logger(LoggerOrDefault(std::move(logger))) {
    }

    std::size_t SpiralGeometryBuilder::CanvasSize() const {
        return _canvasSize;
    }

    double SpiralGeometryBuilder::MaxRadius() const {
        return double(_canvasSize) / 2.0 * kEdgeMargin;
    }

    std::vector<double> SpiralGeometryBuilder::NormalizeSamples(std::span<std::int16_t const> samples) {
        int peak = 0;
        for (auto const sample : samples) {
            peak = std::max(peak, std::abs(int(sample)));
        }
        double const scale = double(peak) + kEpsilon;

        std::vector<double> normalized(samples.size());
        for (std::size_t i = 0; i < samples.size(); ++i) {
            normalized[i] = double(samples[i]) / scale;
        }
        return normalized;
    }

    void SpiralGeometryBuilder::ValidateParameters(SpiralParameters const & params) const {
        if (! std::isfinite(params.InitialRadius) || ! std::isfinite(params.Pitch) || ! std::isfinite(params.AmpScale)) {
            throw RenderError("Spiral parameters must be finite numbers");
        }
        if (params.Pitch <= 0.f) {
            throw RenderError(fmt::format("Spiral pitch must be positive (got {})", params.Pitch));
        }
        if (double(params.InitialRadius) >= MaxRadius()) {
            throw RenderError(fmt::format("Initial radius {} leaves no room on a {} px canvas (limit {:.1f})",
                params.InitialRadius, _canvasSize, MaxRadius()));
        }

        // The upper end is the canvas edge limit, enforced above.
        if (params.InitialRadius < kRecommendedMinRadius) {
            _logger->warn("Initial radius {:.1f} below recommended minimum {} (edge limit {:.1f})",
                params.InitialRadius, kRecommendedMinRadius, MaxRadius());
        }
        if (OutsideRange(params.Pitch, kRecommendedMinPitch, kRecommendedMaxPitch)) {
            _logger->warn("Pitch {:.2f} outside recommended range {}-{}", params.Pitch, kRecommendedMinPitch, kRecommendedMaxPitch);
        }
        if (OutsideRange(params.AmpScale, kRecommendedMinAmp, kRecommendedMaxAmp)) {
            _logger->warn("Amplitude scale {:.1f} outside recommended range {}-{}", params.AmpScale, kRecommendedMinAmp, kRecommendedMaxAmp);
        }
    }

    PointSequence SpiralGeometryBuilder::Build(std::span<std::int16_t const> samples, std::uint32_t sampleRate, SpiralParameters const & params) const {
        if (samples.empty()) {
            throw RenderError("No samples to build a spiral from");
        }
        ValidateParameters(params);
        _logger->info("Building spiral: {} samples at {} Hz (r0 {:.1f}, b {:.2f}, amp {:.1f})",
            samples.size(), sampleRate, params.InitialRadius, params.Pitch, params.AmpScale);

        auto const normalized = NormalizeSamples(samples);
        auto const count      = normalized.size();
        double const r0       = params.InitialRadius;
        double const pitch    = params.Pitch;
        double const amp      = params.AmpScale;
        double const thetaMax = (MaxRadius() - r0) / (pitch + kEpsilon);
        double const step     = count > 1 ? thetaMax / double(count - 1) : 0.0;
        double const center   = double(_canvasSize / 2);

        PointSequence sequence;
        sequence.Points.resize(count);
        sequence.Thetas.resize(count);
        sequence.Radii.resize(count);
        for (std::size_t i = 0; i < count; ++i) {
            double const theta  = step * double(i);
            double const radius = r0 + pitch * theta + normalized[i] * amp;
            double const angle  = theta + std::numbers::pi / 2.0;
            double const x      = center + radius * std::cos(angle);
            double const y      = center + radius * std::sin(angle);
            if (! std::isfinite(x) || ! std::isfinite(y)) {
                throw RenderError(fmt::format("Spiral point {} is not finite", i));
            }
            sequence.Thetas[i] = theta;
            sequence.Radii[i]  = radius;
            sequence.Points[i] = glm::vec2(float(x), float(y));
        }

        _logger->info("Spiral built: {} points, sweep {:.2f} rad", count, thetaMax);
        return sequence;
    }
} // namespace VGR::Apps::VinylGroove
