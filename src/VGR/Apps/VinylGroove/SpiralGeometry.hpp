#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <glm/glm.hpp>
#include <spdlog/logger.h>

namespace VGR::Apps::VinylGroove {
    struct SpiralParameters {
        float InitialRadius = 500.f; // r0, at least 100 and below the canvas edge limit
        float Pitch         = 5.f;   // b, recommended 1-10
        float AmpScale      = 40.f;  // recommended 10-100
    };

    // One entry per sample; Thetas increase strictly along the sequence.
    struct PointSequence {
        std::vector<glm::vec2> Points;
        std::vector<double>    Thetas;
        std::vector<double>    Radii;

        std::size_t Size() const { return Points.size(); }
        bool        Empty() const { return Points.empty(); }
    };

    class SpiralGeometryBuilder {
    public:
        static constexpr double kEpsilon     = 1e-9;
        static constexpr double kEdgeMargin  = 0.98;

        explicit SpiralGeometryBuilder(std::size_t canvasSize, std::shared_ptr<spdlog::logger> logger = nullptr);

        std::size_t CanvasSize() const;
        double      MaxRadius() const;

        /**
         * Maps the samples onto an Archimedean spiral whose undisplaced radius
         * grows from r0 to just inside the canvas edge; each sample pushes the
         * radius outwards or inwards by up to AmpScale.
         * @throw RenderError for empty input, non-positive pitch, r0 at or past the
         *        canvas edge, or non-finite results.
         */
        PointSequence Build(std::span<std::int16_t const> samples, std::uint32_t sampleRate, SpiralParameters const & params) const;

        // Divides by the peak absolute value (plus epsilon) so the peak maps to +-1.
        static std::vector<double> NormalizeSamples(std::span<std::int16_t const> samples);

    private:
        void ValidateParameters(SpiralParameters const & params) const;

        std::size_t                     _canvasSize;
        std::shared_ptr<spdlog::logger> _logger;
    };
} // namespace VGR::Apps::VinylGroove
