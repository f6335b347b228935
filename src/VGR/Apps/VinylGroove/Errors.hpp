#pragma once

#include <stdexcept>
#include <string>

namespace VGR::Apps::VinylGroove {
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // External decoder failed or produced audio the PCM reader cannot use.
    class DecodeError : public Error {
    public:
        using Error::Error;
    };

    // Spiral geometry or rasterization produced an unusable result.
    class RenderError : public Error {
    public:
        using Error::Error;
    };

    // External encoder exited non-zero or the frame pipe broke.
    class EncodeError : public Error {
    public:
        using Error::Error;
    };

    class ExportError : public Error {
    public:
        using Error::Error;
    };
} // namespace VGR::Apps::VinylGroove
