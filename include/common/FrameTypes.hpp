#pragma once
#include <vector>
#include <memory>
#include <cstdint>
#include <string>
#include <variant>
#include <utility>

namespace common {

    // Screen rectangle in root-window coordinates
    struct Region {
        int32_t x = 0;
        int32_t y = 0;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    enum class PixelFormat {
        RGB24   // 3 bytes per pixel, row-major, stride = width * 3
    };

    // One captured screenshot. Never modified after construction.
    struct Frame {
        Frame(double ts, Region r, std::vector<uint8_t> px)
            : capture_timestamp(ts), region(r), pixels(std::move(px)) {}

        const double capture_timestamp;  // seconds since epoch (wall clock)
        const Region region;
        const std::vector<uint8_t> pixels;
        const PixelFormat format = PixelFormat::RGB24;

        uint32_t stride() const { return region.width * 3; }
    };

    // Exclusive, read-only ownership: producer -> exactly one sink
    using FramePtr = std::unique_ptr<const Frame>;

    // End-of-stream sentinel, enqueued once per sink channel
    struct TerminationMarker {};

    using FrameItem = std::variant<FramePtr, TerminationMarker>;

    enum class ImageFormat {
        Png,
        Jpeg
    };

    inline const char* file_extension(ImageFormat format) {
        return format == ImageFormat::Jpeg ? "jpg" : "png";
    }

    struct EncodeParams {
        ImageFormat format = ImageFormat::Png;
        int png_compression = 6;  // zlib level 0..9
        int jpeg_quality = 90;    // 1..100
    };

} // namespace common
