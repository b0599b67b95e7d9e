#pragma once
#include "interfaces/IFrameEncoder.hpp"
#include <cstdint>
#include <string>

namespace codec {

    // Writes RGB24 frames as PNG (libpng) or JPEG (libjpeg) files.
    // Stateless: safe to share between all sink threads.
    class ImageFileEncoder : public interfaces::IFrameEncoder {
    public:
        common::EmptyResult persist(
            const common::Frame& frame,
            const std::string& path,
            const common::EncodeParams& params
        ) override;

        static common::EmptyResult write_png(const uint8_t* rgb, uint32_t width, uint32_t height,
                                             const std::string& path, int compression);

        static common::EmptyResult write_jpeg(const uint8_t* rgb, uint32_t width, uint32_t height,
                                              const std::string& path, int quality);
    };

} // namespace codec
