#include "ImageFileEncoder.hpp"
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <png.h>
#include <jpeglib.h>

namespace codec {

    namespace {
        // libjpeg reports fatal errors through error_exit, which must not return
        struct JpegErrorManager {
            jpeg_error_mgr pub;
            jmp_buf setjmp_buffer;
            char message[JMSG_LENGTH_MAX];
        };

        void jpeg_error_exit(j_common_ptr cinfo) {
            auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
            (*cinfo->err->format_message)(cinfo, err->message);
            longjmp(err->setjmp_buffer, 1);
        }

        struct FileCloser {
            FILE* fp;
            ~FileCloser() { if (fp) fclose(fp); }
        };
    }

    common::EmptyResult ImageFileEncoder::persist(
        const common::Frame& frame,
        const std::string& path,
        const common::EncodeParams& params
    ) {
        const auto& r = frame.region;
        if (r.width == 0 || r.height == 0 ||
            frame.pixels.size() < static_cast<size_t>(frame.stride()) * r.height) {
            return common::EmptyResult::err(common::ErrorCode::EncoderError,
                "Frame buffer does not match its region: " + path);
        }
        if (params.format == common::ImageFormat::Jpeg) {
            return write_jpeg(frame.pixels.data(), r.width, r.height, path, params.jpeg_quality);
        }
        return write_png(frame.pixels.data(), r.width, r.height, path, params.png_compression);
    }

    common::EmptyResult ImageFileEncoder::write_png(const uint8_t* rgb, uint32_t width, uint32_t height,
                                                    const std::string& path, int compression) {
        FILE* fp = fopen(path.c_str(), "wb");
        if (!fp) {
            return common::EmptyResult::err(common::ErrorCode::StorageError,
                "Cannot open " + path + ": " + strerror(errno));
        }
        FileCloser closer{fp};

        png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!png) {
            return common::EmptyResult::err(common::ErrorCode::EncoderError, "png_create_write_struct failed");
        }
        png_infop info = png_create_info_struct(png);
        if (!info) {
            png_destroy_write_struct(&png, nullptr);
            return common::EmptyResult::err(common::ErrorCode::EncoderError, "png_create_info_struct failed");
        }

        if (setjmp(png_jmpbuf(png))) {
            png_destroy_write_struct(&png, &info);
            return common::EmptyResult::err(common::ErrorCode::EncoderError, "libpng failed writing " + path);
        }

        png_init_io(png, fp);
        png_set_compression_level(png, compression);
        png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        png_write_info(png, info);

        const size_t stride = static_cast<size_t>(width) * 3;
        for (uint32_t y = 0; y < height; ++y) {
            png_write_row(png, const_cast<png_bytep>(rgb + y * stride));
        }
        png_write_end(png, nullptr);
        png_destroy_write_struct(&png, &info);

        if (fflush(fp) != 0) {
            return common::EmptyResult::err(common::ErrorCode::StorageError,
                "Write failed: " + path + ": " + strerror(errno));
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult ImageFileEncoder::write_jpeg(const uint8_t* rgb, uint32_t width, uint32_t height,
                                                     const std::string& path, int quality) {
        FILE* fp = fopen(path.c_str(), "wb");
        if (!fp) {
            return common::EmptyResult::err(common::ErrorCode::StorageError,
                "Cannot open " + path + ": " + strerror(errno));
        }
        FileCloser closer{fp};

        jpeg_compress_struct cinfo;
        JpegErrorManager jerr;
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit;
        jerr.message[0] = 0;
        jpeg_create_compress(&cinfo);

        if (setjmp(jerr.setjmp_buffer)) {
            jpeg_destroy_compress(&cinfo);
            return common::EmptyResult::err(common::ErrorCode::EncoderError,
                "libjpeg failed writing " + path + ": " + jerr.message);
        }

        jpeg_stdio_dest(&cinfo, fp);

        cinfo.image_width = width;
        cinfo.image_height = height;
        cinfo.input_components = 3;
        cinfo.in_color_space = JCS_RGB;

        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, quality, TRUE);

        jpeg_start_compress(&cinfo, TRUE);

        const size_t row_stride = static_cast<size_t>(width) * 3;
        while (cinfo.next_scanline < cinfo.image_height) {
            JSAMPROW row_pointer = const_cast<JSAMPROW>(&rgb[cinfo.next_scanline * row_stride]);
            jpeg_write_scanlines(&cinfo, &row_pointer, 1);
        }

        jpeg_finish_compress(&cinfo);
        jpeg_destroy_compress(&cinfo);

        if (fflush(fp) != 0) {
            return common::EmptyResult::err(common::ErrorCode::StorageError,
                "Write failed: " + path + ": " + strerror(errno));
        }
        return common::EmptyResult::success();
    }

} // namespace codec
