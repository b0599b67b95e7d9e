#include "LinuxX11Capture.hpp"
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <cstdlib>
#include <iostream>

namespace platform {
namespace linux_os {

    namespace {
        // Position of the lowest set bit and width of the mask, for XImage channels
        void mask_shift(unsigned long mask, int& shift, int& bits) {
            shift = 0;
            bits = 0;
            if (mask == 0) return;
            while (!(mask & 1UL)) { mask >>= 1; ++shift; }
            while (mask & 1UL) { mask >>= 1; ++bits; }
        }

        uint8_t scale_channel(unsigned long pixel, int shift, int bits) {
            if (bits == 0) return 0;
            unsigned long v = (pixel >> shift) & ((1UL << bits) - 1);
            if (bits >= 8) return static_cast<uint8_t>(v >> (bits - 8));
            return static_cast<uint8_t>((v * 255) / ((1UL << bits) - 1));
        }

        void convert_to_rgb24(XImage* img, uint32_t width, uint32_t height, std::vector<uint8_t>& out) {
            out.resize(static_cast<size_t>(width) * height * 3);

            // Fast path: 32bpp little-endian xRGB, the usual TrueColor layout
            if (img->bits_per_pixel == 32 && img->byte_order == LSBFirst &&
                img->red_mask == 0xff0000 && img->green_mask == 0x00ff00 && img->blue_mask == 0x0000ff) {
                for (uint32_t y = 0; y < height; ++y) {
                    const uint8_t* row = reinterpret_cast<const uint8_t*>(img->data) +
                                         static_cast<size_t>(y) * img->bytes_per_line;
                    uint8_t* dst = out.data() + static_cast<size_t>(y) * width * 3;
                    for (uint32_t x = 0; x < width; ++x) {
                        dst[x * 3 + 0] = row[x * 4 + 2];
                        dst[x * 3 + 1] = row[x * 4 + 1];
                        dst[x * 3 + 2] = row[x * 4 + 0];
                    }
                }
                return;
            }

            int rs, rb, gs, gb, bs, bb;
            mask_shift(img->red_mask, rs, rb);
            mask_shift(img->green_mask, gs, gb);
            mask_shift(img->blue_mask, bs, bb);
            size_t i = 0;
            for (uint32_t y = 0; y < height; ++y) {
                for (uint32_t x = 0; x < width; ++x) {
                    unsigned long p = XGetPixel(img, static_cast<int>(x), static_cast<int>(y));
                    out[i++] = scale_channel(p, rs, rb);
                    out[i++] = scale_channel(p, gs, gb);
                    out[i++] = scale_channel(p, bs, bb);
                }
            }
        }
    }

    LinuxX11Capture::LinuxX11Capture() {}

    LinuxX11Capture::~LinuxX11Capture() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    std::string x11_display_name() {
        const char* env = std::getenv("DISPLAY");
        return env ? env : ":0";
    }

    common::EmptyResult LinuxX11Capture::ensure_display() {
        if (display_) return common::EmptyResult::success();
        display_ = XOpenDisplay(x11_display_name().c_str());
        if (!display_) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound,
                "Cannot open X display " + x11_display_name());
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxX11Capture::probe() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (display_) return common::EmptyResult::success();

        // Short-lived connection: the capture thread opens its own later
        Display* d = XOpenDisplay(x11_display_name().c_str());
        if (!d) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound,
                "Cannot open X display " + x11_display_name());
        }
        const bool has_screen = ScreenCount(d) > 0;
        XCloseDisplay(d);
        if (!has_screen) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "X display has no screen");
        }
        return common::EmptyResult::success();
    }

    common::Result<common::Region> LinuxX11Capture::primary_region() {
        using R = common::Result<common::Region>;
        std::lock_guard<std::mutex> lock(mutex_);
        auto res = ensure_display();
        if (res.is_err()) return R::err(res.error());

        const int screen = DefaultScreen(display_);
        common::Region region;
        region.x = 0;
        region.y = 0;
        region.width = static_cast<uint32_t>(DisplayWidth(display_, screen));
        region.height = static_cast<uint32_t>(DisplayHeight(display_, screen));
        std::cout << "[X11Capture] Primary screen " << region.width << "x" << region.height << std::endl;
        return R::ok(region);
    }

    common::Result<std::vector<uint8_t>> LinuxX11Capture::capture(const common::Region& region) {
        using R = common::Result<std::vector<uint8_t>>;
        std::lock_guard<std::mutex> lock(mutex_);
        auto res = ensure_display();
        if (res.is_err()) return R::err(res.error());

        if (region.width == 0 || region.height == 0) {
            return R::err(common::ErrorCode::CaptureError, "Empty capture region");
        }

        XImage* img = XGetImage(display_, DefaultRootWindow(display_),
                                region.x, region.y, region.width, region.height,
                                AllPlanes, ZPixmap);
        if (!img) {
            return R::err(common::ErrorCode::CaptureError, "XGetImage failed");
        }

        std::vector<uint8_t> pixels;
        convert_to_rgb24(img, region.width, region.height, pixels);
        XDestroyImage(img);
        return R::ok(std::move(pixels));
    }

} // namespace linux_os
} // namespace platform
