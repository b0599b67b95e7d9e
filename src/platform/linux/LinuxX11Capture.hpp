#pragma once
#include "interfaces/IScreenCapture.hpp"
#include <mutex>
#include <string>

// Xlib types, kept out of the header so X11 macros do not leak into users
typedef struct _XDisplay Display;

namespace platform {
namespace linux_os {

    // $DISPLAY, or ":0" when it is not set
    std::string x11_display_name();

    // Screen grabber on Xlib XGetImage over the root window.
    // The display connection is opened lazily on the producer thread.
    // primary_region() is the whole root window: with several monitors that
    // is the full virtual desktop, since core Xlib has no per-monitor layout.
    class LinuxX11Capture : public interfaces::IScreenCapture {
    public:
        LinuxX11Capture();
        ~LinuxX11Capture() override;

        common::EmptyResult probe() override;
        common::Result<common::Region> primary_region() override;
        common::Result<std::vector<uint8_t>> capture(const common::Region& region) override;

    private:
        common::EmptyResult ensure_display();

        std::mutex mutex_;
        Display* display_ = nullptr;
    };

} // namespace linux_os
} // namespace platform
