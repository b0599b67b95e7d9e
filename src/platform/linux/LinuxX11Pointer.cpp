#include "LinuxX11Pointer.hpp"
#include "LinuxX11Capture.hpp"
#include <X11/Xlib.h>

namespace platform {
namespace linux_os {

    LinuxX11Pointer::LinuxX11Pointer(const std::string& display_name) {
        const std::string name = display_name.empty() ? x11_display_name() : display_name;
        display_ = XOpenDisplay(name.c_str());
    }

    LinuxX11Pointer::~LinuxX11Pointer() {
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    bool LinuxX11Pointer::query(int32_t& x, int32_t& y) {
        if (!display_) return false;

        Window root_return, child_return;
        int root_x, root_y, win_x, win_y;
        unsigned int mask;
        if (!XQueryPointer(display_, DefaultRootWindow(display_), &root_return, &child_return,
                           &root_x, &root_y, &win_x, &win_y, &mask)) {
            return false;
        }
        x = root_x;
        y = root_y;
        return true;
    }

} // namespace linux_os
} // namespace platform
