#pragma once
#include <cstdint>
#include <string>

typedef struct _XDisplay Display;

namespace platform {
namespace linux_os {

    // Reads the pointer position from the X server (XQueryPointer on the
    // root window). Owns its own display connection and must stay on the
    // thread that created it.
    class LinuxX11Pointer {
    public:
        // Empty name: x11_display_name()
        explicit LinuxX11Pointer(const std::string& display_name = "");
        ~LinuxX11Pointer();

        LinuxX11Pointer(const LinuxX11Pointer&) = delete;
        LinuxX11Pointer& operator=(const LinuxX11Pointer&) = delete;

        bool is_open() const { return display_ != nullptr; }

        // Root-window coordinates. False, with x/y untouched, when there is
        // no display or the pointer is on another screen.
        bool query(int32_t& x, int32_t& y);

    private:
        Display* display_ = nullptr;
    };

} // namespace linux_os
} // namespace platform
