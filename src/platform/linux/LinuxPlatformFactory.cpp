#ifdef PLATFORM_LINUX

#include "LinuxPlatformFactory.hpp"
#include "LinuxX11Capture.hpp"
#include "LinuxEvdevDevice.hpp"
#include "codec/ImageFileEncoder.hpp"
#include <iostream>
#include <cstdlib>

namespace platform {
namespace linux_platform {

// ============================================================================
// Factory Method Implementations
// ============================================================================

std::shared_ptr<interfaces::IScreenCapture> LinuxPlatformFactory::create_screen_capture() {
    // XWayland serves the root window as well; native Wayland capture is not supported
    return std::make_shared<linux_os::LinuxX11Capture>();
}

std::shared_ptr<interfaces::IFrameEncoder> LinuxPlatformFactory::create_frame_encoder() {
    return std::make_shared<codec::ImageFileEncoder>();
}

std::unique_ptr<interfaces::IInputDevice> LinuxPlatformFactory::create_keyboard_device() {
    return std::make_unique<linux_os::LinuxEvdevDevice>(linux_os::DeviceClass::Keyboard, screen_);
}

std::unique_ptr<interfaces::IInputDevice> LinuxPlatformFactory::create_pointer_device() {
    return std::make_unique<linux_os::LinuxEvdevDevice>(linux_os::DeviceClass::Pointer, screen_);
}

std::unique_ptr<interfaces::IInputDevice> LinuxPlatformFactory::create_gamepad_device() {
    return std::make_unique<linux_os::LinuxEvdevDevice>(linux_os::DeviceClass::Gamepad, screen_);
}

// ============================================================================
// Lifecycle
// ============================================================================

void LinuxPlatformFactory::initialize() {
    if (initialized_) return;

    std::cout << "[LinuxPlatform] Initializing..." << std::endl;

    // Detect display server
    const char* wayland_display = std::getenv("WAYLAND_DISPLAY");
    const char* xdg_session = std::getenv("XDG_SESSION_TYPE");

    is_wayland_ = (wayland_display != nullptr) ||
                  (xdg_session && std::string(xdg_session) == "wayland");

    if (is_wayland_) {
        std::cout << "[LinuxPlatform] Wayland detected, capturing through XWayland" << std::endl;
    } else {
        std::cout << "[LinuxPlatform] X11 detected" << std::endl;
    }

    // Screen bounds for the pointer position; keep the default without a display
    linux_os::LinuxX11Capture probe_capture;
    auto region = probe_capture.primary_region();
    if (region.is_ok()) {
        screen_ = region.unwrap();
    } else {
        std::cout << "[LinuxPlatform] No display (" << region.error().message
                  << "), pointer bounds default to " << screen_.width << "x" << screen_.height << std::endl;
    }

    initialized_ = true;
    std::cout << "[LinuxPlatform] Ready" << std::endl;
}

void LinuxPlatformFactory::shutdown() {
    if (!initialized_) return;

    std::cout << "[LinuxPlatform] Shutting down..." << std::endl;
    initialized_ = false;
}

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
