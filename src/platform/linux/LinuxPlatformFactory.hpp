#pragma once
#include "interfaces/IPlatformFactory.hpp"
#include "common/FrameTypes.hpp"

#ifdef PLATFORM_LINUX

namespace platform {
namespace linux_platform {

// ============================================================================
// LinuxPlatformFactory - Factory for Linux platform components
// ============================================================================
// Screen capture through Xlib (X11 or XWayland), input through evdev nodes
// under /dev/input, image files through libpng / libjpeg.
// ============================================================================

class LinuxPlatformFactory final : public interfaces::IPlatformFactory {
public:
    LinuxPlatformFactory() = default;
    ~LinuxPlatformFactory() override = default;

    // ========== IPlatformFactory Implementation ==========

    std::shared_ptr<interfaces::IScreenCapture> create_screen_capture() override;
    std::shared_ptr<interfaces::IFrameEncoder> create_frame_encoder() override;
    std::unique_ptr<interfaces::IInputDevice> create_keyboard_device() override;
    std::unique_ptr<interfaces::IInputDevice> create_pointer_device() override;
    std::unique_ptr<interfaces::IInputDevice> create_gamepad_device() override;

    const char* platform_name() const noexcept override {
        return is_wayland_ ? "Linux-XWayland" : "Linux-X11";
    }

    bool is_current_platform() const noexcept override {
        return PLATFORM_IS_LINUX;
    }

    void initialize() override;
    void shutdown() override;

private:
    bool initialized_ = false;
    bool is_wayland_ = false;  // Detected at runtime
    common::Region screen_{0, 0, 1920, 1080};  // Pointer clamp bounds
};

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
