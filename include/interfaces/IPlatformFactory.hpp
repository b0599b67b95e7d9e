#pragma once
#include <memory>
#include <string>
#include "interfaces/IScreenCapture.hpp"
#include "interfaces/IFrameEncoder.hpp"
#include "interfaces/IInputDevice.hpp"

namespace interfaces {

// ============================================================================
// IPlatformFactory - Abstract Factory for platform-specific components
// ============================================================================
// Creates the raw capture, encoding and input-hook primitives the recorders
// are built on. Each platform provides its own implementation; the recorders
// only ever see the interfaces.
//
// Usage:
//   auto factory = std::make_unique<LinuxPlatformFactory>();
//   factory->initialize();
//   auto capture = factory->create_screen_capture();
//   auto keyboard = factory->create_keyboard_device();
// ============================================================================

class IPlatformFactory {
public:
    virtual ~IPlatformFactory() = default;

    // ========== Component Factory Methods ==========

    // Screen grabber for the frame producer
    virtual std::shared_ptr<IScreenCapture> create_screen_capture() = 0;

    // Image writer shared by all frame sinks
    virtual std::shared_ptr<IFrameEncoder> create_frame_encoder() = 0;

    // Input hooks. Every call returns a fresh, unopened device so that the
    // keyboard recorder and the hotkey watcher do not share a listener.
    virtual std::unique_ptr<IInputDevice> create_keyboard_device() = 0;
    virtual std::unique_ptr<IInputDevice> create_pointer_device() = 0;
    virtual std::unique_ptr<IInputDevice> create_gamepad_device() = 0;

    // ========== Platform Info ==========

    // Platform name for logging/debugging (e.g., "Linux-X11")
    virtual const char* platform_name() const noexcept = 0;

    // Check if this platform is currently the running platform
    virtual bool is_current_platform() const noexcept = 0;

    // ========== Optional: Lazy Initialization ==========

    // Initialize platform-specific resources (called once before first use)
    virtual void initialize() {}

    // Cleanup platform-specific resources
    virtual void shutdown() {}
};

// ============================================================================
// Helper: Platform Detection Macros
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define PLATFORM_IS_WINDOWS 1
    #define PLATFORM_IS_LINUX 0
    #define PLATFORM_IS_MACOS 0
#elif defined(__linux__)
    #define PLATFORM_IS_WINDOWS 0
    #define PLATFORM_IS_LINUX 1
    #define PLATFORM_IS_MACOS 0
#elif defined(__APPLE__)
    #define PLATFORM_IS_WINDOWS 0
    #define PLATFORM_IS_LINUX 0
    #define PLATFORM_IS_MACOS 1
#else
    #define PLATFORM_IS_WINDOWS 0
    #define PLATFORM_IS_LINUX 0
    #define PLATFORM_IS_MACOS 0
#endif

} // namespace interfaces
