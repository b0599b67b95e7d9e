#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <cstdint>
#include "common/Result.hpp"

namespace interfaces {

    enum class InputEventType {
        Pressed,   // key or controller button down (auto-repeat included)
        Released,  // key or controller button up
        Move,      // pointer moved to x/y
        Click,     // pointer button, is_pressed tells down/up
        Scroll,    // wheel, dx/dy in notches
        Absolute   // controller axis value
    };

    inline const char* to_string(InputEventType type) {
        switch (type) {
            case InputEventType::Pressed: return "pressed";
            case InputEventType::Released: return "released";
            case InputEventType::Move: return "move";
            case InputEventType::Click: return "click";
            case InputEventType::Scroll: return "scroll";
            case InputEventType::Absolute: return "absolute";
        }
        return "unknown";
    }

    // Only the fields relevant to 'type' are meaningful.
    struct InputEvent {
        double timestamp = 0.0;     // seconds since epoch
        InputEventType type = InputEventType::Pressed;
        std::string key;            // Pressed/Released: "a", "ctrl_l", "BTN_SOUTH"
        int32_t x = 0;              // Move/Click/Scroll
        int32_t y = 0;
        std::string button;         // Click: "left", "right", "middle"
        bool is_pressed = false;    // Click
        int32_t dx = 0;             // Scroll
        int32_t dy = 0;
        std::string axis;           // Absolute: "ABS_X", "ABS_RZ", ...
        int32_t value = 0;          // Absolute
    };

    class IInputDevice {
    public:
        virtual ~IInputDevice() = default;

        // Availability Contract:
        // Locates and opens the device. Errors are DeviceNotFound /
        // PermissionDenied and mean the owning recorder is skipped.
        virtual common::EmptyResult probe() = 0;

        // Async Start Contract:
        // Returns immediately. Events are delivered to 'on_event' on a
        // background thread, in arrival order.
        virtual common::EmptyResult start(std::function<void(const InputEvent&)> on_event) = 0;

        // Stop Contract:
        // Non-blocking request; the listener thread notices it within its
        // poll interval.
        virtual void request_stop() = 0;

        // Bounded wait for the listener thread. Returns false if it is still
        // running after 'timeout'.
        virtual bool wait_stopped(std::chrono::milliseconds timeout) = 0;

        // False once the listener has exited (stop requested, unplugged, read error)
        virtual bool is_active() const = 0;

        virtual const char* name() const noexcept = 0;
    };

} // namespace interfaces
