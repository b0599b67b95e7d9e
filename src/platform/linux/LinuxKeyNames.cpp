#include "LinuxKeyNames.hpp"
#include <linux/input.h>

namespace platform {
namespace linux_os {

    // Indexed by EV_KEY code. Printable keys give their unshifted US
    // character, the others the lower-case names used in hotkey strings.
    static const char *key_map[128] = {
        nullptr, "esc", "1", "2", "3", "4", "5", "6", "7", "8", "9", "0", "-", "=", "backspace", "tab",
        "q", "w", "e", "r", "t", "y", "u", "i", "o", "p", "[", "]", "enter", "ctrl_l", "a", "s",
        "d", "f", "g", "h", "j", "k", "l", ";", "'", "`", "shift", "\\", "z", "x", "c", "v",
        "b", "n", "m", ",", ".", "/", "shift_r", "*", "alt_l", "space", "caps_lock", "f1", "f2", "f3", "f4", "f5",
        "f6", "f7", "f8", "f9", "f10", "num_lock", "scroll_lock", "7", "8", "9", "-", "4", "5", "6", "+", "1",
        "2", "3", "0", ".", nullptr, nullptr, "\\", "f11", "f12", nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
        "enter", "ctrl_r", "/", "print_screen", "alt_r", nullptr, "home", "up", "page_up", "left", "right", "end", "down", "page_down", "insert", "delete",
        nullptr, "media_volume_mute", "media_volume_down", "media_volume_up", nullptr, "=", nullptr, "pause", nullptr, ",", nullptr, nullptr, nullptr, "cmd", "cmd_r", "menu"
    };

    const char* key_name(uint16_t code) {
        if (code < sizeof(key_map) / sizeof(key_map[0])) return key_map[code];
        switch (code) {
            case KEY_NEXTSONG: return "media_next";
            case KEY_PLAYPAUSE: return "media_play_pause";
            case KEY_PREVIOUSSONG: return "media_previous";
            case KEY_F13: return "f13";
            case KEY_F14: return "f14";
            case KEY_F15: return "f15";
            case KEY_F16: return "f16";
            case KEY_F17: return "f17";
            case KEY_F18: return "f18";
            case KEY_F19: return "f19";
            case KEY_F20: return "f20";
            default: return nullptr;
        }
    }

    const char* mouse_button_name(uint16_t code) {
        switch (code) {
            case BTN_LEFT: return "left";
            case BTN_RIGHT: return "right";
            case BTN_MIDDLE: return "middle";
            case BTN_SIDE: return "side";
            case BTN_EXTRA: return "extra";
            case BTN_FORWARD: return "forward";
            case BTN_BACK: return "back";
            default: return nullptr;
        }
    }

    const char* gamepad_button_name(uint16_t code) {
        switch (code) {
            case BTN_SOUTH: return "BTN_SOUTH";
            case BTN_EAST: return "BTN_EAST";
            case BTN_C: return "BTN_C";
            case BTN_NORTH: return "BTN_NORTH";
            case BTN_WEST: return "BTN_WEST";
            case BTN_Z: return "BTN_Z";
            case BTN_TL: return "BTN_TL";
            case BTN_TR: return "BTN_TR";
            case BTN_TL2: return "BTN_TL2";
            case BTN_TR2: return "BTN_TR2";
            case BTN_SELECT: return "BTN_SELECT";
            case BTN_START: return "BTN_START";
            case BTN_MODE: return "BTN_MODE";
            case BTN_THUMBL: return "BTN_THUMBL";
            case BTN_THUMBR: return "BTN_THUMBR";
            case BTN_TRIGGER: return "BTN_TRIGGER";
            case BTN_THUMB: return "BTN_THUMB";
            case BTN_THUMB2: return "BTN_THUMB2";
            case BTN_TOP: return "BTN_TOP";
            case BTN_TOP2: return "BTN_TOP2";
            case BTN_PINKIE: return "BTN_PINKIE";
            case BTN_BASE: return "BTN_BASE";
            case BTN_BASE2: return "BTN_BASE2";
            case BTN_BASE3: return "BTN_BASE3";
            case BTN_BASE4: return "BTN_BASE4";
            case BTN_BASE5: return "BTN_BASE5";
            case BTN_BASE6: return "BTN_BASE6";
            case BTN_DPAD_UP: return "BTN_DPAD_UP";
            case BTN_DPAD_DOWN: return "BTN_DPAD_DOWN";
            case BTN_DPAD_LEFT: return "BTN_DPAD_LEFT";
            case BTN_DPAD_RIGHT: return "BTN_DPAD_RIGHT";
            default: return nullptr;
        }
    }

    const char* axis_name(uint16_t code) {
        switch (code) {
            case ABS_X: return "ABS_X";
            case ABS_Y: return "ABS_Y";
            case ABS_Z: return "ABS_Z";
            case ABS_RX: return "ABS_RX";
            case ABS_RY: return "ABS_RY";
            case ABS_RZ: return "ABS_RZ";
            case ABS_THROTTLE: return "ABS_THROTTLE";
            case ABS_RUDDER: return "ABS_RUDDER";
            case ABS_WHEEL: return "ABS_WHEEL";
            case ABS_GAS: return "ABS_GAS";
            case ABS_BRAKE: return "ABS_BRAKE";
            case ABS_HAT0X: return "ABS_HAT0X";
            case ABS_HAT0Y: return "ABS_HAT0Y";
            case ABS_HAT1X: return "ABS_HAT1X";
            case ABS_HAT1Y: return "ABS_HAT1Y";
            case ABS_HAT2X: return "ABS_HAT2X";
            case ABS_HAT2Y: return "ABS_HAT2Y";
            case ABS_HAT3X: return "ABS_HAT3X";
            case ABS_HAT3Y: return "ABS_HAT3Y";
            default: return nullptr;
        }
    }

} // namespace linux_os
} // namespace platform
