#pragma once
#include <cstdint>

namespace platform {
namespace linux_os {

    // Names for evdev codes; nullptr when the code has no name

    // Keyboard keys: "a", "ctrl_l", "shift_r", "delete", "page_up", "f5", ...
    const char* key_name(uint16_t code);

    // Pointer buttons: "left", "right", "middle", "side", "extra"
    const char* mouse_button_name(uint16_t code);

    // Controller buttons: "BTN_SOUTH", "BTN_TL", "BTN_DPAD_UP", ...
    const char* gamepad_button_name(uint16_t code);

    // Controller axes: "ABS_X", "ABS_RZ", "ABS_HAT0X", ...
    const char* axis_name(uint16_t code);

} // namespace linux_os
} // namespace platform
