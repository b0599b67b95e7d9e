#include "LinuxEvdevDevice.hpp"
#include "LinuxKeyNames.hpp"
#include "LinuxX11Pointer.hpp"
#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <linux/input.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <cctype>
#include <memory>
#include <system_error>

namespace platform {
namespace linux_os {

    std::string find_event_device(DeviceClass cls, const std::string& devices_file) {
        FILE *fp = fopen(devices_file.c_str(), "r");
        if (!fp) return "";

        const char* wanted = cls == DeviceClass::Keyboard ? "kbd"
                           : cls == DeviceClass::Pointer ? "mouse" : "js";

        char line[512];
        char name[512] = "Unknown";
        char handlers[512] = "";
        std::string best_device;
        bool best_is_named = false;

        while (fgets(line, sizeof(line), fp)) {
            if (strncmp(line, "N: Name=", 8) == 0) {
                sscanf(line, "N: Name=\"%511[^\"]\"", name);
            }

            if (strncmp(line, "H: Handlers=", 12) == 0) {
                strncpy(handlers, line + 12, sizeof(handlers) - 1);
                handlers[sizeof(handlers) - 1] = 0;
                handlers[strcspn(handlers, "\n")] = 0;

                if (strstr(handlers, wanted) && strstr(handlers, "event")) {
                    char *p = strstr(handlers, "event");
                    int id;
                    if (p && sscanf(p, "event%d", &id) == 1) {
                        // The last match wins (often a USB plug-in), but a
                        // device that calls itself a keyboard beats one that
                        // merely has keys (power button, lid switch).
                        std::string lname = name;
                        std::transform(lname.begin(), lname.end(), lname.begin(),
                                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                        const bool named = cls != DeviceClass::Keyboard ||
                                           lname.find("keyboard") != std::string::npos;
                        if (named || !best_is_named) {
                            best_device = "/dev/input/event" + std::to_string(id);
                            best_is_named = named;
                        }
                    }
                }
            }

            if (line[0] == '\n') {
                strcpy(name, "Unknown");
            }
        }
        fclose(fp);
        return best_device;
    }

    LinuxEvdevDevice::LinuxEvdevDevice(DeviceClass cls, common::Region screen)
        : cls_(cls), screen_(screen) {
        if (screen_.width == 0 || screen_.height == 0) {
            screen_ = common::Region{0, 0, 1920, 1080};
        }
    }

    LinuxEvdevDevice::~LinuxEvdevDevice() {
        request_stop();
        if (thread_.joinable()) thread_.join();
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    const char* LinuxEvdevDevice::name() const noexcept {
        switch (cls_) {
            case DeviceClass::Keyboard: return "evdev-keyboard";
            case DeviceClass::Pointer: return "evdev-pointer";
            case DeviceClass::Gamepad: return "evdev-gamepad";
        }
        return "evdev";
    }

    common::EmptyResult LinuxEvdevDevice::open_device() {
        if (fd_ >= 0) return common::EmptyResult::success();

        device_path_ = find_event_device(cls_);
        if (device_path_.empty()) {
            const char* what = cls_ == DeviceClass::Keyboard ? "keyboard"
                             : cls_ == DeviceClass::Pointer ? "mouse" : "gamepad";
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound,
                std::string("No ") + what + " found");
        }

        fd_ = open(device_path_.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd_ < 0) {
            const int e = errno;
            return common::EmptyResult::err(
                e == EACCES || e == EPERM ? common::ErrorCode::PermissionDenied : common::ErrorCode::DeviceNotFound,
                "Cannot open " + device_path_ + ": " + strerror(e));
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxEvdevDevice::probe() {
        return open_device();
    }

    common::EmptyResult LinuxEvdevDevice::start(std::function<void(const interfaces::InputEvent&)> cb) {
        if (running_.load()) return common::EmptyResult::success();
        if (thread_.joinable()) {
            return common::EmptyResult::err(common::ErrorCode::Unknown, "Listener cannot be restarted");
        }

        auto res = open_device();
        if (res.is_err()) return res;

        std::cout << "[Evdev] Listening on " << device_path_ << " (" << name() << ")" << std::endl;
        stop_requested_.store(false);
        {
            std::lock_guard<std::mutex> lock(done_mutex_);
            done_ = false;
        }
        running_.store(true);
        try {
            thread_ = std::thread(&LinuxEvdevDevice::run_loop, this, std::move(cb));
        } catch (const std::system_error& e) {
            running_.store(false);
            std::lock_guard<std::mutex> lock(done_mutex_);
            done_ = true;
            return common::EmptyResult::err(common::ErrorCode::Unknown, e.what());
        }
        return common::EmptyResult::success();
    }

    void LinuxEvdevDevice::request_stop() {
        stop_requested_.store(true);
    }

    bool LinuxEvdevDevice::wait_stopped(std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(done_mutex_);
            if (!done_cv_.wait_for(lock, timeout, [this]() { return done_; })) {
                return false;
            }
        }
        if (thread_.joinable()) thread_.join();
        return true;
    }

    void LinuxEvdevDevice::run_loop(std::function<void(const interfaces::InputEvent&)> callback) {
        struct input_event ev;

        // Pointer state. With an X display the position is read from the
        // server; otherwise relative motion is accumulated from the centre.
        int32_t x = static_cast<int32_t>(screen_.x + screen_.width / 2);
        int32_t y = static_cast<int32_t>(screen_.y + screen_.height / 2);
        const int32_t max_x = screen_.x + static_cast<int32_t>(screen_.width) - 1;
        const int32_t max_y = screen_.y + static_cast<int32_t>(screen_.height) - 1;
        bool moved = false;

        std::unique_ptr<LinuxX11Pointer> pointer;
        if (cls_ == DeviceClass::Pointer) {
            pointer = std::make_unique<LinuxX11Pointer>();
            if (pointer->is_open()) {
                pointer->query(x, y);
            } else {
                std::cout << "[Evdev] No X display, pointer position estimated from relative motion" << std::endl;
                pointer.reset();
            }
        }
        auto locate = [&]() {
            if (pointer) pointer->query(x, y);
        };

        auto now_seconds = [&ev]() {
            return static_cast<double>(ev.time.tv_sec) + static_cast<double>(ev.time.tv_usec) / 1e6;
        };

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;

        while (!stop_requested_.load()) {
            pfd.revents = 0;
            int pr = poll(&pfd, 1, kPollIntervalMs);
            if (pr < 0) {
                if (errno == EINTR) continue;
                std::cerr << "[Evdev] poll failed: " << strerror(errno) << std::endl;
                break;
            }
            if (pr == 0) continue;
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                std::cerr << "[Evdev] " << device_path_ << " went away" << std::endl;
                break;
            }

            ssize_t n = read(fd_, &ev, sizeof(ev));
            if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
            if (n != static_cast<ssize_t>(sizeof(ev))) {
                std::cerr << "[Evdev] read failed on " << device_path_ << std::endl;
                break;
            }

            interfaces::InputEvent e;
            e.timestamp = now_seconds();

            if (cls_ == DeviceClass::Keyboard) {
                if (ev.type != EV_KEY) continue;
                const char* k = key_name(ev.code);
                if (!k) continue;
                e.type = ev.value == 0 ? interfaces::InputEventType::Released : interfaces::InputEventType::Pressed;
                e.key = k;
                callback(e);
            } else if (cls_ == DeviceClass::Pointer) {
                if (ev.type == EV_REL && (ev.code == REL_X || ev.code == REL_Y)) {
                    if (ev.code == REL_X) x = std::clamp(x + ev.value, screen_.x, max_x);
                    else y = std::clamp(y + ev.value, screen_.y, max_y);
                    moved = true;
                } else if (ev.type == EV_ABS && (ev.code == ABS_X || ev.code == ABS_Y)) {
                    // Touchpads and tablets: device units, only the X server knows the position
                    if (pointer) moved = true;
                } else if (ev.type == EV_REL && (ev.code == REL_WHEEL || ev.code == REL_HWHEEL)) {
                    locate();
                    e.type = interfaces::InputEventType::Scroll;
                    e.x = x;
                    e.y = y;
                    if (ev.code == REL_WHEEL) e.dy = ev.value;
                    else e.dx = ev.value;
                    callback(e);
                } else if (ev.type == EV_KEY) {
                    const char* b = mouse_button_name(ev.code);
                    if (!b) continue;
                    locate();
                    e.type = interfaces::InputEventType::Click;
                    e.x = x;
                    e.y = y;
                    e.button = b;
                    e.is_pressed = ev.value != 0;
                    callback(e);
                } else if (ev.type == EV_SYN && ev.code == SYN_REPORT && moved) {
                    locate();
                    e.type = interfaces::InputEventType::Move;
                    e.x = x;
                    e.y = y;
                    moved = false;
                    callback(e);
                }
            } else {
                if (ev.type == EV_KEY) {
                    const char* b = gamepad_button_name(ev.code);
                    if (!b || ev.value == 2) continue;
                    e.type = ev.value == 0 ? interfaces::InputEventType::Released : interfaces::InputEventType::Pressed;
                    e.key = b;
                    callback(e);
                } else if (ev.type == EV_ABS) {
                    const char* a = axis_name(ev.code);
                    if (!a) continue;
                    e.type = interfaces::InputEventType::Absolute;
                    e.axis = a;
                    e.value = ev.value;
                    callback(e);
                }
            }
        }

        running_.store(false);
        {
            std::lock_guard<std::mutex> lock(done_mutex_);
            done_ = true;
        }
        done_cv_.notify_all();
    }

} // namespace linux_os
} // namespace platform
