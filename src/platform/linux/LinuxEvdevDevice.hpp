#pragma once
#include "interfaces/IInputDevice.hpp"
#include "common/FrameTypes.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace platform {
namespace linux_os {

    enum class DeviceClass {
        Keyboard,   // handlers "kbd" + "event"
        Pointer,    // handlers "mouse" + "event"
        Gamepad     // handlers "js" + "event"
    };

    // Locates the /dev/input/eventN node for 'cls' in /proc/bus/input/devices.
    // Empty string when there is none.
    std::string find_event_device(DeviceClass cls, const std::string& devices_file = "/proc/bus/input/devices");

    /**
     * @brief evdev listener for one input device.
     *
     * Reads /dev/input/eventN on its own thread, waiting with poll() so that a
     * stop request is seen within kPollIntervalMs. Pointer positions come
     * from the X server (LinuxX11Pointer) when a display is reachable.
     * Without one, relative motion is accumulated from the centre of
     * 'screen' and clamped to it.
     */
    class LinuxEvdevDevice : public interfaces::IInputDevice {
    public:
        static constexpr int kPollIntervalMs = 100;

        LinuxEvdevDevice(DeviceClass cls, common::Region screen);
        ~LinuxEvdevDevice() override;

        common::EmptyResult probe() override;
        common::EmptyResult start(std::function<void(const interfaces::InputEvent&)> on_event) override;
        void request_stop() override;
        bool wait_stopped(std::chrono::milliseconds timeout) override;
        bool is_active() const override { return running_.load(); }
        const char* name() const noexcept override;

        const std::string& device_path() const { return device_path_; }

    private:
        common::EmptyResult open_device();
        void run_loop(std::function<void(const interfaces::InputEvent&)> callback);

    private:
        DeviceClass cls_;
        common::Region screen_;
        std::string device_path_;
        int fd_ = -1;

        std::atomic<bool> running_{false};
        std::atomic<bool> stop_requested_{false};
        std::thread thread_;
        std::mutex done_mutex_;
        std::condition_variable done_cv_;
        bool done_ = true;
    };

} // namespace linux_os
} // namespace platform
