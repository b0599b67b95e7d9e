#include "core/InputRecorders.hpp"
#include <filesystem>

namespace core {

    using interfaces::InputEventType;

    namespace {
        bool is_key_event(const interfaces::InputEvent& e) {
            return e.type == InputEventType::Pressed || e.type == InputEventType::Released;
        }

        bool is_pointer_event(const interfaces::InputEvent& e) {
            return e.type == InputEventType::Move || e.type == InputEventType::Click ||
                   e.type == InputEventType::Scroll;
        }

        bool is_gamepad_event(const interfaces::InputEvent& e) {
            return is_key_event(e) || e.type == InputEventType::Absolute;
        }
    }

    EventLogRecorder::EventLogRecorder(
        std::string name,
        std::unique_ptr<interfaces::IInputDevice> device,
        std::string log_file_name,
        EventFilter filter,
        EventSerializer serializer,
        std::chrono::milliseconds listener_join_timeout
    ) : Recorder(std::move(name)),
        device_(std::move(device)),
        log_file_name_(std::move(log_file_name)),
        filter_(filter),
        serializer_(std::move(serializer)),
        listener_join_timeout_(listener_join_timeout),
        log_(std::make_shared<EventLog>()) {}

    EventLogRecorder::~EventLogRecorder() {
        if (device_) device_->request_stop();
    }

    common::EmptyResult EventLogRecorder::do_check_availability() {
        if (!device_) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "No input backend");
        }
        return device_->probe();
    }

    common::EmptyResult EventLogRecorder::do_start() {
        auto log = log_;
        auto filter = filter_;
        return device_->start([log, filter](const interfaces::InputEvent& e) {
            if (filter(e)) log->append(e);
        });
    }

    bool EventLogRecorder::do_should_stop() {
        return !device_->is_active();
    }

    void EventLogRecorder::do_stop() {
        device_->request_stop();
    }

    RecorderReport EventLogRecorder::do_join() {
        RecorderReport report;
        if (!device_->wait_stopped(listener_join_timeout_)) {
            log().warn("[" + name() + "] " + name() + " listener did not stop.");
            report.complete = false;
            report.warnings.push_back("listener did not stop");
        }

        const auto t0 = std::chrono::steady_clock::now();
        const std::string path = (std::filesystem::path(context().output_dir) / log_file_name_).string();
        auto res = log_->write(path, serializer_);
        if (res.is_err()) {
            log().error("[" + name() + "] " + res.error().message);
            report.complete = false;
            report.warnings.push_back(res.error().message);
        } else {
            report.artifacts.push_back(path);
            const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            log().debug("[" + name() + "] Saved " + std::to_string(log_->size()) + " events to " +
                        log_file_name_ + " in " + std::to_string(secs) + "s");
        }
        report.events_logged = log_->size();
        return report;
    }

    KeyboardRecorder::KeyboardRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                                       std::chrono::milliseconds listener_join_timeout)
        : EventLogRecorder("Keyboard", std::move(device), "keyboard_logs.json",
                           is_key_event, keyboard_event_json, listener_join_timeout) {}

    MouseRecorder::MouseRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                                 std::chrono::milliseconds listener_join_timeout)
        : EventLogRecorder("Mouse", std::move(device), "mouse_logs.json",
                           is_pointer_event, mouse_event_json, listener_join_timeout) {}

    GamepadRecorder::GamepadRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                                     std::chrono::milliseconds listener_join_timeout)
        : EventLogRecorder("Gamepad", std::move(device), "gamepad_logs.json",
                           is_gamepad_event, gamepad_event_json, listener_join_timeout) {}

} // namespace core
