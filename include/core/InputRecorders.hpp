#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "core/EventLog.hpp"
#include "core/Recorder.hpp"
#include "interfaces/IInputDevice.hpp"

namespace core {

    /**
     * @brief Recorder that logs the events of one input device.
     *
     * The device listener appends to an EventLog on its own thread; join()
     * waits for it (bounded) and dumps the log as JSON into the session
     * directory. should_stop() turns true if the listener dies on its own.
     */
    class EventLogRecorder : public Recorder {
    public:
        // Event types a recorder keeps
        using EventFilter = bool (*)(const interfaces::InputEvent&);

        EventLogRecorder(
            std::string name,
            std::unique_ptr<interfaces::IInputDevice> device,
            std::string log_file_name,
            EventFilter filter,
            EventSerializer serializer,
            std::chrono::milliseconds listener_join_timeout
        );
        ~EventLogRecorder() override;

        size_t events_logged() const { return log_->size(); }
        const std::string& log_file_name() const { return log_file_name_; }

    protected:
        common::EmptyResult do_check_availability() override;
        common::EmptyResult do_start() override;
        bool do_should_stop() override;
        void do_stop() override;
        RecorderReport do_join() override;

    private:
        std::unique_ptr<interfaces::IInputDevice> device_;
        std::string log_file_name_;
        EventFilter filter_;
        EventSerializer serializer_;
        std::chrono::milliseconds listener_join_timeout_;
        std::shared_ptr<EventLog> log_;
    };

    // pressed / released key events -> keyboard_logs.json
    class KeyboardRecorder : public EventLogRecorder {
    public:
        explicit KeyboardRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                                  std::chrono::milliseconds listener_join_timeout = std::chrono::seconds(10));
    };

    // move / click / scroll events -> mouse_logs.json
    class MouseRecorder : public EventLogRecorder {
    public:
        explicit MouseRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                               std::chrono::milliseconds listener_join_timeout = std::chrono::seconds(10));
    };

    // button and axis events -> gamepad_logs.json
    class GamepadRecorder : public EventLogRecorder {
    public:
        explicit GamepadRecorder(std::unique_ptr<interfaces::IInputDevice> device,
                                 std::chrono::milliseconds listener_join_timeout = std::chrono::seconds(10));
    };

} // namespace core
