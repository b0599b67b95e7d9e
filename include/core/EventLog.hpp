#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "interfaces/IInputDevice.hpp"

namespace core {

    std::string escape_json(const std::string& s);

    // Renders one event as a JSON object
    using EventSerializer = std::function<std::string(const interfaces::InputEvent&)>;

    std::string keyboard_event_json(const interfaces::InputEvent& e);
    std::string mouse_event_json(const interfaces::InputEvent& e);
    std::string gamepad_event_json(const interfaces::InputEvent& e);

    // Append-only, thread-safe event buffer dumped as a JSON array at join
    class EventLog {
    public:
        void append(const interfaces::InputEvent& e);
        size_t size() const;
        std::vector<interfaces::InputEvent> snapshot() const;

        std::string to_json(const EventSerializer& serializer) const;
        common::EmptyResult write(const std::string& path, const EventSerializer& serializer) const;

    private:
        mutable std::mutex mutex_;
        std::vector<interfaces::InputEvent> events_;
    };

} // namespace core
