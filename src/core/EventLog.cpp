#include "core/EventLog.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace core {

    std::string escape_json(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 10);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        char buf[8];
                        snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    namespace {
        std::string json_number(double v) {
            char buf[32];
            snprintf(buf, sizeof(buf), "%.6f", v);
            return buf;
        }

        // {"timestamp": ..., "type": "..."  (object left open)
        std::string open_event(const interfaces::InputEvent& e) {
            return "{\"timestamp\": " + json_number(e.timestamp) +
                   ", \"type\": \"" + interfaces::to_string(e.type) + "\"";
        }
    }

    std::string keyboard_event_json(const interfaces::InputEvent& e) {
        // Key up is "release" in keyboard logs, "released" in gamepad logs
        const char* type = e.type == interfaces::InputEventType::Released ? "release"
                                                                           : interfaces::to_string(e.type);
        return "{\"timestamp\": " + json_number(e.timestamp) + ", \"type\": \"" + type +
               "\", \"key\": \"" + escape_json(e.key) + "\"}";
    }

    std::string mouse_event_json(const interfaces::InputEvent& e) {
        std::ostringstream ss;
        ss << open_event(e) << ", \"x\": " << e.x << ", \"y\": " << e.y;
        switch (e.type) {
            case interfaces::InputEventType::Click:
                ss << ", \"button\": \"" << escape_json(e.button)
                   << "\", \"is_pressed\": " << (e.is_pressed ? "true" : "false");
                break;
            case interfaces::InputEventType::Scroll:
                ss << ", \"dx\": " << e.dx << ", \"dy\": " << e.dy;
                break;
            default:
                break;
        }
        ss << "}";
        return ss.str();
    }

    std::string gamepad_event_json(const interfaces::InputEvent& e) {
        if (e.type == interfaces::InputEventType::Absolute) {
            return open_event(e) + ", \"axis\": \"" + escape_json(e.axis) +
                   "\", \"value\": " + std::to_string(e.value) + "}";
        }
        return open_event(e) + ", \"key\": \"" + escape_json(e.key) + "\"}";
    }

    void EventLog::append(const interfaces::InputEvent& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(e);
    }

    size_t EventLog::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    std::vector<interfaces::InputEvent> EventLog::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::string EventLog::to_json(const EventSerializer& serializer) const {
        auto events = snapshot();
        std::string out = "[";
        for (size_t i = 0; i < events.size(); ++i) {
            if (i) out += ", ";
            out += serializer(events[i]);
        }
        out += "]";
        return out;
    }

    common::EmptyResult EventLog::write(const std::string& path, const EventSerializer& serializer) const {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::StorageError, "Cannot open " + path, __FILE__);
        }
        out << to_json(serializer);
        out.flush();
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::StorageError, "Write failed: " + path, __FILE__);
        }
        return common::EmptyResult::success();
    }

} // namespace core
