#include "core/HotkeyStopRecorder.hpp"
#include <algorithm>
#include <cctype>

namespace core {

    namespace {
        const std::set<std::string> kNamedKeys = {
            "ctrl", "shift", "alt", "cmd", "esc", "delete", "enter", "tab", "space", "backspace",
            "up", "down", "left", "right", "home", "end", "page_up", "page_down", "insert",
            "caps_lock", "num_lock", "scroll_lock", "print_screen", "pause", "menu",
            "f1", "f2", "f3", "f4", "f5", "f6", "f7", "f8", "f9", "f10", "f11", "f12"
        };

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string alias(const std::string& name) {
            if (name == "control") return "ctrl";
            if (name == "super" || name == "meta" || name == "win") return "cmd";
            if (name == "escape") return "esc";
            if (name == "return") return "enter";
            if (name == "alt_gr") return "alt";
            if (name == "pgup") return "page_up";
            if (name == "pgdn") return "page_down";
            return name;
        }
    }

    std::string canonical_key_name(const std::string& device_key) {
        std::string k = lower(device_key);
        // Sided modifiers: ctrl_l, shift_r, alt_gr, cmd_r, ...
        const size_t cut = k.rfind('_');
        if (cut != std::string::npos) {
            const std::string base = k.substr(0, cut);
            const std::string side = k.substr(cut + 1);
            if ((base == "ctrl" || base == "shift" || base == "alt" || base == "cmd") &&
                (side == "l" || side == "r" || side == "gr")) {
                return base;
            }
        }
        return alias(k);
    }

    common::Result<HotkeySpec> HotkeySpec::parse(const std::string& text) {
        using R = common::Result<HotkeySpec>;
        HotkeySpec combo;
        combo.text_ = text;

        if (text.empty()) {
            return R::err(common::ErrorCode::ConfigError, "hotkey: empty combination");
        }

        size_t pos = 0;
        while (true) {
            size_t plus = text.find('+', pos);
            std::string token = text.substr(pos, plus == std::string::npos ? std::string::npos : plus - pos);
            if (token.empty()) {
                return R::err(common::ErrorCode::ConfigError, "hotkey: empty token in '" + text + "'");
            }

            std::string key;
            if (token.size() >= 3 && token.front() == '<' && token.back() == '>') {
                key = alias(lower(token.substr(1, token.size() - 2)));
                if (kNamedKeys.count(key) == 0) {
                    return R::err(common::ErrorCode::ConfigError, "hotkey: unknown key " + token);
                }
            } else if (token.size() == 1 && std::isprint(static_cast<unsigned char>(token[0]))) {
                key = lower(token);
            } else {
                return R::err(common::ErrorCode::ConfigError,
                    "hotkey: '" + token + "' is neither <name> nor a single character");
            }

            if (std::find(combo.keys_.begin(), combo.keys_.end(), key) != combo.keys_.end()) {
                return R::err(common::ErrorCode::ConfigError, "hotkey: " + token + " appears twice");
            }
            combo.keys_.push_back(key);

            if (plus == std::string::npos) break;
            pos = plus + 1;
        }
        return R::ok(std::move(combo));
    }

    bool HotkeySpec::satisfied_by(const std::set<std::string>& held) const {
        if (keys_.empty()) return false;
        for (const auto& k : keys_) {
            if (held.count(k) == 0) return false;
        }
        return true;
    }

    void HotkeyStopRecorder::State::on_event(const interfaces::InputEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        if (e.type == interfaces::InputEventType::Pressed) {
            held.insert(e.key);
        } else if (e.type == interfaces::InputEventType::Released) {
            held.erase(e.key);
            return;
        } else {
            return;
        }

        std::set<std::string> canonical;
        for (const auto& k : held) canonical.insert(canonical_key_name(k));
        if (hotkey.satisfied_by(canonical)) {
            triggered.store(true);
        }
    }

    HotkeyStopRecorder::HotkeyStopRecorder(
        std::unique_ptr<interfaces::IInputDevice> keyboard,
        HotkeySpec hotkey,
        std::chrono::milliseconds listener_join_timeout
    ) : Recorder("HotkeyStop"),
        keyboard_(std::move(keyboard)),
        listener_join_timeout_(listener_join_timeout),
        state_(std::make_shared<State>()) {
        state_->hotkey = std::move(hotkey);
    }

    HotkeyStopRecorder::~HotkeyStopRecorder() {
        if (keyboard_) keyboard_->request_stop();
    }

    common::EmptyResult HotkeyStopRecorder::do_check_availability() {
        if (!keyboard_) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "No keyboard backend");
        }
        return keyboard_->probe();
    }

    common::EmptyResult HotkeyStopRecorder::do_start() {
        log().info("[HotkeyStop] Press " + state_->hotkey.text() + " to stop the recording");
        auto state = state_;
        return keyboard_->start([state](const interfaces::InputEvent& e) { state->on_event(e); });
    }

    bool HotkeyStopRecorder::do_should_stop() {
        return state_->triggered.load();
    }

    void HotkeyStopRecorder::do_stop() {
        keyboard_->request_stop();
    }

    RecorderReport HotkeyStopRecorder::do_join() {
        RecorderReport report;
        if (!keyboard_->wait_stopped(listener_join_timeout_)) {
            log().warn("[HotkeyStop] Hotkey listener did not stop.");
            report.complete = false;
            report.warnings.push_back("listener did not stop");
        }
        if (state_->triggered.load()) {
            log().info("[HotkeyStop] Stop hotkey " + state_->hotkey.text() + " pressed");
        }
        return report;
    }

} // namespace core
