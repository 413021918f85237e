#include "hotkey_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <linux/input-event-codes.h>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<uint8_t> modifier_from_name(std::string_view name) {
    if (name == "super" || name == "meta" || name == "win" || name == "mod4") return ModSuper;
    if (name == "shift") return ModShift;
    if (name == "ctrl" || name == "control") return ModCtrl;
    if (name == "alt" || name == "mod1") return ModAlt;
    return std::nullopt;
}

std::optional<int> key_from_name(std::string_view name) {
    static constexpr int function_keys[] = {
        KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6, KEY_F7, KEY_F8,
        KEY_F9, KEY_F10, KEY_F11, KEY_F12, KEY_F13, KEY_F14, KEY_F15, KEY_F16,
        KEY_F17, KEY_F18, KEY_F19, KEY_F20, KEY_F21, KEY_F22, KEY_F23, KEY_F24};
    static constexpr int letters[] = {
        KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
        KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z};
    static constexpr int digits[] = {
        KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9};
    static const std::map<std::string_view, int> named = {
        {"space", KEY_SPACE}, {"enter", KEY_ENTER}, {"return", KEY_ENTER},
        {"escape", KEY_ESC}, {"esc", KEY_ESC}, {"tab", KEY_TAB},
        {"backspace", KEY_BACKSPACE}, {"insert", KEY_INSERT}, {"delete", KEY_DELETE},
        {"home", KEY_HOME}, {"end", KEY_END}, {"pageup", KEY_PAGEUP}, {"pagedown", KEY_PAGEDOWN},
        {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
        {"pause", KEY_PAUSE}, {"print", KEY_SYSRQ}, {"scrolllock", KEY_SCROLLLOCK},
    };

    if (name.size() >= 2 && name.size() <= 3 && name[0] == 'f' &&
        std::all_of(name.begin() + 1, name.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        int n = std::stoi(std::string(name.substr(1)));
        if (n >= 1 && n <= 24) return function_keys[n - 1];
        return std::nullopt;
    }
    if (name.size() == 1 && name[0] >= 'a' && name[0] <= 'z') return letters[name[0] - 'a'];
    if (name.size() == 1 && name[0] >= '0' && name[0] <= '9') return digits[name[0] - '0'];

    if (auto it = named.find(name); it != named.end()) return it->second;
    return std::nullopt;
}

} // namespace

std::optional<KeyCombo> parse_combo(std::string_view combo_text) {
    KeyCombo combo;
    bool have_key = false;

    auto text = lower(combo_text);
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('+', start);
        if (end == std::string::npos) end = text.size();
        auto part = std::string_view(text).substr(start, end - start);
        while (!part.empty() && part.front() == ' ') part.remove_prefix(1);
        while (!part.empty() && part.back() == ' ') part.remove_suffix(1);
        if (part.empty()) return std::nullopt;

        if (auto mod = modifier_from_name(part)) {
            combo.modifiers |= *mod;
        } else if (auto key = key_from_name(part); key && !have_key) {
            combo.key = *key;
            have_key = true;
        } else {
            return std::nullopt;
        }
        start = end + 1;
    }

    if (!have_key) return std::nullopt;
    return combo;
}

HotkeyDispatcher::HotkeyDispatcher(Handler handler) : handler_(std::move(handler)) {}

std::expected<void, Error> HotkeyDispatcher::bind(const std::map<std::string, std::string>& hotkeys) {
    std::vector<std::pair<KeyCombo, ActionKind>> bindings;

    for (auto& [name, combo_text] : hotkeys) {
        auto kind = action_from_name(name);
        if (!kind) {
            return std::unexpected(Error{ErrorCode::Corrupt, std::format("unknown hotkey action '{}'", name)});
        }
        // Speak needs text, which a key press cannot carry.
        if (*kind == ActionKind::Speak) {
            return std::unexpected(Error{ErrorCode::Corrupt, "speak cannot be bound to a hotkey"});
        }
        if (combo_text.empty()) continue; // unbound

        auto combo = parse_combo(combo_text);
        if (!combo) {
            return std::unexpected(Error{ErrorCode::Corrupt,
                                         std::format("invalid combo '{}' for {}", combo_text, name)});
        }
        for (auto& [existing, other] : bindings) {
            if (existing == *combo) {
                return std::unexpected(Error{ErrorCode::Corrupt,
                                             std::format("combo '{}' bound to both {} and {}", combo_text,
                                                         action_name(other), name)});
            }
        }
        bindings.emplace_back(*combo, *kind);
    }

    bindings_ = std::move(bindings);
    return {};
}

void HotkeyDispatcher::on_key(int code, int value) {
    if (modifier_bit(code) != ModNone) {
        if (value == 0) held_modifier_keys_.erase(code);
        else held_modifier_keys_.insert(code);
        return;
    }

    if (value == 0) {
        latched_.erase(code);
        return;
    }
    if (value != 1 || latched_.contains(code)) return;

    auto mods = held_modifiers();
    for (auto& [combo, kind] : bindings_) {
        if (combo.key == code && combo.modifiers == mods) {
            latched_.insert(code);
            handler_(Action{.kind = kind, .text = {}});
            return;
        }
    }
}

void HotkeyDispatcher::on_sync_dropped() {
    held_modifier_keys_.clear();
    latched_.clear();
}

uint8_t HotkeyDispatcher::modifier_bit(int code) {
    switch (code) {
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA: return ModSuper;
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT: return ModShift;
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL: return ModCtrl;
        case KEY_LEFTALT:
        case KEY_RIGHTALT: return ModAlt;
        default: return ModNone;
    }
}

uint8_t HotkeyDispatcher::held_modifiers() const {
    uint8_t mods = ModNone;
    for (int code : held_modifier_keys_) mods |= modifier_bit(code);
    return mods;
}
