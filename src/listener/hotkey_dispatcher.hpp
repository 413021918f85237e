#pragma once

#include "action.hpp"
#include "error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

enum Modifier : uint8_t {
    ModNone = 0,
    ModSuper = 1 << 0,
    ModShift = 1 << 1,
    ModCtrl = 1 << 2,
    ModAlt = 1 << 3,
};

// One key plus the exact set of modifiers that must be held with it.
struct KeyCombo {
    uint8_t modifiers = ModNone;
    int key = 0; // evdev key code

    bool operator==(const KeyCombo&) const = default;
};

// "super+shift+f7" -> {ModSuper | ModShift, KEY_F7}. Names are case-insensitive.
std::optional<KeyCombo> parse_combo(std::string_view combo_text);

// Turns raw key events into actions: one action per physical press of a
// bound combo. Autorepeat never fires, and a key must be released before its
// combo can fire again.
class HotkeyDispatcher {
public:
    using Handler = std::function<void(const Action&)>;

    explicit HotkeyDispatcher(Handler handler);

    // Binds `hotkeys` (action name -> combo). Fails on an unknown action,
    // an unparsable combo, or two actions sharing one combo.
    std::expected<void, Error> bind(const std::map<std::string, std::string>& hotkeys);

    // EV_KEY event: value 1 = press, 0 = release, 2 = autorepeat.
    void on_key(int code, int value);

    // SYN_DROPPED: the kernel lost events, so held-key state is unknown.
    void on_sync_dropped();

    size_t binding_count() const { return bindings_.size(); }

private:
    static uint8_t modifier_bit(int code);
    uint8_t held_modifiers() const;

    Handler handler_;
    std::vector<std::pair<KeyCombo, ActionKind>> bindings_;

    std::set<int> held_modifier_keys_;
    std::set<int> latched_; // fired and not yet released
};
