#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "hotkey_dispatcher.hpp"

#include <linux/input-event-codes.h>
#include <vector>

namespace {

constexpr int kPress = 1;
constexpr int kRelease = 0;
constexpr int kRepeat = 2;

struct Recorder {
    std::vector<ActionKind> fired;
    HotkeyDispatcher dispatcher{[this](const Action& a) { fired.push_back(a.kind); }};

    Recorder() {
        auto ok = dispatcher.bind(Config().hotkeys);
        REQUIRE(ok.has_value());
    }

    void tap(int key) {
        dispatcher.on_key(key, kPress);
        dispatcher.on_key(key, kRelease);
    }
};

} // namespace

TEST_CASE("parse_combo", "[hotkey]") {

    SECTION("ModifierAndFunctionKey") {
        auto c = parse_combo("super+f5");
        REQUIRE(c.has_value());
        REQUIRE(c->modifiers == ModSuper);
        REQUIRE(c->key == KEY_F5);
    }

    SECTION("SeveralModifiers") {
        auto c = parse_combo("Super+Shift+F7");
        REQUIRE(c.has_value());
        REQUIRE(c->modifiers == (ModSuper | ModShift));
        REQUIRE(c->key == KEY_F7);
    }

    SECTION("LettersDigitsAndNames") {
        REQUIRE(parse_combo("ctrl+alt+r")->key == KEY_R);
        REQUIRE(parse_combo("ctrl+alt+r")->modifiers == (ModCtrl | ModAlt));
        REQUIRE(parse_combo("super+1")->key == KEY_1);
        REQUIRE(parse_combo("pause")->key == KEY_PAUSE);
        REQUIRE(parse_combo("pause")->modifiers == ModNone);
        REQUIRE(parse_combo("f24")->key == KEY_F24);
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(parse_combo("").has_value());
        REQUIRE_FALSE(parse_combo("super").has_value());
        REQUIRE_FALSE(parse_combo("super+").has_value());
        REQUIRE_FALSE(parse_combo("super+f5+f6").has_value());
        REQUIRE_FALSE(parse_combo("hyper+f5").has_value());
        REQUIRE_FALSE(parse_combo("f25").has_value());
        REQUIRE_FALSE(parse_combo("f999").has_value());
    }
}

TEST_CASE("HotkeyDispatcher binding", "[hotkey]") {
    HotkeyDispatcher d([](const Action&) {});

    SECTION("Defaults") {
        REQUIRE(d.bind(Config().hotkeys).has_value());
        REQUIRE(d.binding_count() == 6);
    }

    SECTION("UnknownAction") {
        auto ok = d.bind({{"make-coffee", "super+f1"}});
        REQUIRE_FALSE(ok.has_value());
    }

    SECTION("BadCombo") {
        REQUIRE_FALSE(d.bind({{"start-record", "super+nope"}}).has_value());
    }

    SECTION("DuplicateCombo") {
        REQUIRE_FALSE(d.bind({{"start-record", "super+f5"}, {"stop-record", "Super+F5"}}).has_value());
    }

    SECTION("SpeakCannotBeBound") {
        REQUIRE_FALSE(d.bind({{"speak", "super+f10"}}).has_value());
    }

    SECTION("EmptyComboLeavesActionUnbound") {
        REQUIRE(d.bind({{"start-record", "super+f5"}, {"toggle-backend", ""}}).has_value());
        REQUIRE(d.binding_count() == 1);
    }
}

TEST_CASE("HotkeyDispatcher events", "[hotkey]") {
    Recorder r;

    SECTION("ComboFiresOnPress") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_F5, kPress);
        REQUIRE(r.fired == std::vector<ActionKind>{ActionKind::StartRecording});
    }

    SECTION("HeldKeyDoesNotRepeat") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_F6, kPress);
        for (int i = 0; i < 20; i++) r.dispatcher.on_key(KEY_F6, kRepeat);
        REQUIRE(r.fired.size() == 1);
    }

    SECTION("SecondPressAfterRelease") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.tap(KEY_F8);
        r.tap(KEY_F8);
        REQUIRE(r.fired == std::vector<ActionKind>{ActionKind::PauseResume, ActionKind::PauseResume});
    }

    SECTION("NoModifierNoFire") {
        r.tap(KEY_F5);
        REQUIRE(r.fired.empty());
    }

    SECTION("ExactModifiersDistinguishCombos") {
        r.dispatcher.on_key(KEY_RIGHTMETA, kPress);
        r.tap(KEY_F7);
        r.dispatcher.on_key(KEY_LEFTSHIFT, kPress);
        r.tap(KEY_F7);
        REQUIRE(r.fired == std::vector<ActionKind>{ActionKind::NextParagraph, ActionKind::PrevParagraph});
    }

    SECTION("ExtraModifierBlocksCombo") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_LEFTCTRL, kPress);
        r.tap(KEY_F5);
        REQUIRE(r.fired.empty());
    }

    SECTION("ModifierReleaseIsTracked") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_LEFTMETA, kRelease);
        r.tap(KEY_F9);
        REQUIRE(r.fired.empty());
    }

    SECTION("SyncDroppedForgetsHeldKeys") {
        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_F9, kPress);
        REQUIRE(r.fired.size() == 1);

        // Release events were lost; nothing is assumed held any more.
        r.dispatcher.on_sync_dropped();
        r.dispatcher.on_key(KEY_F9, kPress);
        REQUIRE(r.fired.size() == 1);

        r.dispatcher.on_key(KEY_LEFTMETA, kPress);
        r.dispatcher.on_key(KEY_F9, kPress);
        REQUIRE(r.fired == std::vector<ActionKind>{ActionKind::ToggleBackend, ActionKind::ToggleBackend});
    }

    SECTION("HandlerReceivesActionWithoutText") {
        Action last{.kind = ActionKind::Status, .text = "x"};
        HotkeyDispatcher d([&](const Action& a) { last = a; });
        REQUIRE(d.bind({{"stop-record", "ctrl+space"}}).has_value());
        d.on_key(KEY_RIGHTCTRL, kPress);
        d.on_key(KEY_SPACE, kPress);
        REQUIRE(last.kind == ActionKind::StopRecording);
        REQUIRE(last.text.empty());
    }
}
