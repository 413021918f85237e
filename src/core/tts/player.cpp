#include "tts/player.hpp"

#include "tts/paragraphs.hpp"

#include <format>
#include <print>

Player::Player(const StateStore& store, SpeechEngine& engine, int self_pid)
    : store_(store), engine_(engine), self_pid_(self_pid) {}

std::expected<void, Error> Player::run(int from_paragraph) {
    auto text = store_.load_speech();
    if (!text) return std::unexpected(text.error());

    auto paragraphs = split_paragraphs(*text);
    if (from_paragraph < 0 || from_paragraph >= static_cast<int>(paragraphs.size())) {
        return std::unexpected(Error{ErrorCode::StateConflict,
                                     std::format("paragraph {} outside [0, {})",
                                                 from_paragraph, paragraphs.size())});
    }

    for (int i = from_paragraph; i < static_cast<int>(paragraphs.size()); i++) {
        if (auto ok = store_.save_progress(self_pid_, i); !ok) {
            std::println(stderr, "player: {}", ok.error().message);
        }

        auto spoken = engine_.speak(paragraphs[i]);
        if (!spoken) return spoken;
    }
    return {};
}
