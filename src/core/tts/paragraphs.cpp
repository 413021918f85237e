#include "tts/paragraphs.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

constexpr std::array<std::string_view, 33> kFrenchMarkers = {
    "à", "é", "è", "ê", "ë", "ï", "ô", "ù", "û", "ü", "ÿ", "ç", "œ", "æ",
    " le ", " la ", " les ", " des ", " du ", " un ", " une ",
    " est ", " sont ", " dans ", " pour ", " avec ", " que ",
    " qui ", " nous ", " vous ", " c'est ", " j'ai ", " n'est ",
};

} // namespace

std::vector<std::string> split_paragraphs(std::string_view text) {
    std::vector<std::string> paragraphs;
    std::string current;

    auto flush = [&] {
        auto t = trim(current);
        if (!t.empty()) paragraphs.emplace_back(t);
        current.clear();
    };

    size_t pos = 0;
    while (pos <= text.size()) {
        auto nl = text.find('\n', pos);
        auto line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);

        if (trim(line).empty()) {
            flush();
        } else {
            if (!current.empty()) current += '\n';
            current += line;
        }

        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    flush();
    return paragraphs;
}

std::string detect_language(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto count = std::ranges::count_if(kFrenchMarkers, [&](std::string_view marker) {
        return lower.find(marker) != std::string::npos;
    });
    return count >= 3 ? "fr" : "en";
}
