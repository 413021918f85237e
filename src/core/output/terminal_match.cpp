#include "output/terminal_match.hpp"

#include <algorithm>
#include <cctype>

std::vector<std::string> parse_wm_class(std::string_view xprop_output) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = xprop_output.find('"', pos)) != std::string_view::npos) {
        auto end = xprop_output.find('"', pos + 1);
        if (end == std::string_view::npos) break;

        std::string name(xprop_output.substr(pos + 1, end - pos - 1));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!name.empty()) names.push_back(std::move(name));
        pos = end + 1;
    }
    return names;
}

bool is_terminal_class(const std::vector<std::string>& class_names,
                       const std::vector<std::string>& terminals) {
    return std::ranges::any_of(class_names, [&](const std::string& name) {
        return std::ranges::find(terminals, name) != terminals.end();
    });
}
