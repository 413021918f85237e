#pragma once

#include <string>
#include <string_view>
#include <vector>

// Paragraphs are separated by one or more blank lines. Each is trimmed;
// empty ones are dropped.
std::vector<std::string> split_paragraphs(std::string_view text);

// "fr" when the text carries at least three common French markers, else "en".
std::string detect_language(std::string_view text);
