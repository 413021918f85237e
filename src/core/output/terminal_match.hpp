#pragma once

#include <string>
#include <string_view>
#include <vector>

// Splits xprop's `WM_CLASS(STRING) = "instance", "Class"` into its
// lowercased quoted names.
std::vector<std::string> parse_wm_class(std::string_view xprop_output);

// True if any class name equals one of the known terminal names.
bool is_terminal_class(const std::vector<std::string>& class_names,
                       const std::vector<std::string>& terminals);
