#pragma once

#include <string>
#include <string_view>

namespace labelkit {

bool is_space(char c);

// Strip leading and trailing ASCII whitespace.
std::string_view trim_view(std::string_view s);
std::string trim(std::string_view s);

// Escape & < > " ' for embedding a label in HTML.
std::string escape_html(std::string_view text);

// True when `text` still carries "{{" or "{%" markers.
bool has_unresolved_markers(std::string_view text);

} // namespace labelkit
