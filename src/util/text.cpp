#include <labelkit/text.hpp>

namespace labelkit {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
}

std::string_view trim_view(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

std::string trim(std::string_view s) {
    return std::string(trim_view(s));
}

std::string escape_html(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

bool has_unresolved_markers(std::string_view text) {
    return text.find("{{") != std::string_view::npos ||
           text.find("{%") != std::string_view::npos;
}

} // namespace labelkit
