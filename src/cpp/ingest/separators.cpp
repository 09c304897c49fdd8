#include "separators.hpp"

namespace mdingest {

std::string_view trim_line(std::string_view line) {
    size_t b = 0;
    size_t e = line.size();
    while (e > b && (line[e - 1] == '\n' || line[e - 1] == '\r' ||
                     is_space_or_tab(line[e - 1])))
        --e;
    while (b < e && is_space_or_tab(line[b])) ++b;
    return line.substr(b, e - b);
}

LineKind classify_line(std::string_view line) {
    std::string_view t = trim_line(line);
    if (t.empty()) return LineKind::BLANK;
    if (t == "---" || t == "***") return LineKind::RULE;

    // ^\d+\.\s -- anchored at column 0, the number must be followed by
    // whitespace; a line ending right after the dot counts (the newline
    // is the whitespace, whether or not the caller stripped it)
    size_t i = 0;
    while (i < line.size() && line[i] >= '0' && line[i] <= '9') ++i;
    if (i == 0 || i >= line.size() || line[i] != '.') return LineKind::TEXT;
    ++i;
    if (i >= line.size()) return LineKind::NUMBERED;
    char c = line[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return LineKind::NUMBERED;
    return LineKind::TEXT;
}

} // namespace mdingest
