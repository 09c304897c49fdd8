#pragma once
// Line classification shared by FileChunker (boundary search) and the
// default parser (block segmentation), so that a chunk boundary always
// coincides with a place where the parser would start a new question.
#include <string_view>

namespace mdingest {

enum class LineKind {
    TEXT,       // Anything else
    NUMBERED,   // "12. ..." -- numbered-list start
    RULE,       // "---" or "***" alone on the line
    BLANK       // Empty or whitespace only
};

// Classify a single line. The line may still carry its trailing '\n' / "\r\n".
LineKind classify_line(std::string_view line);

inline bool is_space_or_tab(char c) { return c == ' ' || c == '\t'; }

// Strip trailing CR/LF and surrounding spaces/tabs
std::string_view trim_line(std::string_view line);

} // namespace mdingest
