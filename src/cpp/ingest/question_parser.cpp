#include "question_parser.hpp"
#include "errors.hpp"
#include "separators.hpp"
#include <cctype>

namespace mdingest {

namespace {

constexpr const char* ANSWER_PREFIXES[] = {"Answer:", "答案:", "答案："};
constexpr const char* EXPLANATION_PREFIXES[] = {
    "Explanation:", "Analysis:", "解析:", "解析："
};

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

// ^[A-Z]\.  -- on an already trimmed line
bool is_option_marker(std::string_view t) {
    return t.size() >= 2 && t[0] >= 'A' && t[0] <= 'Z' && t[1] == '.';
}

// Value after a labelled prefix, or false if the line carries none of them
template <size_t N>
bool match_label(std::string_view t, const char* const (&prefixes)[N], std::string& value) {
    for (const char* p : prefixes) {
        std::string_view prefix(p);
        if (starts_with(t, prefix)) {
            value = trim(t.substr(prefix.size()));
            return true;
        }
    }
    return false;
}

bool is_heading(std::string_view t) { return !t.empty() && t[0] == '#'; }

// Removes ![alt](url) tags from text, collecting them into images.
// Tags do not span lines.
std::string extract_images(std::string_view text, std::vector<RawImage>& images) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '!' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t close = text.find_first_of("]\n", i + 2);
            if (close != std::string_view::npos && text[close] == ']' &&
                close + 1 < text.size() && text[close + 1] == '(') {
                size_t end = text.find_first_of(")\n", close + 2);
                if (end != std::string_view::npos && text[end] == ')') {
                    RawImage img;
                    img.alt = trim(text.substr(i + 2, close - i - 2));
                    img.url = trim(text.substr(close + 2, end - close - 2));
                    if (!img.url.empty()) images.push_back(std::move(img));
                    i = end + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

// $$...$$ display formulas first, then single-line $...$ inline formulas.
// A backslash-escaped dollar is literal text.
std::vector<std::string> extract_formulas(std::string_view text) {
    std::vector<std::string> formulas;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            i += 2;
            continue;
        }
        if (text[i] != '$') {
            ++i;
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '$') {
            size_t end = text.find("$$", i + 2);
            if (end == std::string_view::npos) break;
            std::string f = trim(text.substr(i + 2, end - i - 2));
            if (!f.empty()) formulas.push_back(std::move(f));
            i = end + 2;
            continue;
        }
        size_t end = i + 1;
        while (end < text.size() && text[end] != '$' && text[end] != '\n') {
            if (text[end] == '\\' && end + 1 < text.size()) ++end;
            ++end;
        }
        if (end < text.size() && text[end] == '$') {
            std::string f = trim(text.substr(i + 1, end - i - 1));
            if (!f.empty()) formulas.push_back(std::move(f));
            i = end + 1;
        } else {
            i = end;
        }
    }
    return formulas;
}

// Leading "12." (and following whitespace) of the first line
std::string_view strip_leading_number(std::string_view t) {
    size_t i = 0;
    while (i < t.size() && t[i] >= '0' && t[i] <= '9') ++i;
    if (i == 0 || i >= t.size() || t[i] != '.') return t;
    ++i;
    while (i < t.size() && is_space_or_tab(t[i])) ++i;
    return t.substr(i);
}

RawQuestionRecord parse_block(std::string_view block) {
    RawQuestionRecord q;
    std::string text = extract_images(block, q.images);
    q.question_type = detect_question_type(text);
    q.formulas = extract_formulas(text);

    const bool is_mc = q.question_type == question_type::MULTIPLE_CHOICE;
    bool content_done = false;
    bool first = true;
    std::string content;

    for (std::string_view raw : split_lines(text)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        std::string_view t = line;
        if (first) {
            t = strip_leading_number(t);
            first = false;
        }

        std::string value;
        if (match_label(t, ANSWER_PREFIXES, value)) {
            if (!q.answer) q.answer = value;
            content_done = true;
            continue;
        }
        if (match_label(t, EXPLANATION_PREFIXES, value)) {
            if (!q.explanation) q.explanation = value;
            content_done = true;
            continue;
        }
        if (is_option_marker(t)) {
            if (is_mc) {
                std::string opt = trim(t.substr(2));
                if (!opt.empty()) q.options.push_back(std::move(opt));
            }
            content_done = true;
            continue;
        }
        if (content_done || t.empty()) continue;

        if (!content.empty()) content.push_back(' ');
        content.append(t.data(), t.size());
    }

    q.content = std::move(content);
    return q;
}

} // namespace

size_t find_invalid_utf8(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return i;

        if (i + len > n) return i;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF))
            return i;
        i += len;
    }
    return std::string_view::npos;
}

std::string detect_question_type(std::string_view block) {
    std::string lower(block);
    for (auto& ch : lower) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    int option_lines = 0;
    for (std::string_view raw : split_lines(lower)) {
        std::string_view t = trim_line(raw);
        if (t.size() >= 3 && t[0] >= 'a' && t[0] <= 'f' && t[1] == '.' &&
            is_space_or_tab(t[2]))
            ++option_lines;
    }
    if (option_lines >= 2) return question_type::MULTIPLE_CHOICE;

    for (const char* marker : {"true", "false", "正确", "错误"}) {
        if (lower.find(marker) != std::string::npos) return question_type::TRUE_FALSE;
    }
    if (block.find("____") != std::string_view::npos) return question_type::FILL_IN_BLANK;
    return question_type::SUBJECTIVE;
}

std::vector<std::string_view> split_question_blocks(std::string_view text) {
    std::vector<std::string_view> blocks;
    const char* begin = nullptr;    // First line of the open block
    const char* end = nullptr;      // End of its last non-blank line
    bool only_headings = true;
    int blanks = 0;

    auto flush = [&] {
        if (begin && !only_headings) blocks.emplace_back(begin, static_cast<size_t>(end - begin));
        begin = end = nullptr;
        only_headings = true;
    };

    for (std::string_view line : split_lines(text)) {
        LineKind kind = classify_line(line);
        if (kind == LineKind::BLANK) {
            if (++blanks >= 2) flush();
            continue;
        }
        blanks = 0;
        if (kind == LineKind::RULE) {
            flush();
            continue;
        }
        if (kind == LineKind::NUMBERED) flush();
        if (!begin) begin = line.data();
        end = line.data() + line.size();
        if (!is_heading(trim_line(line))) only_headings = false;
    }
    flush();
    return blocks;
}

std::vector<RawQuestionRecord> MarkdownQuestionParser::parse(std::string_view text) const {
    size_t nul = text.find('\0');
    if (nul != std::string_view::npos)
        throw ParseError("NUL byte at offset " + std::to_string(nul));
    size_t bad = find_invalid_utf8(text);
    if (bad != std::string_view::npos)
        throw ParseError("invalid UTF-8 at offset " + std::to_string(bad));

    std::vector<RawQuestionRecord> records;
    for (std::string_view block : split_question_blocks(text)) {
        RawQuestionRecord q = parse_block(block);
        // Image-only or label-only fragments carry no question text
        if (q.content.empty() && q.options.empty()) continue;
        records.push_back(std::move(q));
    }
    return records;
}

} // namespace mdingest
