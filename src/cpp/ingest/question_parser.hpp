#pragma once
// Parser boundary: Markdown text of one chunk -> raw question records.
// Implementations must be const-callable from several worker threads.
#include <string>
#include <string_view>
#include <vector>
#include "records.hpp"

namespace mdingest {

class QuestionParser {
public:
    virtual ~QuestionParser() = default;

    // Throws ParseError on unrecoverable malformed input
    virtual std::vector<RawQuestionRecord> parse(std::string_view text) const = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// Heuristic parser for numbered / rule-separated question banks.
// Blocks are delimited with the chunker's separator classifier.
class MarkdownQuestionParser : public QuestionParser {
public:
    std::vector<RawQuestionRecord> parse(std::string_view text) const override;

    [[nodiscard]] const char* name() const override { return "markdown"; }
};

// Exposed for tests
std::string detect_question_type(std::string_view block);
std::vector<std::string_view> split_question_blocks(std::string_view text);

// Returns the offset of the first invalid byte, or npos if text is valid UTF-8
size_t find_invalid_utf8(std::string_view text);

} // namespace mdingest
