// token.hpp - token model and scanners shared by the validators and the formatter
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace socialxml {

struct OpenTag {
    std::string name;
    std::string attributes;   // raw attribute text, trimmed
    bool self_closing = false; // "<x/>" and declarations such as "<?xml ...?>"
    std::string raw;          // exact "<...>" span
    bool well_formed = true;  // false when the span did not match the tag grammar
};

struct CloseTag {
    std::string name;
    std::string raw;
    bool well_formed = true;
};

struct Text {
    std::string content; // trimmed, never empty
};

using token_data = std::variant<OpenTag, CloseTag, Text>;

struct Token {
    token_data data;
    int line = 1; // 1-based line where the token starts
};

// Whole-document tokenization. An unterminated trailing "<..." is dropped silently.
std::vector<Token> tokenize(std::string_view document);

// Validation view: every line scanned on its own. Lines rejected before tag extraction
// are reported as defects and contribute no tokens.
enum class LineDefectKind { missing_close, missing_open };
struct LineDefect { int line; LineDefectKind kind; };
struct LineView {
    std::vector<Token> tokens;
    std::vector<LineDefect> defects;
};
LineView tokenize_lines(std::string_view document);

// Classify one "<...>" span. Spans the tag grammar rejects still produce a token
// (CloseTag when they start with "</"), flagged well_formed = false.
token_data classify_tag(std::string_view span);

inline bool is_closing_tag(const Token& t){ return std::holds_alternative<CloseTag>(t.data); }
inline bool is_text(const Token& t){ return std::holds_alternative<Text>(t.data); }

// Tag name of an open/close token, empty for text.
const std::string& tag_name(const Token& t);

// Raw rendering: the tag span, or the stored (trimmed) text.
const std::string& raw_text(const Token& t);

// Value of name="..." (or name='...') inside raw attribute text.
std::string attribute_value(std::string_view attributes, std::string_view name, bool* found = nullptr);

std::string_view trim(std::string_view s);
// Collapse every whitespace run to a single space and trim.
std::string collapse_whitespace(std::string_view s);

} // namespace socialxml
