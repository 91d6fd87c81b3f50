// format.hpp - pretty-printer and minifier over the token model
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace socialxml {

struct FormatOptions {
    int indent_width = 4;    // spaces per nesting level, negative values act as 0
    size_t wrap_width = 80;  // leaf text longer than this (in code points) is wrapped
};

// Indented output, one element per line. Leaf elements (<a>text</a>) stay on one line
// unless their whitespace-collapsed text exceeds wrap_width, in which case the text is
// wrapped on word boundaries one level deeper. Lines are joined by '\n' with no
// trailing newline. format(format(x)) == format(x).
std::string format(std::string_view document);
std::string format(std::string_view document, const FormatOptions& opts);

// Tokens concatenated with no separators; text is whitespace-collapsed.
// minify(format(x)) == minify(x).
std::string minify(std::string_view document);

// Greedy word wrap of already collapsed text. A word longer than width gets a line of its own.
std::vector<std::string> wrap_words(std::string_view text, size_t width);

// Length in UTF-8 code points.
size_t display_width(std::string_view s);

} // namespace socialxml
