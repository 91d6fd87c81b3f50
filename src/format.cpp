#include "socialxml/format.hpp"
#include "socialxml/env.hpp"
#include "socialxml/token.hpp"
#include <algorithm>

namespace socialxml {

size_t display_width(std::string_view s){
    size_t n = 0;
    for(char c : s) if((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    return n;
}

std::vector<std::string> wrap_words(std::string_view text, size_t width){
    std::vector<std::string> lines;
    std::string current;
    size_t current_width = 0;
    size_t p = 0;
    while(p < text.size()){
        size_t e = text.find(' ', p);
        if(e == std::string_view::npos) e = text.size();
        std::string_view word = text.substr(p, e - p);
        p = e + 1;
        if(word.empty()) continue;
        size_t w = display_width(word);
        if(current.empty()){
            current = word; current_width = w;
        } else if(current_width + 1 + w <= width){
            current += ' '; current += word; current_width += 1 + w;
        } else {
            lines.push_back(std::move(current));
            current = std::string(word); current_width = w;
        }
    }
    if(!current.empty()) lines.push_back(std::move(current));
    return lines;
}

std::string format(std::string_view document){
    return format(document, FormatOptions{});
}

std::string format(std::string_view document, const FormatOptions& opts){
    const std::vector<Token> tokens = tokenize(document);
    std::vector<std::string> out;
    int level = 0;
    const size_t unit = static_cast<size_t>(std::max(0, opts.indent_width));
    auto indent = [&](int lvl){ return std::string(static_cast<size_t>(lvl) * unit, ' '); };

    for(size_t k = 0; k < tokens.size(); ++k){
        const Token& tok = tokens[k];
        if(const auto* close = std::get_if<CloseTag>(&tok.data)){
            level = std::max(0, level - 1);
            out.push_back(indent(level) + close->raw);
        } else if(const auto* open = std::get_if<OpenTag>(&tok.data)){
            if(open->self_closing){
                out.push_back(indent(level) + open->raw);
                continue;
            }
            bool leaf = k + 2 < tokens.size() && is_text(tokens[k + 1]) && is_closing_tag(tokens[k + 2])
                        && tag_name(tokens[k + 2]) == open->name;
            if(!leaf){
                out.push_back(indent(level) + open->raw);
                ++level;
                continue;
            }
            std::string text = collapse_whitespace(std::get<Text>(tokens[k + 1].data).content);
            const std::string& close_raw = std::get<CloseTag>(tokens[k + 2].data).raw;
            if(display_width(text) <= opts.wrap_width){
                out.push_back(indent(level) + open->raw + text + close_raw);
            } else {
                out.push_back(indent(level) + open->raw);
                for(auto& l : wrap_words(text, opts.wrap_width)) out.push_back(indent(level + 1) + l);
                out.push_back(indent(level) + close_raw);
            }
            k += 2;
        } else {
            // mixed content: keep the author's line breaks, re-indent each line
            std::string_view content = std::get<Text>(tok.data).content;
            size_t p = 0;
            while(p <= content.size()){
                size_t nl = content.find('\n', p);
                if(nl == std::string_view::npos) nl = content.size();
                std::string_view line = trim(content.substr(p, nl - p));
                if(!line.empty()) out.push_back(indent(level) + std::string(line));
                p = nl + 1;
            }
        }
    }

    std::string result;
    for(size_t i = 0; i < out.size(); ++i){
        if(i) result += '\n';
        result += out[i];
    }
    if(trace_enabled())
        trace("format", "tokens=" + std::to_string(tokens.size()) + " lines=" + std::to_string(out.size()));
    return result;
}

std::string minify(std::string_view document){
    std::string out;
    out.reserve(document.size());
    for(const auto& tok : tokenize(document)){
        if(const auto* text = std::get_if<Text>(&tok.data)) out += collapse_whitespace(text->content);
        else out += raw_text(tok);
    }
    return out;
}

} // namespace socialxml
