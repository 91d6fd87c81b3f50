#include "socialxml/token.hpp"
#include "socialxml/grammar.hpp"
#include <tao/pegtl.hpp>
#include <type_traits>

namespace socialxml {

namespace {

inline bool is_ws(char c){ return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\f' || c=='\v'; }

struct scan_result { bool truncated = false; };

// Single forward pass: each '<' is matched to the next '>' once, text runs to the next '<'.
scan_result scan_tokens(std::string_view src, int first_line, std::vector<Token>& out){
    scan_result res;
    size_t p = 0;
    int line = first_line;
    while(p < src.size()){
        if(src[p] == '<'){
            size_t close = src.find('>', p);
            if(close == std::string_view::npos){ res.truncated = true; break; }
            std::string_view span = src.substr(p, close - p + 1);
            out.push_back(Token{classify_tag(span), line});
            for(char c : span) if(c == '\n') ++line;
            p = close + 1;
            continue;
        }
        size_t next = src.find('<', p);
        if(next == std::string_view::npos) next = src.size();
        std::string_view chunk = src.substr(p, next - p);
        size_t i = 0;
        int text_line = line;
        while(i < chunk.size() && is_ws(chunk[i])){ if(chunk[i] == '\n') ++text_line; ++i; }
        if(i < chunk.size()) out.push_back(Token{Text{std::string(trim(chunk))}, text_line});
        for(char c : chunk) if(c == '\n') ++line;
        p = next;
    }
    return res;
}

token_data lenient_tag(std::string_view span){
    bool closing = span.size() > 1 && span[1] == '/';
    size_t b = closing ? 2 : 1;
    size_t e = b;
    while(e < span.size() && !is_ws(span[e]) && span[e] != '/' && span[e] != '>') ++e;
    std::string name(span.substr(b, e - b));
    if(closing) return CloseTag{std::move(name), std::string(span), false};
    bool self_closing = span.size() >= 3 && span[span.size() - 2] == '/';
    size_t attr_end = span.size() - (self_closing ? 2 : 1);
    std::string attrs = attr_end > e ? std::string(trim(span.substr(e, attr_end - e))) : std::string();
    return OpenTag{std::move(name), std::move(attrs), self_closing, std::string(span), false};
}

} // namespace

token_data classify_tag(std::string_view span){
    grammar::tag_state st;
    tao::pegtl::memory_input in(span.data(), span.size(), "tag");
    if(!tao::pegtl::parse< grammar::tag_span, grammar::action >(in, st))
        return lenient_tag(span);
    switch(st.kind){
    case grammar::tag_kind::close:
        return CloseTag{std::move(st.name), std::string(span), true};
    case grammar::tag_kind::declaration:
        return OpenTag{std::move(st.name), std::string(), true, std::string(span), true};
    case grammar::tag_kind::open:
        break;
    }
    return OpenTag{std::move(st.name), std::string(trim(st.attributes)), st.self_closing, std::string(span), true};
}

std::vector<Token> tokenize(std::string_view document){
    std::vector<Token> out;
    (void)scan_tokens(document, 1, out);
    return out;
}

LineView tokenize_lines(std::string_view document){
    LineView view;
    int line = 0;
    size_t start = 0;
    while(true){
        size_t nl = document.find('\n', start);
        if(nl == std::string_view::npos) nl = document.size();
        std::string_view text = document.substr(start, nl - start);
        ++line;
        bool has_lt = text.find('<') != std::string_view::npos;
        bool has_gt = text.find('>') != std::string_view::npos;
        if(has_lt && !has_gt){
            view.defects.push_back({line, LineDefectKind::missing_close});
        } else if(has_gt && !has_lt){
            view.defects.push_back({line, LineDefectKind::missing_open});
        } else {
            std::vector<Token> toks;
            if(scan_tokens(text, line, toks).truncated){
                view.defects.push_back({line, LineDefectKind::missing_close});
            } else {
                for(auto& t : toks) view.tokens.push_back(std::move(t));
            }
        }
        if(nl >= document.size()) break;
        start = nl + 1;
    }
    return view;
}

const std::string& tag_name(const Token& t){
    static const std::string empty;
    if(auto o = std::get_if<OpenTag>(&t.data)) return o->name;
    if(auto c = std::get_if<CloseTag>(&t.data)) return c->name;
    return empty;
}

const std::string& raw_text(const Token& t){
    return std::visit([](const auto& v) -> const std::string& {
        using T = std::decay_t<decltype(v)>;
        if constexpr(std::is_same_v<T, Text>) return v.content;
        else return v.raw;
    }, t.data);
}

std::string attribute_value(std::string_view attributes, std::string_view name, bool* found){
    if(found) *found = false;
    size_t pos = 0;
    while((pos = attributes.find(name, pos)) != std::string_view::npos){
        bool starts_word = pos == 0 || is_ws(attributes[pos - 1]);
        size_t i = pos + name.size();
        pos = i;
        if(!starts_word) continue;
        while(i < attributes.size() && is_ws(attributes[i])) ++i;
        if(i >= attributes.size() || attributes[i] != '=') continue;
        ++i;
        while(i < attributes.size() && is_ws(attributes[i])) ++i;
        if(i >= attributes.size()) break;
        size_t e;
        if(attributes[i] == '"' || attributes[i] == '\''){
            char q = attributes[i++];
            e = attributes.find(q, i);
            if(e == std::string_view::npos) e = attributes.size();
        } else {
            e = i;
            while(e < attributes.size() && !is_ws(attributes[e])) ++e;
        }
        if(found) *found = true;
        return std::string(attributes.substr(i, e - i));
    }
    return std::string();
}

std::string_view trim(std::string_view s){
    size_t b = 0, e = s.size();
    while(b < e && is_ws(s[b])) ++b;
    while(e > b && is_ws(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string collapse_whitespace(std::string_view s){
    std::string out;
    out.reserve(s.size());
    bool pending = false;
    for(char c : s){
        if(is_ws(c)){ pending = !out.empty(); continue; }
        if(pending){ out += ' '; pending = false; }
        out += c;
    }
    return out;
}

} // namespace socialxml
