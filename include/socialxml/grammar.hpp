// grammar.hpp - PEGTL grammar for a single <...> tag span
#pragma once
#include <tao/pegtl.hpp>
#include <cctype>
#include <string>

namespace socialxml::grammar {
using namespace tao::pegtl;

// Names: [A-Za-z_:][A-Za-z0-9_:.-]*
struct name_first : sor< ranges<'a','z','A','Z'>, one<'_', ':'> > {};
struct name_rest : sor< ranges<'a','z','A','Z','0','9'>, one<'_', ':', '.', '-'> > {};
struct tag_name : seq< name_first, star< name_rest > > {};

// Attribute text runs up to the terminating '>' or '/>' and is kept raw.
struct attr_text : star< not_at< opt< one<'/'> >, one<'>'> >, any > {};
struct attributes : seq< space, attr_text > {};
struct self_close : one<'/'> {};

struct close_tag : seq< one<'<'>, one<'/'>, tag_name, star< space >, one<'>'> > {};
// <?xml ...?>, <!DOCTYPE ...>
struct declaration : seq< one<'<'>, one<'?', '!'>, star< not_one<'>'> >, one<'>'> > {};
struct open_tag : seq< one<'<'>, tag_name, opt< attributes >, opt< self_close >, one<'>'> > {};

struct tag : sor< close_tag, declaration, open_tag > {};
struct tag_span : seq< tag, eof > {};

enum class tag_kind { open, close, declaration };

// Parse state filled by the actions below. Actions of a failed alternative may have
// fired already, so callers only trust the state when the parse returns true.
struct tag_state {
    tag_kind kind = tag_kind::open;
    std::string name;
    std::string attributes;
    bool self_closing = false;
};

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< tag_name > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, tag_state& st){ st.name = in.string(); }
};

template<> struct action< attr_text > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, tag_state& st){ st.attributes = in.string(); }
};

template<> struct action< self_close > {
    template<typename ActionInput>
    static void apply(const ActionInput&, tag_state& st){ st.self_closing = true; }
};

template<> struct action< close_tag > {
    template<typename ActionInput>
    static void apply(const ActionInput&, tag_state& st){ st.kind = tag_kind::close; }
};

template<> struct action< declaration > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, tag_state& st){
        st.kind = tag_kind::declaration;
        std::string s = in.string();
        size_t e = 1;
        while(e < s.size() && s[e] != '>' && !std::isspace(static_cast<unsigned char>(s[e]))) ++e;
        st.name = s.substr(1, e - 1);
        st.self_closing = true;
    }
};

} // namespace socialxml::grammar
