#include "socialxml/diagnostics_json.hpp"
#include "socialxml/env.hpp"
#include <sstream>
#include <cstdio>

namespace socialxml {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(unsigned char c : s){
        if(c == '"' || c == '\\'){ out += '\\'; out += static_cast<char>(c); }
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(c < 0x20){
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(c));
            out += buf;
        }
        else out += static_cast<char>(c);
    }
    out += '"';
    return out;
}

std::string diagnostics_to_json(const ValidationResult& r){
    std::ostringstream os;
    os<<"{\"is_valid\":"<<(r.is_valid?"true":"false")
      <<",\"error_count\":"<<r.error_count
      <<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        const auto &e=r.errors[i]; if(i) os<<",";
        os<<"{"
            "\"line\":"<<e.line
            <<",\"description\":"<<json_escape(e.description)
            <<",\"type\":"<<json_escape(to_string(e.kind))
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ValidationResult& r){
    if(!detectEnv().diag_json) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace socialxml
