#include "socialxml/env.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

namespace socialxml {

static bool env_flag(const char* name){
    const char* v = std::getenv(name);
    return v && std::string(v) == "1";
}

static bool env_number(const char* name, long lo, long hi, long& out){
    const char* v = std::getenv(name);
    if(!v || !*v) return false;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if(*end != '\0' || n < lo || n > hi) return false;
    out = n;
    return true;
}

Env detectEnv(){
    Env env;
    long n = 0;
    if(env_number("SOCIALXML_INDENT_WIDTH", 1, 16, n)) env.format.indent_width = static_cast<int>(n);
    if(env_number("SOCIALXML_WRAP_WIDTH", 8, 100000, n)) env.format.wrap_width = static_cast<size_t>(n);
    env.trace = env_flag("SOCIALXML_TRACE");
    env.diag_json = env_flag("SOCIALXML_DIAG_JSON");
    return env;
}

bool trace_enabled(){ return detectEnv().trace; }

void trace(const char* channel, const std::string& message){
    std::fprintf(stderr, "[socialxml][%s] %s\n", channel, message.c_str());
}

} // namespace socialxml
