// env.hpp - process environment configuration and trace output
#pragma once
#include "socialxml/format.hpp"
#include <string>

namespace socialxml {

struct Env {
    FormatOptions format;   // SOCIALXML_INDENT_WIDTH, SOCIALXML_WRAP_WIDTH
    bool trace = false;     // SOCIALXML_TRACE=1
    bool diag_json = false; // SOCIALXML_DIAG_JSON=1
};

// Read SOCIALXML_* variables. Unset or out-of-range values keep the defaults.
Env detectEnv();

// detectEnv().trace
bool trace_enabled();

// "[socialxml][channel] message" on stderr. Callers check trace_enabled() first so the
// message is only built when it is printed.
void trace(const char* channel, const std::string& message);

} // namespace socialxml
