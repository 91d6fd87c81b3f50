// diagnostics_json.hpp - JSON serialization for ValidationResult
#pragma once
#include "socialxml/diagnostics.hpp"
#include <string>

namespace socialxml {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"is_valid":..,"error_count":..,"errors":[{"line":..,"description":"..","type":".."}]}
std::string diagnostics_to_json(const ValidationResult& r);

// If SOCIALXML_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ValidationResult& r);

} // namespace socialxml
