// validate.hpp - combined structural + semantic validation
#pragma once
#include "socialxml/diagnostics.hpp"
#include <string_view>

namespace socialxml {

// Runs every check to completion and returns all errors sorted by line (stable on
// ties, structural before semantic on the same line). Empty or whitespace-only input
// yields the single structure error "No XML content to validate".
ValidationResult validate(std::string_view document);

} // namespace socialxml
