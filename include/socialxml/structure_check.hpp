// structure_check.hpp - stack-based tag balance checking
#pragma once
#include "socialxml/diagnostics.hpp"
#include "socialxml/token.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace socialxml {

struct TagStackEntry {
    std::string name;
    int line = 0; // line of the opening tag
};

enum class CloseMatch { matched, mismatched, unmatched };

// Close the innermost open element. A mismatched close still consumes the top entry so
// one bad close tag does not leave every ancestor reported as unclosed. The consumed
// entry is moved into *popped when given.
template<typename Entry>
CloseMatch pop_for_close(std::vector<Entry>& stack, std::string_view name, Entry* popped = nullptr){
    if(stack.empty()) return CloseMatch::unmatched;
    CloseMatch m = stack.back().name == name ? CloseMatch::matched : CloseMatch::mismatched;
    if(popped) *popped = std::move(stack.back());
    stack.pop_back();
    return m;
}

// Syntax errors (line defects, tags the grammar rejects) and structure errors
// (unmatched, mismatched, unclosed tags).
std::vector<ValidationError> check_structure(std::string_view document);
std::vector<ValidationError> check_structure(const LineView& view);

} // namespace socialxml
