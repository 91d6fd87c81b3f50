#include "socialxml/validate.hpp"
#include "socialxml/diagnostics_json.hpp"
#include "socialxml/env.hpp"
#include "socialxml/semantic_check.hpp"
#include "socialxml/structure_check.hpp"
#include "socialxml/token.hpp"
#include <algorithm>
#include <iterator>
#include <string>

namespace socialxml {

const char* to_string(ErrorKind kind){
    switch(kind){
    case ErrorKind::syntax: return "syntax";
    case ErrorKind::structure: return "structure";
    case ErrorKind::semantic: return "semantic";
    }
    return "structure";
}

ValidationResult validate(std::string_view document){
    ValidationResult r;
    if(trim(document).empty()){
        ErrorReporter rep{&r.errors};
        rep.structure(0, "No XML content to validate");
    } else {
        const LineView view = tokenize_lines(document);
        r.errors = check_structure(view);
        auto semantic = check_semantics(view);
        r.errors.insert(r.errors.end(), std::make_move_iterator(semantic.begin()), std::make_move_iterator(semantic.end()));
        std::stable_sort(r.errors.begin(), r.errors.end(),
                         [](const ValidationError& a, const ValidationError& b){ return a.line < b.line; });
        if(trace_enabled())
            trace("validate", "tokens=" + std::to_string(view.tokens.size())
                  + " defects=" + std::to_string(view.defects.size())
                  + " errors=" + std::to_string(r.errors.size()));
    }
    r.error_count = r.errors.size();
    r.is_valid = r.errors.empty();
    maybe_print_json(r);
    return r;
}

} // namespace socialxml
