#include "socialxml/structure_check.hpp"

namespace socialxml {

std::vector<ValidationError> check_structure(std::string_view document){
    return check_structure(tokenize_lines(document));
}

std::vector<ValidationError> check_structure(const LineView& view){
    std::vector<ValidationError> errors;
    ErrorReporter rep{&errors};
    for(const auto& d : view.defects){
        if(d.kind == LineDefectKind::missing_close) rep.syntax(d.line, "Malformed tag: missing closing '>'");
        else rep.syntax(d.line, "Malformed tag: missing opening '<'");
    }

    std::vector<TagStackEntry> stack;
    for(const auto& tok : view.tokens){
        if(const auto* open = std::get_if<OpenTag>(&tok.data)){
            if(!open->well_formed){ rep.syntax(tok.line, "Malformed tag '" + open->raw + "'"); continue; }
            if(open->self_closing) continue;
            stack.push_back(TagStackEntry{open->name, tok.line});
        } else if(const auto* close = std::get_if<CloseTag>(&tok.data)){
            if(!close->well_formed){ rep.syntax(tok.line, "Malformed tag '" + close->raw + "'"); continue; }
            std::string expected = stack.empty() ? std::string() : stack.back().name;
            switch(pop_for_close(stack, close->name)){
            case CloseMatch::unmatched:
                rep.structure(tok.line, "Closing tag '</" + close->name + ">' without matching opening tag");
                break;
            case CloseMatch::mismatched:
                rep.structure(tok.line, "Mismatched tags: expected '</" + expected + ">' but found '</" + close->name + ">'");
                break;
            case CloseMatch::matched:
                break;
            }
        }
    }

    for(const auto& e : stack)
        rep.structure(e.line, "Unclosed tag '<" + e.name + ">'");
    return errors;
}

} // namespace socialxml
