#include "socialxml/semantic_check.hpp"
#include "socialxml/structure_check.hpp"
#include <utility>

namespace socialxml {

namespace {

struct Element {
    std::string name;
    int line = 0;
    std::string text;    // direct text children, space separated
    bool has_id = false; // user only
    bool id_from_attribute = false; // user only; an id="..." attribute wins over an <id> child
    bool has_name = false; // user only
};

inline bool is_declaration(const OpenTag& open){
    return !open.name.empty() && (open.name[0] == '?' || open.name[0] == '!');
}

// Walk elements in document order. on_open(element, tag, parent) runs before the element
// is pushed; on_close(element, parent) runs for every element closed by a matching close
// tag, and right after on_open for self-closing ones. parent is nullptr at the root and
// is only valid during the callback.
template<typename OnOpen, typename OnClose>
void walk_elements(const LineView& view, OnOpen&& on_open, OnClose&& on_close){
    std::vector<Element> stack;
    for(const auto& tok : view.tokens){
        if(const auto* open = std::get_if<OpenTag>(&tok.data)){
            if(!open->well_formed || is_declaration(*open)) continue;
            Element el{open->name, tok.line};
            Element* parent = stack.empty() ? nullptr : &stack.back();
            on_open(el, *open, parent);
            if(open->self_closing){ on_close(el, parent); continue; }
            stack.push_back(std::move(el));
        } else if(const auto* close = std::get_if<CloseTag>(&tok.data)){
            if(!close->well_formed) continue;
            Element el;
            if(pop_for_close(stack, close->name, &el) != CloseMatch::matched) continue;
            on_close(el, stack.empty() ? nullptr : &stack.back());
        } else if(!stack.empty()){
            auto& text = stack.back().text;
            if(!text.empty()) text += ' ';
            text += std::get<Text>(tok.data).content;
        }
    }
}

struct Reference { std::string id; int line; };

} // namespace

UserIdSet collect_user_ids(const LineView& view){
    UserIdSet ids;
    walk_elements(view,
        [&](Element& el, const OpenTag& open, Element*){
            if(open.name != "user") return;
            bool found = false;
            std::string v = collapse_whitespace(attribute_value(open.attributes, "id", &found));
            el.id_from_attribute = found;
            if(found && !v.empty()) ids.insert(std::move(v));
        },
        [&](const Element& el, Element* parent){
            if(el.name != "id" || !parent || parent->name != "user" || parent->id_from_attribute) return;
            std::string v = collapse_whitespace(el.text);
            if(!v.empty()) ids.insert(std::move(v));
        });
    return ids;
}

std::vector<ValidationError> check_semantics(std::string_view document){
    return check_semantics(tokenize_lines(document));
}

std::vector<ValidationError> check_semantics(const LineView& view){
    std::vector<ValidationError> errors;
    ErrorReporter rep{&errors};
    const UserIdSet all_ids = collect_user_ids(view);
    UserIdSet seen;
    std::vector<Reference> followers, followings;

    auto declare_user_id = [&](const std::string& id, int line){
        if(id.empty()){ rep.semantic(line, "Empty user ID"); return; }
        if(!seen.insert(id).second) rep.semantic(line, "Duplicate user ID '" + id + "'");
    };

    walk_elements(view,
        [&](Element& el, const OpenTag& open, Element*){
            if(el.name != "user") return;
            bool found = false;
            std::string id = collapse_whitespace(attribute_value(open.attributes, "id", &found));
            if(!found) return;
            el.has_id = true;
            el.id_from_attribute = true;
            declare_user_id(id, el.line);
        },
        [&](const Element& el, Element* parent){
            if(el.name == "id"){
                if(!parent) return;
                std::string id = collapse_whitespace(el.text);
                if(parent->name == "user"){
                    if(parent->id_from_attribute) return;
                    parent->has_id = true;
                    declare_user_id(id, el.line);
                } else if(id.empty()){
                    rep.semantic(el.line, "Empty user ID");
                } else if(parent->name == "follower"){
                    followers.push_back({std::move(id), el.line});
                } else if(parent->name == "following"){
                    followings.push_back({std::move(id), el.line});
                }
            } else if(el.name == "name"){
                if(parent && parent->name == "user") parent->has_name = true;
                if(collapse_whitespace(el.text).empty()) rep.semantic(el.line, "Empty user name");
            } else if(el.name == "body"){
                if(collapse_whitespace(el.text).empty()) rep.semantic(el.line, "Empty post body");
            } else if(el.name == "user"){
                if(!el.has_id) rep.semantic(el.line, "Missing user ID");
                if(!el.has_name) rep.semantic(el.line, "Missing user name");
            }
        });

    for(const auto& f : followers)
        if(!all_ids.count(f.id))
            rep.semantic(f.line, "Invalid follower reference: user ID '" + f.id + "' does not exist");
    for(const auto& f : followings)
        if(!all_ids.count(f.id))
            rep.semantic(f.line, "Invalid following reference: user ID '" + f.id + "' does not exist");
    return errors;
}

} // namespace socialxml
