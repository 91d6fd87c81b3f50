// semantic_check.hpp - schema-level checks for the social network dialect
#pragma once
#include "socialxml/diagnostics.hpp"
#include "socialxml/token.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace socialxml {

using UserIdSet = std::unordered_set<std::string>;

// Pass 1: ids declared by user elements, either as an <id> child of <user> or as the
// id="..." attribute of a <user> tag.
UserIdSet collect_user_ids(const LineView& view);

// Pass 2: empty id/name/body, duplicate user ids, users without an id, and
// follower/following ids that no user declares.
//
// Both passes walk the same line view with the structural validator's pop rule, so an
// element seen here is the element the structural check saw.
std::vector<ValidationError> check_semantics(std::string_view document);
std::vector<ValidationError> check_semantics(const LineView& view);

} // namespace socialxml
