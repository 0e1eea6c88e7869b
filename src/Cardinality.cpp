/**
 * @file Cardinality.cpp
 * @brief Implementation of the match-cardinality decision table
 */

#include "treedit/Cardinality.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace treedit {

Action choose_action(std::size_t match_count, DesiredState state, bool allow_multiple) noexcept {
    const bool present = state == DesiredState::Present;

    if (match_count == 0) {
        return present ? Action::Create : Action::NoOp;
    }
    if (match_count == 1) {
        return present ? Action::UpdateOne : Action::DeleteOne;
    }
    if (!allow_multiple) {
        return Action::Ambiguous;
    }
    return present ? Action::UpdateEach : Action::DeleteEach;
}

std::string to_string(DesiredState state) {
    return state == DesiredState::Present ? "present" : "absent";
}

std::string to_string(Action action) {
    switch (action) {
        case Action::NoOp:       return "no-op";
        case Action::Create:     return "create";
        case Action::UpdateOne:  return "update-one";
        case Action::DeleteOne:  return "delete-one";
        case Action::UpdateEach: return "update-each";
        case Action::DeleteEach: return "delete-each";
        case Action::Ambiguous:  return "ambiguous";
    }
    return "unknown";
}

DesiredState parse_desired_state(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "present") return DesiredState::Present;
    if (lower == "absent") return DesiredState::Absent;
    throw std::invalid_argument("Unknown state '" + text + "' (expected present or absent)");
}

} // namespace treedit
