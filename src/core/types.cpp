/**
 * @file types.cpp
 * @brief Implementation of core type helper functions
 */

#include "core/types.h"

namespace livetalk {

const char* role_name(Role role) {
    switch (role) {
        case Role::System:    return "system";
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

Role parse_role(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "assistant") return Role::Assistant;
    return Role::User;
}

Turn Turn::user(const std::string& content) {
    Turn turn;
    turn.role = Role::User;
    turn.content = content;
    turn.created_at_ms = now_ms();
    return turn;
}

Turn Turn::assistant(const std::string& content) {
    Turn turn;
    turn.role = Role::Assistant;
    turn.content = content;
    turn.created_at_ms = now_ms();
    return turn;
}

Turn Turn::system(const std::string& content) {
    Turn turn;
    turn.role = Role::System;
    turn.content = content;
    turn.created_at_ms = now_ms();
    return turn;
}

} // namespace livetalk
