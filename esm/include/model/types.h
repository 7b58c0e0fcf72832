#pragma once

#include <cstddef>

namespace ESM {

/**
 * @brief Structural role of a vertex, derived from its in/out degree
 */
enum class Role {
    ISOLATED,  // no incoming, no outgoing edges
    SOURCE,    // no incoming, at least one outgoing edge
    SINK,      // at least one incoming, no outgoing edges
    THROUGH    // both incoming and outgoing edges
};

enum class SafetyMode {
    CHECKED,  // handle methods re-verify the storage tag and abort on mismatch
    TRUSTED   // no runtime check; handle construction stays private to the machine
};

enum class EntryVisibility {
    PUBLIC,    // entry(), handles and terminal cases are public members
    PROTECTED  // only classes deriving from the machine can drive it
};

/**
 * @brief Position of a declaration in the authored source (1-based, 0 when unknown)
 */
struct SourceLocation {
    size_t line = 0;
    size_t column = 0;

    bool isKnown() const {
        return line != 0;
    }
};

inline bool isTerminal(Role role) {
    return role == Role::ISOLATED || role == Role::SINK;
}

inline const char *roleToString(Role role) {
    switch (role) {
    case Role::ISOLATED:
        return "isolated";
    case Role::SOURCE:
        return "source";
    case Role::SINK:
        return "sink";
    case Role::THROUGH:
        return "through";
    }
    return "unknown";
}

}  // namespace ESM
