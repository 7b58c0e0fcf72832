#pragma once

#include "model/types.h"
#include <cstddef>
#include <limits>
#include <string>
#include <utility>

namespace ESM {

/**
 * @brief Structured generation-time diagnostic
 *
 * Carries the offending vertex/edge identity and its declaration position so a
 * front end can map it back to the authored source.
 */
struct GenerationError {
    enum class Kind {
        DUPLICATE_VERTEX,
        UNKNOWN_VERTEX,
        METHOD_NAME_COLLISION,
        RESERVED_NAME_COLLISION,
        UNSUPPORTED_CONFIGURATION,
        SYNTAX_ERROR
    };

    static constexpr size_t NO_POSITION = std::numeric_limits<size_t>::max();

    Kind kind;
    std::string subject;  // vertex the diagnostic is about (source vertex for edge errors)
    std::string name;     // offending name
    size_t position = NO_POSITION;  // declaration index of the offending vertex or edge
    SourceLocation location;
    std::string message;

    GenerationError(Kind k, std::string subj, std::string offendingName, std::string msg,
                    size_t pos = NO_POSITION, SourceLocation loc = {})
        : kind(k), subject(std::move(subj)), name(std::move(offendingName)), position(pos), location(loc),
          message(std::move(msg)) {}

    /**
     * @brief Render as "line:col: error[kind]: message" (location omitted when unknown)
     */
    std::string toString() const;

    static const char *kindToString(Kind kind);
};

}  // namespace ESM
