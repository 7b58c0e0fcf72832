#include "model/GenerationError.h"
#include <spdlog/fmt/fmt.h>

namespace ESM {

std::string GenerationError::toString() const {
    if (location.isKnown()) {
        return fmt::format("{}:{}: error[{}]: {}", location.line, location.column, kindToString(kind), message);
    }
    return fmt::format("error[{}]: {}", kindToString(kind), message);
}

const char *GenerationError::kindToString(Kind kind) {
    switch (kind) {
    case Kind::DUPLICATE_VERTEX:
        return "DuplicateVertex";
    case Kind::UNKNOWN_VERTEX:
        return "UnknownVertex";
    case Kind::METHOD_NAME_COLLISION:
        return "MethodNameCollision";
    case Kind::RESERVED_NAME_COLLISION:
        return "ReservedNameCollision";
    case Kind::UNSUPPORTED_CONFIGURATION:
        return "UnsupportedConfiguration";
    case Kind::SYNTAX_ERROR:
        return "SyntaxError";
    }
    return "Unknown";
}

}  // namespace ESM
