#include "config/GeneratorConfig.h"

namespace ESM {

const char *safetyModeToString(SafetyMode mode) {
    return mode == SafetyMode::TRUSTED ? "trusted" : "checked";
}

std::optional<SafetyMode> parseSafetyMode(const std::string &text) {
    if (text == "checked") {
        return SafetyMode::CHECKED;
    }
    if (text == "trusted") {
        return SafetyMode::TRUSTED;
    }
    return std::nullopt;
}

const char *entryVisibilityToString(EntryVisibility visibility) {
    return visibility == EntryVisibility::PROTECTED ? "protected" : "public";
}

std::optional<EntryVisibility> parseEntryVisibility(const std::string &text) {
    if (text == "public") {
        return EntryVisibility::PUBLIC;
    }
    if (text == "protected") {
        return EntryVisibility::PROTECTED;
    }
    return std::nullopt;
}

}  // namespace ESM
