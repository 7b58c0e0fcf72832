#pragma once

#include "model/types.h"
#include <optional>
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief Options consumed by the code generator
 *
 * Defaults match a plain `esm-codegen input.fsm` invocation. The machine name
 * falls back to the name supplied by the front end, then to the input file stem.
 */
struct GeneratorConfig {
    std::string machineName;
    std::string namespaceName;  // "a::b" nests; empty emits at global scope
    std::string entryTypeName = "Entry";
    EntryVisibility entryVisibility = EntryVisibility::PUBLIC;
    SafetyMode safetyMode = SafetyMode::CHECKED;
    bool renameMethods = true;
    bool diagramEnabled = false;
    std::vector<std::string> attributes;  // forwarded verbatim, e.g. "[[nodiscard]]"
    std::vector<std::string> includes;    // headers needed by payload types, e.g. "<string>"
    std::vector<std::string> templateParameters;  // e.g. "typename T"; non-empty makes the machine a class template
    std::vector<std::string> staticAsserts;       // conditions on the template parameters, e.g. "std::is_copy_constructible_v<T>"
};

const char *safetyModeToString(SafetyMode mode);
std::optional<SafetyMode> parseSafetyMode(const std::string &text);

const char *entryVisibilityToString(EntryVisibility visibility);
std::optional<EntryVisibility> parseEntryVisibility(const std::string &text);

}  // namespace ESM
