#pragma once

#include "config/GeneratorConfig.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief Reads GeneratorConfig from JSON
 *
 * Recognized keys: name, namespace, entry_type_name, entry_visibility,
 * safety_mode, rename_methods, diagram_enabled, attributes, includes,
 * template_parameters, static_asserts.
 * Keys absent from the document keep the values already in the target config,
 * so a file can be layered over defaults and CLI flags layered over the file.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief Load a JSON config file on top of config
     * @return false if the file is unreadable or holds invalid values
     */
    bool loadFile(const std::string &path, GeneratorConfig &config);

    bool loadContent(const std::string &content, GeneratorConfig &config);

    bool apply(const Json::Value &root, GeneratorConfig &config);

    /**
     * @brief Serialize back to JSON (used by `esm-codegen --print-config`)
     */
    static Json::Value toJson(const GeneratorConfig &config);

    bool hasErrors() const {
        return !errorMessages_.empty();
    }

    const std::vector<std::string> &getErrorMessages() const {
        return errorMessages_;
    }

private:
    void addError(const std::string &message);

    std::vector<std::string> errorMessages_;
};

}  // namespace ESM
