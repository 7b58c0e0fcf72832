#include "config/ConfigLoader.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace ESM {

namespace {

const char *const KNOWN_KEYS[] = {"name",           "namespace",       "entry_type_name", "entry_visibility",
                                  "safety_mode",    "rename_methods",  "diagram_enabled", "attributes",
                                  "includes",       "template_parameters", "static_asserts"};

bool isKnownKey(const std::string &key) {
    for (const char *known : KNOWN_KEYS) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool ConfigLoader::loadFile(const std::string &path, GeneratorConfig &config) {
    if (!std::filesystem::exists(path)) {
        addError("Config file not found: " + path);
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        addError("Cannot open config file: " + path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG_DEBUG("ConfigLoader: Loading config from {}", path);
    return loadContent(buffer.str(), config);
}

bool ConfigLoader::loadContent(const std::string &content, GeneratorConfig &config) {
    std::string parseError;
    auto root = JsonUtils::parseJson(content, &parseError);
    if (!root) {
        addError("Invalid JSON config: " + parseError);
        return false;
    }
    return apply(*root, config);
}

bool ConfigLoader::apply(const Json::Value &root, GeneratorConfig &config) {
    if (!root.isObject()) {
        addError("Config root must be a JSON object");
        return false;
    }

    size_t errorsBefore = errorMessages_.size();

    for (const auto &key : root.getMemberNames()) {
        if (!isKnownKey(key)) {
            LOG_WARN("ConfigLoader: Ignoring unknown config key '{}'", key);
        }
    }

    auto readString = [&](const char *key, std::string &target) {
        if (!JsonUtils::hasKey(root, key)) {
            return;
        }
        if (!JsonUtils::isStringMember(root, key)) {
            addError(fmt::format("'{}' must be a string", key));
            return;
        }
        target = JsonUtils::getString(root, key);
    };

    auto readBool = [&](const char *key, bool &target) {
        if (!JsonUtils::hasKey(root, key)) {
            return;
        }
        if (!JsonUtils::isBoolMember(root, key)) {
            addError(fmt::format("'{}' must be a boolean", key));
            return;
        }
        target = JsonUtils::getBool(root, key, target);
    };

    auto readList = [&](const char *key, std::vector<std::string> &target) {
        if (!JsonUtils::hasKey(root, key)) {
            return;
        }
        if (!JsonUtils::isArrayMember(root, key)) {
            addError(fmt::format("'{}' must be an array of strings", key));
            return;
        }
        target = JsonUtils::getStringArray(root, key);
    };

    readString("name", config.machineName);
    readString("namespace", config.namespaceName);
    readString("entry_type_name", config.entryTypeName);
    readBool("rename_methods", config.renameMethods);
    readBool("diagram_enabled", config.diagramEnabled);
    readList("attributes", config.attributes);
    readList("includes", config.includes);
    readList("template_parameters", config.templateParameters);
    readList("static_asserts", config.staticAsserts);

    std::string visibility;
    readString("entry_visibility", visibility);
    if (!visibility.empty()) {
        auto parsed = parseEntryVisibility(visibility);
        if (parsed) {
            config.entryVisibility = *parsed;
        } else {
            addError(fmt::format("entry_visibility must be 'public' or 'protected', got '{}'", visibility));
        }
    }

    std::string safety;
    readString("safety_mode", safety);
    if (!safety.empty()) {
        auto parsed = parseSafetyMode(safety);
        if (parsed) {
            config.safetyMode = *parsed;
        } else {
            addError(fmt::format("safety_mode must be 'checked' or 'trusted', got '{}'", safety));
        }
    }

    return errorMessages_.size() == errorsBefore;
}

Json::Value ConfigLoader::toJson(const GeneratorConfig &config) {
    Json::Value root(Json::objectValue);
    root["name"] = config.machineName;
    root["namespace"] = config.namespaceName;
    root["entry_type_name"] = config.entryTypeName;
    root["entry_visibility"] = entryVisibilityToString(config.entryVisibility);
    root["safety_mode"] = safetyModeToString(config.safetyMode);
    root["rename_methods"] = config.renameMethods;
    root["diagram_enabled"] = config.diagramEnabled;

    Json::Value attributes(Json::arrayValue);
    for (const auto &attribute : config.attributes) {
        attributes.append(attribute);
    }
    root["attributes"] = attributes;

    Json::Value includes(Json::arrayValue);
    for (const auto &include : config.includes) {
        includes.append(include);
    }
    root["includes"] = includes;

    Json::Value templateParameters(Json::arrayValue);
    for (const auto &parameter : config.templateParameters) {
        templateParameters.append(parameter);
    }
    root["template_parameters"] = templateParameters;

    Json::Value staticAsserts(Json::arrayValue);
    for (const auto &condition : config.staticAsserts) {
        staticAsserts.append(condition);
    }
    root["static_asserts"] = staticAsserts;
    return root;
}

void ConfigLoader::addError(const std::string &message) {
    LOG_ERROR("ConfigLoader: {}", message);
    errorMessages_.push_back(message);
}

}  // namespace ESM
