#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <sstream>

namespace ESM {

std::optional<Json::Value> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder = createReaderBuilder();
    std::string parseErrors;
    std::istringstream jsonStream(jsonString);

    if (!Json::parseFromStream(readerBuilder, jsonStream, &root, &parseErrors)) {
        if (errorOut) {
            *errorOut = parseErrors;
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", parseErrors);
        return std::nullopt;
    }

    return root;
}

std::string JsonUtils::toPrettyString(const Json::Value &value) {
    Json::StreamWriterBuilder writerBuilder = createPrettyWriterBuilder();
    return Json::writeString(writerBuilder, value);
}

std::string JsonUtils::getString(const Json::Value &object, const std::string &key, const std::string &defaultValue) {
    if (!isStringMember(object, key)) {
        return defaultValue;
    }
    return object[key].asString();
}

bool JsonUtils::getBool(const Json::Value &object, const std::string &key, bool defaultValue) {
    if (!isBoolMember(object, key)) {
        return defaultValue;
    }
    return object[key].asBool();
}

std::vector<std::string> JsonUtils::getStringArray(const Json::Value &object, const std::string &key) {
    std::vector<std::string> result;
    if (!isArrayMember(object, key)) {
        return result;
    }

    for (const auto &element : object[key]) {
        if (element.isString()) {
            result.push_back(element.asString());
        } else {
            LOG_WARN("JsonUtils: Skipping non-string element in '{}'", key);
        }
    }
    return result;
}

bool JsonUtils::hasKey(const Json::Value &object, const std::string &key) {
    return object.isObject() && object.isMember(key) && !object[key].isNull();
}

bool JsonUtils::isStringMember(const Json::Value &object, const std::string &key) {
    return hasKey(object, key) && object[key].isString();
}

bool JsonUtils::isBoolMember(const Json::Value &object, const std::string &key) {
    return hasKey(object, key) && object[key].isBool();
}

bool JsonUtils::isArrayMember(const Json::Value &object, const std::string &key) {
    return hasKey(object, key) && object[key].isArray();
}

Json::StreamWriterBuilder JsonUtils::createPrettyWriterBuilder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return builder;
}

Json::CharReaderBuilder JsonUtils::createReaderBuilder() {
    Json::CharReaderBuilder builder;
    // Config files are hand-written; tolerate comments but reject duplicate keys
    builder["allowComments"] = true;
    builder["rejectDupKeys"] = true;
    return builder;
}

}  // namespace ESM
