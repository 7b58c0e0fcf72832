#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief JSON helpers shared by the configuration loader and the CLI
 *
 * Lookups are lenient: a missing key or a value of the wrong type yields the
 * default. Callers that need strict typing check with the is*Member helpers first.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text into Json::Value
     * @param jsonString Input JSON text
     * @param errorOut Optional error message output
     * @return Parsed value or nullopt on failure
     */
    static std::optional<Json::Value> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toPrettyString(const Json::Value &value);

    static std::string getString(const Json::Value &object, const std::string &key,
                                 const std::string &defaultValue = "");

    static bool getBool(const Json::Value &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Read an array of strings
     * @return Elements in order; non-string elements are skipped
     */
    static std::vector<std::string> getStringArray(const Json::Value &object, const std::string &key);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const Json::Value &object, const std::string &key);

    static bool isStringMember(const Json::Value &object, const std::string &key);
    static bool isBoolMember(const Json::Value &object, const std::string &key);
    static bool isArrayMember(const Json::Value &object, const std::string &key);

private:
    static Json::StreamWriterBuilder createPrettyWriterBuilder();
    static Json::CharReaderBuilder createReaderBuilder();
};

}  // namespace ESM
