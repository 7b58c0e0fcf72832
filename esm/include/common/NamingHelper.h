#pragma once

#include <algorithm>
#include <iterator>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ESM {
namespace NamingHelper {

/**
 * @brief C++ keywords and alternative tokens that cannot name a type or a method
 */
inline bool isCppKeyword(std::string_view name) {
    static constexpr std::string_view keywords[] = {
        "alignas",      "alignof",     "and",          "and_eq",       "asm",           "auto",
        "bitand",       "bitor",       "bool",         "break",        "case",          "catch",
        "char",         "char8_t",     "char16_t",     "char32_t",     "class",         "compl",
        "concept",      "const",       "consteval",    "constexpr",    "constinit",     "const_cast",
        "continue",     "co_await",    "co_return",    "co_yield",     "decltype",      "default",
        "delete",       "do",          "double",       "dynamic_cast", "else",          "enum",
        "explicit",     "export",      "extern",       "false",        "float",         "for",
        "friend",       "goto",        "if",           "inline",       "int",           "long",
        "mutable",      "namespace",   "new",          "noexcept",     "not",           "not_eq",
        "nullptr",      "operator",    "or",           "or_eq",        "private",       "protected",
        "public",       "register",    "reinterpret_cast", "requires", "return",        "short",
        "signed",       "sizeof",      "static",       "static_assert", "static_cast",  "struct",
        "switch",       "template",    "this",         "thread_local", "throw",         "true",
        "try",          "typedef",     "typeid",       "typename",     "union",         "unsigned",
        "using",        "virtual",     "void",         "volatile",     "wchar_t",       "while",
        "xor",          "xor_eq"};
    return std::find(std::begin(keywords), std::end(keywords), name) != std::end(keywords);
}

inline bool isValidIdentifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name.front())) && name.front() != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
}

/**
 * @brief Identifiers reserved to the implementation (leading underscore + uppercase, or "__")
 */
inline bool isImplementationReserved(std::string_view name) {
    if (name.find("__") != std::string_view::npos) {
        return true;
    }
    return name.size() >= 2 && name[0] == '_' && std::isupper(static_cast<unsigned char>(name[1]));
}

/**
 * @brief "RedAmber" -> "red_amber"; every uppercase letter after the first starts a new word
 */
inline std::string toSnakeCase(std::string_view name) {
    std::string snake;
    snake.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        auto c = static_cast<unsigned char>(name[i]);
        if (i > 0 && std::isupper(c)) {
            snake.push_back('_');
        }
        snake.push_back(static_cast<char>(std::tolower(c)));
    }
    return snake;
}

inline std::string escapeKeyword(std::string name) {
    if (isCppKeyword(name)) {
        name.push_back('_');
    }
    return name;
}

/**
 * @brief Method name of a transition into targetName
 * @param methodOverride Explicit name from the author, used verbatim when present
 * @param renameMethods Convert the target name to snake_case instead of copying it
 */
inline std::string resolveMethodName(const std::optional<std::string> &methodOverride, const std::string &targetName,
                                     bool renameMethods) {
    if (methodOverride) {
        return escapeKeyword(*methodOverride);
    }
    return escapeKeyword(renameMethods ? toSnakeCase(targetName) : targetName);
}

/**
 * @brief Collapse whitespace runs and trim, so "std::map<int,  T>" equals "std::map<int, T>"
 */
inline std::string normalizeTypeExpression(std::string_view type) {
    std::string result;
    bool pendingSpace = false;
    for (char c : type) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

/**
 * @brief Identifiers of a type expression that are looked up unqualified
 *
 * "std::map<Key, ns::Value>" yields {"std", "Key"}: names after `::` are found
 * inside their qualifier and never by plain lookup.
 */
inline std::vector<std::string> unqualifiedIdentifiers(std::string_view type) {
    std::vector<std::string> names;
    size_t i = 0;
    while (i < type.size()) {
        auto c = static_cast<unsigned char>(type[i]);
        if (!std::isalpha(c) && c != '_') {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < type.size() &&
               (std::isalnum(static_cast<unsigned char>(type[i])) || type[i] == '_')) {
            ++i;
        }

        size_t before = start;
        while (before > 0 && std::isspace(static_cast<unsigned char>(type[before - 1]))) {
            --before;
        }
        bool qualified = before >= 2 && type.substr(before - 2, 2) == "::";
        if (!qualified) {
            names.emplace_back(type.substr(start, i - start));
        }
    }
    return names;
}

/**
 * @brief Declared name of a template parameter: "typename T = int" -> "T"
 * @return Empty when the declaration ends without an identifier
 */
inline std::string templateParameterName(std::string_view declaration) {
    size_t end = declaration.find('=');
    if (end == std::string_view::npos) {
        end = declaration.size();
    }
    while (end > 0 && std::isspace(static_cast<unsigned char>(declaration[end - 1]))) {
        --end;
    }
    size_t start = end;
    while (start > 0 &&
           (std::isalnum(static_cast<unsigned char>(declaration[start - 1])) || declaration[start - 1] == '_')) {
        --start;
    }
    std::string_view name = declaration.substr(start, end - start);
    if (!isValidIdentifier(name) || isCppKeyword(name)) {
        return "";
    }
    return std::string(name);
}

}  // namespace NamingHelper
}  // namespace ESM
