#pragma once

#include "model/types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ESM {

/**
 * @brief Character cursor shared by the text front ends
 *
 * Tracks line and column (both 1-based) so every diagnostic can point back
 * into the source. Understands `//` and block comments, and optionally `#`
 * line comments for DOT input.
 */
class TextScanner {
public:
    struct Position {
        size_t offset = 0;
        size_t line = 1;
        size_t column = 1;
    };

    explicit TextScanner(std::string text, bool hashComments = false);

    bool atEnd() const {
        return position_.offset >= text_.size();
    }

    /**
     * @return Character at the given distance from the cursor, '\0' past the end
     */
    char peek(size_t ahead = 0) const;

    char advance();

    bool startsWith(std::string_view token) const;

    /**
     * @brief Consume token if the input continues with it
     */
    bool consume(std::string_view token);

    /**
     * @brief Skip whitespace and comments
     * @param docs When given, receives the text of `///` lines in order
     */
    void skipTrivia(std::vector<std::string> *docs = nullptr);

    std::optional<std::string> readIdentifier();

    /**
     * @brief Read a double-quoted string, resolving \" \\ \n and \t
     * @return Unescaped text, or nullopt if the cursor is not at a quote or the string is unterminated
     */
    std::optional<std::string> readQuotedString();

    /**
     * @brief Read a C++ type expression up to a stop character outside brackets
     * @param stops Characters ending the expression at bracket depth zero
     * @return Trimmed text, empty if nothing was read
     */
    std::string readTypeExpression(std::string_view stops);

    /**
     * @brief Advance past the next occurrence of c, or to the end
     */
    void skipPast(char c);

    SourceLocation location() const {
        return SourceLocation{position_.line, position_.column};
    }

    Position position() const {
        return position_;
    }

    void restore(const Position &position) {
        position_ = position;
    }

    static bool isIdentifierStart(char c);
    static bool isIdentifierChar(char c);

private:
    std::string text_;
    Position position_;
    bool hashComments_;
};

}  // namespace ESM
