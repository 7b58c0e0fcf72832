#include "parsing/TextScanner.h"
#include <cctype>

namespace ESM {

TextScanner::TextScanner(std::string text, bool hashComments) : text_(std::move(text)), hashComments_(hashComments) {}

char TextScanner::peek(size_t ahead) const {
    size_t index = position_.offset + ahead;
    return index < text_.size() ? text_[index] : '\0';
}

char TextScanner::advance() {
    if (atEnd()) {
        return '\0';
    }
    char c = text_[position_.offset++];
    if (c == '\n') {
        position_.line++;
        position_.column = 1;
    } else {
        position_.column++;
    }
    return c;
}

bool TextScanner::startsWith(std::string_view token) const {
    return text_.compare(position_.offset, token.size(), token) == 0;
}

bool TextScanner::consume(std::string_view token) {
    if (!startsWith(token)) {
        return false;
    }
    for (size_t i = 0; i < token.size(); ++i) {
        advance();
    }
    return true;
}

void TextScanner::skipTrivia(std::vector<std::string> *docs) {
    while (!atEnd()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (startsWith("///") && peek(3) != '/') {
            consume("///");
            std::string line;
            while (!atEnd() && peek() != '\n') {
                line += advance();
            }
            if (!line.empty() && line.front() == ' ') {
                line.erase(0, 1);
            }
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
                line.pop_back();
            }
            if (docs) {
                docs->push_back(line);
            }
        } else if (startsWith("//") || (hashComments_ && c == '#')) {
            skipPast('\n');
        } else if (startsWith("/*")) {
            consume("/*");
            while (!atEnd() && !consume("*/")) {
                advance();
            }
        } else {
            break;
        }
    }
}

std::optional<std::string> TextScanner::readIdentifier() {
    if (!isIdentifierStart(peek())) {
        return std::nullopt;
    }
    std::string identifier;
    while (isIdentifierChar(peek())) {
        identifier += advance();
    }
    return identifier;
}

std::optional<std::string> TextScanner::readQuotedString() {
    if (peek() != '"') {
        return std::nullopt;
    }

    Position start = position_;
    advance();

    std::string result;
    while (!atEnd()) {
        char c = advance();
        if (c == '"') {
            return result;
        }
        if (c == '\\' && !atEnd()) {
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            default:
                result += escaped;
            }
        } else {
            result += c;
        }
    }

    restore(start);
    return std::nullopt;
}

std::string TextScanner::readTypeExpression(std::string_view stops) {
    std::string type;
    int depth = 0;
    while (!atEnd()) {
        char c = peek();
        if (depth == 0 && stops.find(c) != std::string_view::npos) {
            break;
        }
        if (c == '<' || c == '(' || c == '[' || c == '{') {
            depth++;
        } else if ((c == '>' || c == ')' || c == ']' || c == '}') && depth > 0) {
            depth--;
        }
        type += advance();
    }

    size_t first = type.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = type.find_last_not_of(" \t\r\n");
    return type.substr(first, last - first + 1);
}

void TextScanner::skipPast(char c) {
    while (!atEnd()) {
        if (advance() == c) {
            return;
        }
    }
}

bool TextScanner::isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool TextScanner::isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace ESM
