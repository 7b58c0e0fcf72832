#include "parsing/DotGraphReader.h"
#include "common/Logger.h"
#include <cctype>
#include <sstream>

namespace ESM {

std::optional<Graph> DotGraphReader::parseContent(const std::string &content) {
    initParsing();

    GraphBuilder builder;
    TextScanner scanner(content, true);

    scanner.skipTrivia();
    scanner.consume("strict");
    scanner.skipTrivia();

    SourceLocation headerLocation = scanner.location();
    auto keyword = scanner.readIdentifier();
    if (!keyword || (*keyword != "digraph" && *keyword != "graph")) {
        addError("expected 'digraph'", headerLocation);
        return finish(builder);
    }
    if (*keyword == "graph") {
        addError("undirected graphs are not supported, use 'digraph'", headerLocation);
        return finish(builder);
    }

    scanner.skipTrivia();
    if (scanner.peek() != '{') {
        auto name = parseId(scanner);
        if (!name) {
            return finish(builder);
        }
        builder.setName(*name);
        scanner.skipTrivia();
    }

    if (!scanner.consume("{")) {
        addError("expected '{' after the graph name", scanner.location());
        return finish(builder);
    }

    while (true) {
        scanner.skipTrivia();
        if (scanner.atEnd()) {
            addError("expected '}' closing the graph", scanner.location());
            break;
        }
        if (scanner.consume("}")) {
            scanner.skipTrivia();
            if (!scanner.atEnd()) {
                addError("unexpected text after the graph", scanner.location());
            }
            break;
        }
        if (!parseStatement(scanner, builder)) {
            scanner.skipPast(';');
        }
    }

    return finish(builder);
}

bool DotGraphReader::parseStatement(TextScanner &scanner, GraphBuilder &builder) {
    SourceLocation location = scanner.location();
    auto first = parseId(scanner);
    if (!first) {
        return false;
    }
    scanner.skipTrivia();

    // Defaults for graph, node and edge attributes carry nothing we use
    if (*first == "graph" || *first == "node" || *first == "edge") {
        if (scanner.peek() == '[' && !parseAttributes(scanner)) {
            return false;
        }
        LOG_DEBUG("DotGraphReader: Ignoring '{}' default attributes", *first);
        scanner.skipTrivia();
        scanner.consume(";");
        return true;
    }

    // ID = ID sets a graph attribute; a "comment" documents the machine
    if (scanner.consume("=")) {
        scanner.skipTrivia();
        auto value = parseId(scanner);
        if (!value) {
            return false;
        }
        if (*first == "comment") {
            builder.addDocumentation(splitDoc(*value));
        }
        scanner.skipTrivia();
        scanner.consume(";");
        return true;
    }

    std::vector<std::pair<std::string, SourceLocation>> chain;
    chain.emplace_back(*first, location);
    while (scanner.startsWith("->")) {
        scanner.consume("->");
        scanner.skipTrivia();
        SourceLocation nodeLocation = scanner.location();
        auto node = parseId(scanner);
        if (!node) {
            return false;
        }
        chain.emplace_back(*node, nodeLocation);
        scanner.skipTrivia();
    }
    if (scanner.startsWith("--")) {
        addError("undirected edge '--' in a digraph", scanner.location());
        return false;
    }

    AttributeMap attributes;
    if (scanner.peek() == '[') {
        auto parsed = parseAttributes(scanner);
        if (!parsed) {
            return false;
        }
        attributes = std::move(*parsed);
        scanner.skipTrivia();
    }
    scanner.consume(";");

    std::vector<std::string> doc;
    if (auto it = attributes.find("comment"); it != attributes.end()) {
        doc = splitDoc(it->second);
    }

    if (chain.size() == 1) {
        std::optional<std::string> payload;
        if (auto it = attributes.find("type"); it != attributes.end()) {
            payload = it->second;
        }
        builder.addVertex(*first, payload, doc, location);
        return true;
    }

    std::optional<std::string> method;
    if (auto it = attributes.find("label"); it != attributes.end()) {
        method = it->second;
    }
    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        builder.addEdge(chain[i].first, chain[i + 1].first, method, doc, chain[i].second);
    }
    return true;
}

std::optional<std::string> DotGraphReader::parseId(TextScanner &scanner) {
    SourceLocation location = scanner.location();
    if (scanner.peek() == '"') {
        auto quoted = scanner.readQuotedString();
        if (!quoted) {
            addError("unterminated string", location);
        }
        return quoted;
    }

    if (auto identifier = scanner.readIdentifier()) {
        return identifier;
    }

    std::string numeral;
    while (std::isdigit(static_cast<unsigned char>(scanner.peek())) || scanner.peek() == '.' ||
           (numeral.empty() && scanner.peek() == '-')) {
        numeral += scanner.advance();
    }
    if (!numeral.empty()) {
        return numeral;
    }

    addError(fmt::format("expected an identifier, found '{}'", std::string(1, scanner.peek())), location);
    return std::nullopt;
}

std::optional<DotGraphReader::AttributeMap> DotGraphReader::parseAttributes(TextScanner &scanner) {
    AttributeMap attributes;

    // Several [..][..] lists may follow each other
    while (scanner.consume("[")) {
        while (true) {
            scanner.skipTrivia();
            if (scanner.consume("]")) {
                break;
            }
            auto key = parseId(scanner);
            if (!key) {
                return std::nullopt;
            }
            scanner.skipTrivia();
            if (!scanner.consume("=")) {
                addError(fmt::format("expected '=' after attribute '{}'", *key), scanner.location());
                return std::nullopt;
            }
            scanner.skipTrivia();
            auto value = parseId(scanner);
            if (!value) {
                return std::nullopt;
            }
            attributes[*key] = *value;

            scanner.skipTrivia();
            if (!scanner.consume(",")) {
                scanner.consume(";");
            }
        }
        scanner.skipTrivia();
    }
    return attributes;
}

std::vector<std::string> DotGraphReader::splitDoc(const std::string &text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace ESM
