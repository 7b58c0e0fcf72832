#include "parsing/DslGraphReader.h"
#include "common/Logger.h"

namespace ESM {

std::optional<Graph> DslGraphReader::parseContent(const std::string &content) {
    initParsing();

    GraphBuilder builder;
    TextScanner scanner(content);

    std::vector<std::string> docs;
    scanner.skipTrivia(&docs);

    // "Name {" opens the wrapper; anything else is a bare statement list
    bool wrapped = false;
    TextScanner::Position start = scanner.position();
    if (auto name = scanner.readIdentifier()) {
        scanner.skipTrivia();
        if (scanner.consume("{")) {
            wrapped = true;
            builder.setName(*name);
            builder.addDocumentation(docs);
            docs.clear();
            LOG_DEBUG("DslGraphReader: Machine '{}'", *name);
        } else {
            scanner.restore(start);
        }
    }

    while (true) {
        scanner.skipTrivia(&docs);
        if (scanner.atEnd() || (wrapped && scanner.peek() == '}')) {
            break;
        }
        if (!parseStatement(scanner, builder, docs)) {
            scanner.skipPast(';');
        }
        docs.clear();
    }

    if (wrapped) {
        if (!scanner.consume("}")) {
            addError("expected '}' closing the state machine", scanner.location());
        } else {
            scanner.skipTrivia();
            if (!scanner.atEnd()) {
                addError("unexpected text after the state machine", scanner.location());
            }
        }
    }

    return finish(builder);
}

bool DslGraphReader::parseStatement(TextScanner &scanner, GraphBuilder &builder,
                                    const std::vector<std::string> &docs) {
    SourceLocation location = scanner.location();
    auto first = scanner.readIdentifier();
    if (!first) {
        addError(fmt::format("expected a state name, found '{}'", std::string(1, scanner.peek())), location);
        return false;
    }

    scanner.skipTrivia();
    std::optional<std::string> payload;
    if (scanner.peek() == ':') {
        payload = parsePayload(scanner);
        if (!payload) {
            return false;
        }
        scanner.skipTrivia();
    }

    if (scanner.consume(";")) {
        builder.addVertex(*first, payload, docs, location);
        return true;
    }

    if (scanner.peek() != '-') {
        addError(fmt::format("expected ';', ':' or an arrow after '{}'", *first), scanner.location());
        return false;
    }

    if (payload) {
        builder.addVertex(*first, payload, {}, location);
    }

    std::string current = *first;
    while (true) {
        SourceLocation arrowLocation = scanner.location();
        auto arrow = parseArrow(scanner);
        if (!arrow) {
            return false;
        }

        scanner.skipTrivia();
        SourceLocation targetLocation = scanner.location();
        auto target = scanner.readIdentifier();
        if (!target) {
            addError("expected a state name after the arrow", targetLocation);
            return false;
        }

        scanner.skipTrivia();
        if (scanner.peek() == ':') {
            auto targetPayload = parsePayload(scanner);
            if (!targetPayload) {
                return false;
            }
            builder.addVertex(*target, targetPayload, {}, targetLocation);
            scanner.skipTrivia();
        }

        std::vector<std::string> edgeDocs = docs;
        if (arrow->doc) {
            if (!edgeDocs.empty()) {
                edgeDocs.emplace_back();
            }
            edgeDocs.push_back(*arrow->doc);
        }
        builder.addEdge(current, *target, arrow->method, edgeDocs, arrowLocation);
        current = *target;

        if (scanner.consume(";")) {
            return true;
        }
        if (scanner.peek() != '-') {
            addError(fmt::format("expected ';' or an arrow after '{}'", current), scanner.location());
            return false;
        }
    }
}

std::optional<std::string> DslGraphReader::parsePayload(TextScanner &scanner) {
    scanner.consume(":");
    scanner.skipTrivia();
    SourceLocation location = scanner.location();
    std::string type = scanner.readTypeExpression(";-}");
    if (type.empty()) {
        addError("expected a payload type after ':'", location);
        return std::nullopt;
    }
    return type;
}

std::optional<DslGraphReader::Arrow> DslGraphReader::parseArrow(TextScanner &scanner) {
    SourceLocation location = scanner.location();
    if (scanner.consume("->") || scanner.consume("-->")) {
        return Arrow{};
    }

    scanner.consume("-");
    scanner.consume("-");
    scanner.skipTrivia();

    Arrow arrow;
    if (scanner.peek() == '"') {
        arrow.doc = scanner.readQuotedString();
        if (!arrow.doc) {
            addError("unterminated string in arrow", scanner.location());
            return std::nullopt;
        }
    } else if (auto method = scanner.readIdentifier()) {
        arrow.method = *method;
    } else {
        addError("expected '->', '-->', '-\"doc\"->' or '-method->'", location);
        return std::nullopt;
    }

    scanner.skipTrivia();
    if (!scanner.consume("->") && !scanner.consume("-->")) {
        addError("expected '->' closing the arrow", scanner.location());
        return std::nullopt;
    }
    return arrow;
}

}  // namespace ESM
