#include "parsing/ScxmlGraphReader.h"
#include "common/Logger.h"
#include <sstream>

namespace ESM {

namespace {

// "code:state" matches "state"
bool matchNodeName(const std::string &nodeName, const std::string &baseName) {
    if (nodeName == baseName) {
        return true;
    }
    size_t colonPos = nodeName.find(':');
    return colonPos != std::string::npos && nodeName.substr(colonPos + 1) == baseName;
}

std::string trim(const std::string &text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<const xmlpp::Element *> childElements(const xmlpp::Element *element) {
    std::vector<const xmlpp::Element *> result;
    for (auto child : element->get_children()) {
        if (auto childElement = dynamic_cast<const xmlpp::Element *>(child)) {
            result.push_back(childElement);
        }
    }
    return result;
}

bool isStateElement(const std::string &name) {
    return matchNodeName(name, "state") || matchNodeName(name, "final");
}

}  // namespace

std::optional<Graph> ScxmlGraphReader::parseContent(const std::string &content) {
    initParsing();
    GraphBuilder builder;

    try {
        xmlpp::DomParser parser;
        parser.set_validate(false);
        parser.set_substitute_entities(true);
        parser.parse_memory(content);

        parseDocument(parser.get_document(), builder);
    } catch (const std::exception &ex) {
        addError("Exception while parsing SCXML: " + std::string(ex.what()));
    }

    return finish(builder);
}

void ScxmlGraphReader::parseDocument(xmlpp::Document *doc, GraphBuilder &builder) {
    if (!doc) {
        addError("Null document");
        return;
    }

    const xmlpp::Element *root = doc->get_root_node();
    if (!root) {
        addError("No root element found");
        return;
    }
    if (!matchNodeName(root->get_name(), "scxml")) {
        addError("Root element is not 'scxml', found: " + std::string(root->get_name()), locationOf(root));
        return;
    }

    if (auto name = attributeValue(root, "name")) {
        builder.setName(*name);
    }
    builder.addDocumentation(documentationOf(root));

    // All states first, so vertex order follows the document even when transitions point forward
    std::vector<const xmlpp::Element *> states;
    for (const auto *element : childElements(root)) {
        std::string name = element->get_name();
        if (isStateElement(name)) {
            states.push_back(element);
            parseState(element, builder);
        } else if (matchNodeName(name, "parallel")) {
            addError("parallel states are not supported", locationOf(element));
        } else if (!matchNodeName(name, "documentation")) {
            LOG_DEBUG("ScxmlGraphReader: Ignoring <{}> at line {}", name, locationOf(element).line);
        }
    }

    for (const auto *state : states) {
        parseTransitions(state, builder);
    }

    LOG_DEBUG("ScxmlGraphReader: Read {} states", states.size());
}

void ScxmlGraphReader::parseState(const xmlpp::Element *stateElement, GraphBuilder &builder) {
    SourceLocation location = locationOf(stateElement);
    auto id = attributeValue(stateElement, "id");
    if (!id || id->empty()) {
        addError("state without an 'id' attribute", location);
        return;
    }

    for (const auto *child : childElements(stateElement)) {
        std::string childName = child->get_name();
        if (isStateElement(childName) || matchNodeName(childName, "parallel")) {
            addError(fmt::format("compound state '{}' is not supported", *id), locationOf(child));
            return;
        }
    }

    builder.addVertex(*id, attributeValue(stateElement, "payload"), documentationOf(stateElement), location);
}

void ScxmlGraphReader::parseTransitions(const xmlpp::Element *stateElement, GraphBuilder &builder) {
    auto source = attributeValue(stateElement, "id");
    if (!source || source->empty()) {
        return;
    }

    for (const auto *child : childElements(stateElement)) {
        if (!matchNodeName(child->get_name(), "transition")) {
            continue;
        }

        SourceLocation location = locationOf(child);
        auto target = attributeValue(child, "target");
        if (!target || trim(*target).empty()) {
            addError(fmt::format("transition in '{}' has no target", *source), location);
            continue;
        }
        std::string targetId = trim(*target);
        if (targetId.find_first_of(" \t\r\n") != std::string::npos) {
            addError(fmt::format("transition in '{}' has more than one target", *source), location);
            continue;
        }

        std::optional<std::string> method;
        if (auto event = attributeValue(child, "event"); event && !trim(*event).empty()) {
            method = trim(*event);
        }
        builder.addEdge(*source, targetId, method, documentationOf(child), location);
    }
}

std::optional<std::string> ScxmlGraphReader::attributeValue(const xmlpp::Element *element, const char *name) {
    auto attr = element->get_attribute(name);
    if (!attr) {
        return std::nullopt;
    }
    return std::string(attr->get_value());
}

std::vector<std::string> ScxmlGraphReader::documentationOf(const xmlpp::Element *element) {
    std::string text;
    if (auto docAttr = attributeValue(element, "doc")) {
        text = *docAttr;
    }

    for (const auto *child : childElements(element)) {
        if (!matchNodeName(child->get_name(), "documentation")) {
            continue;
        }
        if (!text.empty()) {
            text += '\n';
        }
        for (auto node : child->get_children()) {
            if (auto textNode = dynamic_cast<const xmlpp::TextNode *>(node)) {
                text += textNode->get_content();
            }
        }
    }

    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(trim(line));
    }
    while (!lines.empty() && lines.front().empty()) {
        lines.erase(lines.begin());
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

SourceLocation ScxmlGraphReader::locationOf(const xmlpp::Node *node) {
    return SourceLocation{static_cast<size_t>(node->get_line()), 0};
}

}  // namespace ESM
