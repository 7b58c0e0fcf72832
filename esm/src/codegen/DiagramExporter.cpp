#include "codegen/DiagramExporter.h"
#include "common/NamingHelper.h"
#include <sstream>

namespace ESM {

namespace {

std::string escapeDotString(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

// Mermaid labels are quoted; these characters must be entity-encoded inside them
std::string escapeMermaidLabel(const std::string &text) {
    std::string result;
    for (char c : text) {
        switch (c) {
        case '"':
            result += "#quot;";
            break;
        case '<':
            result += "#lt;";
            break;
        case '>':
            result += "#gt;";
            break;
        default:
            result += c;
        }
    }
    return result;
}

// Documentation lines joined by DOT's \n escape
std::string joinDocEscaped(const std::vector<std::string> &doc) {
    std::string joined;
    for (size_t i = 0; i < doc.size(); ++i) {
        if (i > 0) {
            joined += "\\n";
        }
        joined += escapeDotString(doc[i]);
    }
    return joined;
}

}  // namespace

std::string DiagramExporter::methodNameFor(const Edge &edge) const {
    return NamingHelper::resolveMethodName(edge.methodOverride, edge.target, renameMethods_);
}

std::string DiagramExporter::toDot(const Graph &graph) const {
    std::stringstream ss;
    ss << "digraph " << (graph.getName().empty() ? "G" : graph.getName()) << " {\n";

    for (const auto &vertex : graph.getVertices()) {
        std::vector<std::string> attrs;
        if (vertex.hasPayload()) {
            attrs.push_back("type=\"" + escapeDotString(*vertex.payloadType) + "\"");
        }
        if (!vertex.doc.empty()) {
            attrs.push_back("comment=\"" + joinDocEscaped(vertex.doc) + "\"");
        }

        ss << "    " << vertex.name;
        if (!attrs.empty()) {
            ss << " [";
            for (size_t i = 0; i < attrs.size(); ++i) {
                ss << (i > 0 ? ", " : "") << attrs[i];
            }
            ss << "]";
        }
        ss << ";\n";
    }

    for (const auto &edge : graph.getEdges()) {
        std::vector<std::string> attrs;
        if (edge.methodOverride) {
            attrs.push_back("label=\"" + escapeDotString(*edge.methodOverride) + "\"");
        }
        if (!edge.doc.empty()) {
            attrs.push_back("comment=\"" + joinDocEscaped(edge.doc) + "\"");
        }

        ss << "    " << edge.source << " -> " << edge.target;
        if (!attrs.empty()) {
            ss << " [";
            for (size_t i = 0; i < attrs.size(); ++i) {
                ss << (i > 0 ? ", " : "") << attrs[i];
            }
            ss << "]";
        }
        ss << ";\n";
    }

    ss << "}\n";
    return ss.str();
}

std::string DiagramExporter::toMermaid(const Graph &graph) const {
    std::stringstream ss;
    ss << "graph LR\n";

    for (const auto &vertex : graph.getVertices()) {
        std::string label = vertex.name;
        if (vertex.hasPayload()) {
            label += ": " + *vertex.payloadType;
        }
        ss << "    " << vertex.name << "[\"" << escapeMermaidLabel(label) << "\"]\n";
    }

    for (const auto &edge : graph.getEdges()) {
        ss << "    " << edge.source << " -->|" << methodNameFor(edge) << "| " << edge.target << "\n";
    }

    return ss.str();
}

std::string MermaidRenderer::render(const Graph &graph) const {
    return "```mermaid\n" + exporter_.toMermaid(graph) + "```\n";
}

}  // namespace ESM
