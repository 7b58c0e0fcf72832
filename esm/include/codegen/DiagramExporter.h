#pragma once

#include "model/GraphModel.h"
#include <string>

namespace ESM {

/**
 * @brief Turns a graph into documentation text for the generated header
 *
 * Implementations must be pure: the result depends only on the graph, and
 * rendering never influences the generated code itself.
 */
class IDiagramRenderer {
public:
    virtual ~IDiagramRenderer() = default;

    /**
     * @brief Render the graph
     * @return Multi-line text, embedded line by line into a doc comment
     */
    virtual std::string render(const Graph &graph) const = 0;
};

/**
 * @brief Text renderings of a graph in DOT and Mermaid syntax
 *
 * Vertices and edges appear in declaration order. Mermaid edges are labelled
 * with their resolved method names; DOT labels carry explicit overrides only.
 */
class DiagramExporter {
public:
    explicit DiagramExporter(bool renameMethods = true) : renameMethods_(renameMethods) {}

    /**
     * @brief Graphviz rendering
     *
     * Payload types, method overrides and documentation are written as the
     * `type`, `label` and `comment` attributes understood by DotGraphReader,
     * so the output reads back into an equivalent graph.
     */
    std::string toDot(const Graph &graph) const;

    /**
     * @brief Mermaid flowchart (`graph LR`) rendering, without code fences
     */
    std::string toMermaid(const Graph &graph) const;

private:
    std::string methodNameFor(const Edge &edge) const;

    bool renameMethods_;
};

/**
 * @brief Default renderer: a fenced Mermaid block
 */
class MermaidRenderer : public IDiagramRenderer {
public:
    explicit MermaidRenderer(bool renameMethods = true) : exporter_(renameMethods) {}

    std::string render(const Graph &graph) const override;

private:
    DiagramExporter exporter_;
};

}  // namespace ESM
