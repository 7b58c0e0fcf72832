#pragma once

#include "model/types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ESM {

/**
 * @brief A named state of the machine, optionally carrying a payload
 */
struct Vertex {
    std::string name;
    std::optional<std::string> payloadType;  // opaque C++ type expression
    std::vector<std::string> doc;
    size_t index = 0;  // declaration order
    SourceLocation location;
    bool implicit = false;  // only ever mentioned as an edge endpoint

    bool hasPayload() const {
        return payloadType.has_value();
    }
};

/**
 * @brief A directed, named transition between two vertices
 *
 * Endpoints are held by name and resolved against the owning Graph.
 */
struct Edge {
    std::string source;
    std::string target;
    std::optional<std::string> methodOverride;
    std::vector<std::string> doc;
    size_t index = 0;  // declaration order
    SourceLocation location;
};

/**
 * @brief Immutable graph of vertices and edges in declaration order
 *
 * Built by GraphBuilder, which guarantees unique vertex names and resolvable
 * endpoints. Other producers may construct a Graph directly; GraphValidator
 * re-checks those invariants.
 */
class Graph {
public:
    Graph() = default;
    Graph(std::string name, std::vector<std::string> doc, std::vector<Vertex> vertices, std::vector<Edge> edges);

    const std::string &getName() const {
        return name_;
    }

    const std::vector<std::string> &getDocumentation() const {
        return doc_;
    }

    const std::vector<Vertex> &getVertices() const {
        return vertices_;
    }

    const std::vector<Edge> &getEdges() const {
        return edges_;
    }

    bool empty() const {
        return vertices_.empty();
    }

    /**
     * @brief Look up a vertex by name
     * @return Vertex or nullptr; with duplicate names the first declaration wins
     */
    const Vertex *findVertex(const std::string &name) const;

    std::optional<size_t> indexOf(const std::string &name) const;

private:
    std::string name_;
    std::vector<std::string> doc_;
    std::vector<Vertex> vertices_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> vertexIndex_;
};

}  // namespace ESM
