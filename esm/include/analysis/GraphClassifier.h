#pragma once

#include "model/GraphModel.h"
#include "model/types.h"
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief An edge seen from one of its endpoints, with its method name resolved
 */
struct ResolvedEdge {
    const Edge *edge = nullptr;
    size_t peerIndex = 0;  // target vertex for outgoing edges, source vertex for incoming ones
    std::string methodName;
};

/**
 * @brief Everything the code generator needs to know about one vertex
 */
struct VertexClass {
    const Vertex *vertex = nullptr;
    Role role = Role::ISOLATED;
    std::vector<ResolvedEdge> outgoing;  // declaration order
    std::vector<ResolvedEdge> incoming;  // declaration order

    bool isActive() const {
        return !isTerminal(role);
    }
};

/**
 * @brief Computes role and resolved outgoing/incoming edges per vertex
 *
 * Method names are resolved exactly once per edge here, so the generator and
 * any diagnostics see the same names on every run. The graph must outlive the
 * returned classes, which point into it.
 */
class GraphClassifier {
public:
    explicit GraphClassifier(bool renameMethods) : renameMethods_(renameMethods) {}

    /**
     * @brief Classify every vertex
     * @param graph A validated graph
     * @return One entry per vertex, in vertex declaration order
     */
    std::vector<VertexClass> classify(const Graph &graph) const;

    static Role roleFor(size_t incomingCount, size_t outgoingCount);

private:
    bool renameMethods_;
};

}  // namespace ESM
