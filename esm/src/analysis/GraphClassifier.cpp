#include "analysis/GraphClassifier.h"
#include "common/Logger.h"
#include "common/NamingHelper.h"

namespace ESM {

std::vector<VertexClass> GraphClassifier::classify(const Graph &graph) const {
    const auto &vertices = graph.getVertices();

    std::vector<VertexClass> classes(vertices.size());
    for (size_t i = 0; i < vertices.size(); ++i) {
        classes[i].vertex = &vertices[i];
    }

    // Edges are visited in declaration order, which keeps both lists sorted
    for (const auto &edge : graph.getEdges()) {
        auto sourceIndex = graph.indexOf(edge.source);
        auto targetIndex = graph.indexOf(edge.target);
        if (!sourceIndex || !targetIndex) {
            LOG_WARN("GraphClassifier: Skipping edge {} -> {} with unresolved endpoint", edge.source, edge.target);
            continue;
        }

        std::string methodName = NamingHelper::resolveMethodName(edge.methodOverride, edge.target, renameMethods_);
        classes[*sourceIndex].outgoing.push_back(ResolvedEdge{&edge, *targetIndex, methodName});
        classes[*targetIndex].incoming.push_back(ResolvedEdge{&edge, *sourceIndex, methodName});
    }

    for (auto &vertexClass : classes) {
        vertexClass.role = roleFor(vertexClass.incoming.size(), vertexClass.outgoing.size());
        LOG_TRACE("GraphClassifier: {} is {} ({} in, {} out)", vertexClass.vertex->name,
                  roleToString(vertexClass.role), vertexClass.incoming.size(), vertexClass.outgoing.size());
    }

    return classes;
}

Role GraphClassifier::roleFor(size_t incomingCount, size_t outgoingCount) {
    if (incomingCount == 0) {
        return outgoingCount == 0 ? Role::ISOLATED : Role::SOURCE;
    }
    return outgoingCount == 0 ? Role::SINK : Role::THROUGH;
}

}  // namespace ESM
