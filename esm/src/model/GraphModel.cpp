#include "model/GraphModel.h"
#include <utility>

namespace ESM {

Graph::Graph(std::string name, std::vector<std::string> doc, std::vector<Vertex> vertices, std::vector<Edge> edges)
    : name_(std::move(name)), doc_(std::move(doc)), vertices_(std::move(vertices)), edges_(std::move(edges)) {
    for (size_t i = 0; i < vertices_.size(); ++i) {
        vertexIndex_.emplace(vertices_[i].name, i);
    }
}

const Vertex *Graph::findVertex(const std::string &name) const {
    auto index = indexOf(name);
    return index ? &vertices_[*index] : nullptr;
}

std::optional<size_t> Graph::indexOf(const std::string &name) const {
    auto it = vertexIndex_.find(name);
    if (it == vertexIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace ESM
