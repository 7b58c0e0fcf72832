#include "model/GraphBuilder.h"
#include "common/Logger.h"
#include "common/NamingHelper.h"
#include <stdexcept>

namespace ESM {

namespace {

void appendDocs(std::vector<std::string> &dst, const std::vector<std::string> &src) {
    if (src.empty()) {
        return;
    }
    if (!dst.empty()) {
        dst.emplace_back();
    }
    dst.insert(dst.end(), src.begin(), src.end());
}

std::string describePayload(const std::optional<std::string> &payloadType) {
    return payloadType ? "payload '" + *payloadType + "'" : "no payload";
}

}  // namespace

GraphBuilder &GraphBuilder::setName(const std::string &name) {
    name_ = name;
    return *this;
}

GraphBuilder &GraphBuilder::addDocumentation(const std::vector<std::string> &doc) {
    appendDocs(doc_, doc);
    return *this;
}

bool GraphBuilder::addVertex(const std::string &name, const std::optional<std::string> &payloadType,
                             const std::vector<std::string> &doc, SourceLocation location) {
    if (name.empty()) {
        throw std::invalid_argument("GraphBuilder: vertex name cannot be empty");
    }

    std::optional<std::string> normalized;
    if (payloadType) {
        normalized = NamingHelper::normalizeTypeExpression(*payloadType);
    }

    auto it = vertexIndex_.find(name);
    if (it == vertexIndex_.end()) {
        Vertex vertex;
        vertex.name = name;
        vertex.payloadType = normalized;
        vertex.doc = doc;
        vertex.index = vertices_.size();
        vertex.location = location;
        vertexIndex_.emplace(name, vertices_.size());
        vertices_.push_back(std::move(vertex));
        LOG_TRACE("GraphBuilder: Declared vertex '{}' with {}", name, describePayload(normalized));
        return true;
    }

    Vertex &existing = vertices_[it->second];
    if (existing.implicit) {
        // First explicit declaration of a vertex so far only seen on an edge
        existing.implicit = false;
        existing.payloadType = normalized;
        existing.doc = doc;
        if (location.isKnown()) {
            existing.location = location;
        }
        return true;
    }

    if (existing.payloadType != normalized) {
        std::string message = fmt::format("vertex '{}' redeclared with {} (first declared with {})", name,
                                          describePayload(normalized), describePayload(existing.payloadType));
        LOG_ERROR("GraphBuilder: {}", message);
        errors_.emplace_back(GenerationError::Kind::DUPLICATE_VERTEX, name, name, message, existing.index, location);
        return false;
    }

    appendDocs(existing.doc, doc);
    return true;
}

void GraphBuilder::addEdge(const std::string &source, const std::string &target,
                           const std::optional<std::string> &methodOverride, const std::vector<std::string> &doc,
                           SourceLocation location) {
    if (source.empty() || target.empty()) {
        throw std::invalid_argument("GraphBuilder: edge endpoints cannot be empty");
    }

    ensureVertex(source, location);
    ensureVertex(target, location);

    Edge edge;
    edge.source = source;
    edge.target = target;
    edge.methodOverride = methodOverride;
    edge.doc = doc;
    edge.index = edges_.size();
    edge.location = location;
    edges_.push_back(std::move(edge));
    LOG_TRACE("GraphBuilder: Declared edge {} -> {}", source, target);
}

std::optional<Graph> GraphBuilder::build() const {
    if (hasErrors()) {
        LOG_ERROR("GraphBuilder: Refusing to build graph with {} error(s)", errors_.size());
        return std::nullopt;
    }

    LOG_DEBUG("GraphBuilder: Built graph '{}' with {} vertices and {} edges", name_, vertices_.size(), edges_.size());
    return Graph(name_, doc_, vertices_, edges_);
}

void GraphBuilder::ensureVertex(const std::string &name, SourceLocation location) {
    if (vertexIndex_.count(name) > 0) {
        return;
    }

    Vertex vertex;
    vertex.name = name;
    vertex.index = vertices_.size();
    vertex.location = location;
    vertex.implicit = true;
    vertexIndex_.emplace(name, vertices_.size());
    vertices_.push_back(std::move(vertex));
    LOG_TRACE("GraphBuilder: Implicitly created vertex '{}'", name);
}

}  // namespace ESM
