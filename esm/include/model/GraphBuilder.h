#pragma once

#include "model/GenerationError.h"
#include "model/GraphModel.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ESM {

/**
 * @brief Append-only builder for Graph
 *
 * Front ends call addVertex/addEdge in declaration order. An edge whose
 * endpoints were not declared yet creates bare vertices for them; a later
 * explicit declaration fills in payload and documentation.
 *
 * A vertex declared twice must agree on its payload: both without one, or both
 * with the same type expression. Otherwise a DUPLICATE_VERTEX error is
 * recorded and build() fails.
 */
class GraphBuilder {
public:
    GraphBuilder() = default;

    /**
     * @brief Set the machine name suggested by the source (configuration may override it)
     */
    GraphBuilder &setName(const std::string &name);

    /**
     * @brief Append machine-level documentation lines
     */
    GraphBuilder &addDocumentation(const std::vector<std::string> &doc);

    /**
     * @brief Declare a vertex
     * @param name Vertex identifier
     * @param payloadType Payload type expression, nullopt for a vertex without data
     * @param doc Documentation lines
     * @param location Declaration position in the source
     * @return false if the declaration conflicts with an earlier one
     * @throws std::invalid_argument if name is empty
     */
    bool addVertex(const std::string &name, const std::optional<std::string> &payloadType = std::nullopt,
                   const std::vector<std::string> &doc = {}, SourceLocation location = {});

    /**
     * @brief Declare an edge, implicitly creating missing endpoints
     * @param source Source vertex name
     * @param target Target vertex name
     * @param methodOverride Explicit transition method name
     * @param doc Documentation lines
     * @param location Declaration position in the source
     * @throws std::invalid_argument if an endpoint name is empty
     */
    void addEdge(const std::string &source, const std::string &target,
                 const std::optional<std::string> &methodOverride = std::nullopt,
                 const std::vector<std::string> &doc = {}, SourceLocation location = {});

    /**
     * @brief Produce the immutable graph
     * @return Graph, or nullopt when any declaration was rejected
     */
    std::optional<Graph> build() const;

    bool hasErrors() const {
        return !errors_.empty();
    }

    const std::vector<GenerationError> &getErrors() const {
        return errors_;
    }

private:
    void ensureVertex(const std::string &name, SourceLocation location);

    std::string name_;
    std::vector<std::string> doc_;
    std::vector<Vertex> vertices_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> vertexIndex_;
    std::vector<GenerationError> errors_;
};

}  // namespace ESM
