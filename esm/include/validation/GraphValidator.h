#pragma once

#include "config/GeneratorConfig.h"
#include "model/GenerationError.h"
#include "model/GraphModel.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace ESM {

/**
 * @brief Rejects graphs the code generator cannot turn into a well-formed API
 *
 * Checks run in a fixed order and every check walks the graph in declaration
 * order, so the same input always yields the same diagnostics:
 *  1. duplicate vertex names (graphs not produced by GraphBuilder)
 *  2. edge endpoints naming undeclared vertices
 *  3. duplicate resolved method names among a vertex's outgoing edges
 *  4. vertex and method names colliding with identifiers of the generated API,
 *     and payload types naming something the generated class declares
 *  5. configuration the generator cannot satisfy
 * All violations are collected; validate() never stops at the first one.
 */
class GraphValidator {
public:
    /**
     * @param config Effective configuration; machineName must already be resolved
     */
    explicit GraphValidator(GeneratorConfig config);

    /**
     * @brief Run every check
     * @return true if the graph can be generated
     */
    bool validate(const Graph &graph);

    bool hasErrors() const {
        return !errors_.empty();
    }

    const std::vector<GenerationError> &getErrors() const {
        return errors_;
    }

    /**
     * @brief Member names every generated handle defines besides its transitions
     */
    static const std::vector<std::string> &handleMemberNames();

    /**
     * @brief Member names of the generated machine class besides the vertex types
     */
    static const std::vector<std::string> &machineMemberNames();

private:
    void checkDuplicateVertices(const Graph &graph);
    void checkEdgeEndpoints(const Graph &graph);
    void checkMethodNames(const Graph &graph);
    void checkReservedNames(const Graph &graph);
    void checkPayloadTypes(const Graph &graph, const std::unordered_set<std::string> &companionNames);
    void checkConfiguration(const Graph &graph);

    std::vector<std::string> templateParameterNames() const;

    void addError(GenerationError error);

    GeneratorConfig config_;
    std::vector<GenerationError> errors_;
};

}  // namespace ESM
