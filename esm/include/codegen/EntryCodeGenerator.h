#pragma once

#include "analysis/GraphClassifier.h"
#include "codegen/DiagramExporter.h"
#include "config/GeneratorConfig.h"
#include "model/GenerationError.h"
#include "model/GraphModel.h"
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief Emits a C++17 header exposing a graph as a statically-checked state machine
 *
 * The generated machine class owns a `std::variant` of one struct per vertex.
 * entry() inspects it and returns a variant of entry cases: a `<Vertex>Handle`
 * for vertices with outgoing edges, a `<Vertex>Terminal` for the others. Handle
 * methods are the only way to change the state. With template parameters
 * configured the machine becomes a class template, constrained by the
 * configured static_assert conditions.
 *
 * Generation validates first and emits nothing when validation fails; the
 * validation errors are then available through getErrors().
 */
class EntryCodeGenerator {
public:
    /**
     * @param config Generator options; an empty machine name falls back to the graph name
     */
    explicit EntryCodeGenerator(GeneratorConfig config);

    /**
     * @brief Replace the renderer used when diagrams are enabled
     * @throws std::invalid_argument if renderer is null
     */
    void setDiagramRenderer(std::shared_ptr<IDiagramRenderer> renderer);

    /**
     * @brief Generate the header text
     * @param graph Graph to generate from
     * @return Header content, or nullopt if the graph or configuration was rejected
     */
    std::optional<std::string> generate(const Graph &graph);

    /**
     * @brief Generate and write `<Machine>_sm.h` into outputDir
     * @param graph Graph to generate from
     * @param outputDir Output directory, created if missing
     * @return Success status
     */
    bool generateToFile(const Graph &graph, const std::string &outputDir);

    /**
     * @brief Name of the file generateToFile() writes for this graph
     */
    std::string getOutputFileName(const Graph &graph) const;

    bool hasErrors() const {
        return !errors_.empty();
    }

    const std::vector<GenerationError> &getErrors() const {
        return errors_;
    }

private:
    GeneratorConfig effectiveConfig(const Graph &graph) const;

    void generatePreamble(std::stringstream &ss, const GeneratorConfig &config) const;
    void generateMachineDoc(std::stringstream &ss, const Graph &graph, const GeneratorConfig &config) const;
    void generateVertexStructs(std::stringstream &ss, const std::vector<VertexClass> &classes) const;
    void generateTerminalCases(std::stringstream &ss, const std::vector<VertexClass> &classes) const;
    void generateHandle(std::stringstream &ss, const VertexClass &vertexClass, const std::vector<VertexClass> &all,
                        const GeneratorConfig &config) const;
    void generateTransition(std::stringstream &ss, const VertexClass &source, const ResolvedEdge &edge,
                            const std::vector<VertexClass> &all, const GeneratorConfig &config) const;
    void generateEntryDispatch(std::stringstream &ss, const std::vector<VertexClass> &classes,
                               const GeneratorConfig &config) const;

    static std::string entryCaseName(const VertexClass &vertexClass);
    static void writeDocLines(std::stringstream &ss, const std::string &indent, const std::vector<std::string> &lines);

    bool writeToFile(const std::string &path, const std::string &content);

    GeneratorConfig config_;
    std::shared_ptr<IDiagramRenderer> diagramRenderer_;
    std::vector<GenerationError> errors_;
};

}  // namespace ESM
