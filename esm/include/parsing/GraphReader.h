#pragma once

#include "model/GenerationError.h"
#include "model/GraphBuilder.h"
#include "model/GraphModel.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ESM {

/**
 * @brief Base class of the front ends turning source text into a Graph
 *
 * A reader only drives GraphBuilder in declaration order; validation against
 * the generated API is left to GraphValidator. Syntax errors are collected as
 * SYNTAX_ERROR diagnostics with line and column, builder conflicts as
 * DUPLICATE_VERTEX.
 */
class GraphReader {
public:
    virtual ~GraphReader() = default;

    /**
     * @brief Parse a source file
     * @param filename Path of the file
     * @return Graph, or nullopt on any error
     */
    std::optional<Graph> parseFile(const std::string &filename);

    /**
     * @brief Parse source text
     * @param content Complete source
     * @return Graph, or nullopt on any error
     */
    virtual std::optional<Graph> parseContent(const std::string &content) = 0;

    bool hasErrors() const {
        return !errors_.empty();
    }

    const std::vector<GenerationError> &getErrors() const {
        return errors_;
    }

    /**
     * @brief Errors formatted with GenerationError::toString()
     */
    std::vector<std::string> getErrorMessages() const;

    /**
     * @brief Pick a reader from the file extension
     *
     * `.fsm` selects the DSL reader, `.dot` and `.gv` the DOT reader,
     * `.scxml` and `.xml` the SCXML reader.
     * @return Reader, or nullptr for an unknown extension
     */
    static std::unique_ptr<GraphReader> createForFile(const std::string &filename);

    /**
     * @brief Pick a reader by language name: "fsm", "dot" or "scxml"
     * @return Reader, or nullptr for an unknown language
     */
    static std::unique_ptr<GraphReader> createForLanguage(const std::string &language);

protected:
    void initParsing();

    void addError(const std::string &message, SourceLocation location = {});

    /**
     * @brief Copy builder errors and build the graph if the whole parse succeeded
     */
    std::optional<Graph> finish(const GraphBuilder &builder);

    std::vector<GenerationError> errors_;
};

}  // namespace ESM
