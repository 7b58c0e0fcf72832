#pragma once

#include "parsing/GraphReader.h"
#include <libxml++/libxml++.h>

namespace ESM {

/**
 * @brief Reader for a flat subset of SCXML
 *
 * `<scxml name="...">` names the machine. Each top-level `<state>` or
 * `<final>` becomes a vertex: the `payload` attribute gives its type, a
 * `doc` attribute or `<documentation>` child its documentation. Each
 * `<transition target="...">` inside a state becomes an edge whose `event`
 * attribute, when present, overrides the method name.
 *
 * Compound and parallel states have no counterpart in a flat graph and are
 * rejected, as are targetless and multi-target transitions.
 */
class ScxmlGraphReader : public GraphReader {
public:
    std::optional<Graph> parseContent(const std::string &content) override;

private:
    void parseDocument(xmlpp::Document *doc, GraphBuilder &builder);
    void parseState(const xmlpp::Element *stateElement, GraphBuilder &builder);
    void parseTransitions(const xmlpp::Element *stateElement, GraphBuilder &builder);

    static std::optional<std::string> attributeValue(const xmlpp::Element *element, const char *name);
    static std::vector<std::string> documentationOf(const xmlpp::Element *element);
    static SourceLocation locationOf(const xmlpp::Node *node);
};

}  // namespace ESM
