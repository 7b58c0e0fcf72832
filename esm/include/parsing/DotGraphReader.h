#pragma once

#include "parsing/GraphReader.h"
#include "parsing/TextScanner.h"
#include <map>

namespace ESM {

/**
 * @brief Reader for the directed subset of the Graphviz DOT language
 *
 * Accepts `digraph Name { ... }` with node statements, edge chains and
 * attribute lists. Recognized attributes: `type` (payload) and `comment`
 * (documentation) on nodes, `label` (method name) and `comment` on edges.
 * Attributes on an edge chain apply to every edge of the chain. Other
 * attributes and `graph`/`node`/`edge` default statements are ignored.
 */
class DotGraphReader : public GraphReader {
public:
    std::optional<Graph> parseContent(const std::string &content) override;

private:
    using AttributeMap = std::map<std::string, std::string>;

    bool parseStatement(TextScanner &scanner, GraphBuilder &builder);
    std::optional<std::string> parseId(TextScanner &scanner);
    std::optional<AttributeMap> parseAttributes(TextScanner &scanner);

    static std::vector<std::string> splitDoc(const std::string &text);
};

}  // namespace ESM
