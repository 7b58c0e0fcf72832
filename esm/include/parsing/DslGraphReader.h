#pragma once

#include "parsing/GraphReader.h"
#include "parsing/TextScanner.h"

namespace ESM {

/**
 * @brief Reader for the compact `.fsm` state machine language
 *
 * @code
 * /// Machine documentation
 * TrafficLight {
 *     /// Vertex documentation
 *     Red;
 *     Green: std::string;
 *     /// Shared by every edge of the chain
 *     Red -> RedAmber -"inline doc"-> Green --> Amber;
 *     Amber -stop-> Red;
 * }
 * @endcode
 *
 * The `Name { ... }` wrapper is optional. Arrows are `->`, `-->`,
 * `-"doc"->` (documented edge) and `-method->` (method name override); a
 * documented or named arrow may also be written with doubled dashes.
 */
class DslGraphReader : public GraphReader {
public:
    std::optional<Graph> parseContent(const std::string &content) override;

private:
    struct Arrow {
        std::optional<std::string> doc;
        std::optional<std::string> method;
    };

    bool parseStatement(TextScanner &scanner, GraphBuilder &builder, const std::vector<std::string> &docs);
    std::optional<std::string> parsePayload(TextScanner &scanner);
    std::optional<Arrow> parseArrow(TextScanner &scanner);
};

}  // namespace ESM
