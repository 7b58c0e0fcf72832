#include "validation/GraphValidator.h"
#include "common/Logger.h"
#include "common/NamingHelper.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace ESM {

namespace {

using Kind = GenerationError::Kind;

bool contains(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// "<Vertex>Handle" and "<Vertex>Terminal" for every vertex
std::unordered_set<std::string> companionTypeNames(const Graph &graph) {
    std::unordered_set<std::string> names;
    for (const auto &vertex : graph.getVertices()) {
        names.insert(vertex.name + "Handle");
        names.insert(vertex.name + "Terminal");
    }
    return names;
}

// "a::b::c" -> {"a", "b", "c"}; an empty component marks a malformed namespace
std::vector<std::string> splitNamespace(const std::string &ns) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = ns.find("::", start);
        parts.push_back(ns.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 2;
    }
    return parts;
}

}  // namespace

GraphValidator::GraphValidator(GeneratorConfig config) : config_(std::move(config)) {}

const std::vector<std::string> &GraphValidator::handleMemberNames() {
    static const std::vector<std::string> names = {"get", "get_mut", "currentCase", "state_", "std"};
    return names;
}

const std::vector<std::string> &GraphValidator::machineMemberNames() {
    static const std::vector<std::string> names = {"State",    "entry",  "state", "makeEntry",
                                                   "mismatch", "state_", "std"};
    return names;
}

bool GraphValidator::validate(const Graph &graph) {
    errors_.clear();

    LOG_DEBUG("GraphValidator: Validating '{}' ({} vertices, {} edges)", config_.machineName,
              graph.getVertices().size(), graph.getEdges().size());

    checkDuplicateVertices(graph);
    checkEdgeEndpoints(graph);
    checkMethodNames(graph);
    checkReservedNames(graph);
    checkConfiguration(graph);

    if (hasErrors()) {
        LOG_ERROR("GraphValidator: '{}' failed validation with {} error(s)", config_.machineName, errors_.size());
        return false;
    }

    LOG_INFO("GraphValidator: Validation passed for '{}'", config_.machineName);
    return true;
}

void GraphValidator::checkDuplicateVertices(const Graph &graph) {
    std::unordered_set<std::string> seen;
    for (const auto &vertex : graph.getVertices()) {
        if (!seen.insert(vertex.name).second) {
            addError(GenerationError(Kind::DUPLICATE_VERTEX, vertex.name, vertex.name,
                                     fmt::format("vertex '{}' is declared more than once", vertex.name), vertex.index,
                                     vertex.location));
        }
    }
}

void GraphValidator::checkEdgeEndpoints(const Graph &graph) {
    for (const auto &edge : graph.getEdges()) {
        for (const auto *endpoint : {&edge.source, &edge.target}) {
            if (!graph.findVertex(*endpoint)) {
                addError(GenerationError(Kind::UNKNOWN_VERTEX, edge.source, *endpoint,
                                         fmt::format("edge {} -> {} refers to undeclared vertex '{}'", edge.source,
                                                     edge.target, *endpoint),
                                         edge.index, edge.location));
            }
        }
    }
}

void GraphValidator::checkMethodNames(const Graph &graph) {
    // Group outgoing edges per source once, keeping declaration order within each group
    std::unordered_map<std::string, std::vector<const Edge *>> outgoing;
    for (const auto &edge : graph.getEdges()) {
        outgoing[edge.source].push_back(&edge);
    }

    for (const auto &vertex : graph.getVertices()) {
        auto it = outgoing.find(vertex.name);
        if (it == outgoing.end()) {
            continue;
        }

        std::unordered_map<std::string, const Edge *> firstByName;
        for (const Edge *edge : it->second) {
            std::string methodName =
                NamingHelper::resolveMethodName(edge->methodOverride, edge->target, config_.renameMethods);
            auto [existing, inserted] = firstByName.emplace(methodName, edge);
            if (!inserted) {
                addError(GenerationError(
                    Kind::METHOD_NAME_COLLISION, vertex.name, methodName,
                    fmt::format("vertex '{}' has two transitions named '{}' (to '{}' and to '{}')", vertex.name,
                                methodName, existing->second->target, edge->target),
                    edge->index, edge->location));
            }
        }
    }
}

void GraphValidator::checkReservedNames(const Graph &graph) {
    const std::unordered_set<std::string> companionNames = companionTypeNames(graph);
    const std::vector<std::string> parameterNames = templateParameterNames();

    for (const auto &vertex : graph.getVertices()) {
        const std::string &name = vertex.name;
        if (!NamingHelper::isValidIdentifier(name)) {
            addError(GenerationError(Kind::SYNTAX_ERROR, name, name,
                                     fmt::format("vertex name '{}' is not a valid C++ identifier", name), vertex.index,
                                     vertex.location));
            continue;
        }

        std::string reason;
        if (name == config_.machineName) {
            reason = "the state machine class";
        } else if (name == config_.entryTypeName) {
            reason = "the entry type";
        } else if (contains(machineMemberNames(), name)) {
            reason = "a member of the state machine class";
        } else if (companionNames.count(name) > 0) {
            reason = "a generated handle or terminal type";
        } else if (contains(parameterNames, name)) {
            reason = "a template parameter of the state machine class";
        } else if (NamingHelper::isCppKeyword(name)) {
            reason = "a C++ keyword";
        } else if (NamingHelper::isImplementationReserved(name)) {
            reason = "an identifier reserved to the C++ implementation";
        }

        if (!reason.empty()) {
            addError(GenerationError(Kind::RESERVED_NAME_COLLISION, name, name,
                                     fmt::format("vertex name '{}' collides with {}", name, reason), vertex.index,
                                     vertex.location));
        }
    }

    checkPayloadTypes(graph, companionNames);

    for (const auto &edge : graph.getEdges()) {
        std::string methodName =
            NamingHelper::resolveMethodName(edge.methodOverride, edge.target, config_.renameMethods);
        if (!NamingHelper::isValidIdentifier(methodName)) {
            addError(GenerationError(Kind::SYNTAX_ERROR, edge.source, methodName,
                                     fmt::format("method name '{}' on edge {} -> {} is not a valid C++ identifier",
                                                 methodName, edge.source, edge.target),
                                     edge.index, edge.location));
            continue;
        }
        if (contains(handleMemberNames(), methodName) || methodName == edge.source + "Handle" ||
            methodName == config_.machineName || contains(parameterNames, methodName) ||
            NamingHelper::isImplementationReserved(methodName)) {
            addError(GenerationError(Kind::RESERVED_NAME_COLLISION, edge.source, methodName,
                                     fmt::format("method name '{}' on edge {} -> {} collides with a member of {}Handle",
                                                 methodName, edge.source, edge.target, edge.source),
                                     edge.index, edge.location));
        }
    }
}

void GraphValidator::checkPayloadTypes(const Graph &graph, const std::unordered_set<std::string> &companionNames) {
    // Payload types are spelled inside the machine class, where these names hide any outer declaration
    auto declaredInClass = [&](const std::string &identifier) {
        return graph.findVertex(identifier) != nullptr || companionNames.count(identifier) > 0 ||
               identifier == config_.machineName || identifier == config_.entryTypeName || identifier == "State";
    };

    for (const auto &vertex : graph.getVertices()) {
        if (!vertex.hasPayload()) {
            continue;
        }
        std::vector<std::string> reported;
        for (const auto &identifier : NamingHelper::unqualifiedIdentifiers(*vertex.payloadType)) {
            if (!declaredInClass(identifier) || contains(reported, identifier)) {
                continue;
            }
            reported.push_back(identifier);
            addError(GenerationError(
                Kind::RESERVED_NAME_COLLISION, vertex.name, identifier,
                fmt::format("payload type '{}' of '{}' names '{}', which the generated class declares itself",
                            *vertex.payloadType, vertex.name, identifier),
                vertex.index, vertex.location));
        }
    }
}

void GraphValidator::checkConfiguration(const Graph &graph) {
    auto unsupported = [this](const std::string &name, const std::string &message) {
        addError(GenerationError(Kind::UNSUPPORTED_CONFIGURATION, config_.machineName, name, message));
    };

    if (graph.empty()) {
        unsupported(config_.machineName, "the graph has no vertices");
    }

    const std::unordered_set<std::string> companionNames = companionTypeNames(graph);

    auto checkTypeName = [&](const std::string &name, const char *what) {
        if (!NamingHelper::isValidIdentifier(name) || NamingHelper::isCppKeyword(name)) {
            unsupported(name, fmt::format("{} '{}' is not a usable C++ identifier", what, name));
        } else if (name == "State" || companionNames.count(name) > 0) {
            unsupported(name, fmt::format("{} '{}' collides with a generated type", what, name));
        }
    };

    checkTypeName(config_.machineName, "machine name");
    checkTypeName(config_.entryTypeName, "entry type name");

    if (config_.entryTypeName == config_.machineName) {
        unsupported(config_.entryTypeName, "entry type name must differ from the machine name");
    }

    if (!config_.namespaceName.empty()) {
        for (const auto &part : splitNamespace(config_.namespaceName)) {
            if (!NamingHelper::isValidIdentifier(part) || NamingHelper::isCppKeyword(part)) {
                unsupported(config_.namespaceName,
                            fmt::format("namespace '{}' is not a valid C++ namespace name", config_.namespaceName));
                break;
            }
        }
    }

    for (const auto &attribute : config_.attributes) {
        if (attribute.size() < 4 || attribute.rfind("[[", 0) != 0 ||
            attribute.compare(attribute.size() - 2, 2, "]]") != 0) {
            unsupported(attribute, fmt::format("attribute '{}' must be written as [[...]]", attribute));
        }
    }

    std::vector<std::string> seenParameters;
    for (const auto &parameter : config_.templateParameters) {
        std::string name = NamingHelper::templateParameterName(parameter);
        if (name.empty()) {
            unsupported(parameter, fmt::format("template parameter '{}' does not declare a name", parameter));
        } else if (contains(seenParameters, name)) {
            unsupported(name, fmt::format("template parameter '{}' is declared more than once", name));
        } else if (name == config_.machineName || name == config_.entryTypeName || name == "State" ||
                   name == "std" || companionNames.count(name) > 0) {
            unsupported(name, fmt::format("template parameter '{}' collides with a generated name", name));
        }
        seenParameters.push_back(name);
    }

    for (const auto &condition : config_.staticAsserts) {
        if (NamingHelper::normalizeTypeExpression(condition).empty()) {
            unsupported(condition, "static_assert condition must not be empty");
        }
    }
}

std::vector<std::string> GraphValidator::templateParameterNames() const {
    std::vector<std::string> names;
    for (const auto &parameter : config_.templateParameters) {
        std::string name = NamingHelper::templateParameterName(parameter);
        if (!name.empty()) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

void GraphValidator::addError(GenerationError error) {
    LOG_DEBUG("GraphValidator: {}", error.message);
    errors_.push_back(std::move(error));
}

}  // namespace ESM
