#include "codegen/EntryCodeGenerator.h"
#include "common/Logger.h"
#include "validation/GraphValidator.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ESM {

namespace {

const std::string MEMBER_INDENT = "    ";
const std::string HANDLE_INDENT = "        ";
const std::string BODY_INDENT = "            ";

std::vector<std::string> splitLines(const std::string &text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::string joinAttributes(const std::vector<std::string> &attributes) {
    std::string joined;
    for (const auto &attribute : attributes) {
        joined += attribute + " ";
    }
    return joined;
}

std::string escapeStringLiteral(const std::string &text) {
    std::string escaped;
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c == '\n' ? ' ' : c);
    }
    return escaped;
}

// "<string>" and "\"payload.h\"" are used verbatim, a bare "string" becomes <string>
std::string includeDirective(const std::string &header) {
    if (!header.empty() && (header.front() == '<' || header.front() == '"')) {
        return "#include " + header;
    }
    return "#include <" + header + ">";
}

std::vector<std::string> reachabilityDoc(const VertexClass &vertexClass, const std::vector<VertexClass> &all) {
    std::vector<std::string> lines;

    switch (vertexClass.role) {
    case Role::ISOLATED:
        lines.push_back("Isolated: no transition leads to or from this state.");
        return lines;
    case Role::SINK:
        lines.push_back("Terminal: no transition leaves this state.");
        break;
    case Role::SOURCE:
        lines.push_back("Initial only: no transition leads to this state.");
        break;
    case Role::THROUGH:
        break;
    }

    if (!vertexClass.incoming.empty()) {
        lines.push_back("Reachable from:");
        for (const auto &edge : vertexClass.incoming) {
            lines.push_back("- `" + all[edge.peerIndex].vertex->name + "` via `" + edge.methodName + "()`");
        }
    }
    if (!vertexClass.outgoing.empty()) {
        lines.push_back("Can transition to:");
        for (const auto &edge : vertexClass.outgoing) {
            lines.push_back("- `" + all[edge.peerIndex].vertex->name + "` via `" + edge.methodName + "()`");
        }
    }
    return lines;
}

}  // namespace

EntryCodeGenerator::EntryCodeGenerator(GeneratorConfig config) : config_(std::move(config)) {}

void EntryCodeGenerator::setDiagramRenderer(std::shared_ptr<IDiagramRenderer> renderer) {
    if (!renderer) {
        throw std::invalid_argument("EntryCodeGenerator: diagram renderer must not be null");
    }
    diagramRenderer_ = std::move(renderer);
}

GeneratorConfig EntryCodeGenerator::effectiveConfig(const Graph &graph) const {
    GeneratorConfig config = config_;
    if (config.machineName.empty()) {
        config.machineName = graph.getName();
    }
    return config;
}

std::string EntryCodeGenerator::getOutputFileName(const Graph &graph) const {
    return effectiveConfig(graph).machineName + "_sm.h";
}

std::optional<std::string> EntryCodeGenerator::generate(const Graph &graph) {
    errors_.clear();

    GeneratorConfig config = effectiveConfig(graph);
    LOG_INFO("EntryCodeGenerator: Generating '{}' ({} mode)", config.machineName,
             safetyModeToString(config.safetyMode));

    GraphValidator validator(config);
    if (!validator.validate(graph)) {
        errors_ = validator.getErrors();
        for (const auto &error : errors_) {
            LOG_ERROR("EntryCodeGenerator: {}", error.toString());
        }
        return std::nullopt;
    }

    GraphClassifier classifier(config.renameMethods);
    std::vector<VertexClass> classes = classifier.classify(graph);

    std::stringstream ss;
    generatePreamble(ss, config);

    generateMachineDoc(ss, graph, config);
    if (!config.templateParameters.empty()) {
        ss << "template <";
        for (size_t i = 0; i < config.templateParameters.size(); ++i) {
            ss << (i > 0 ? ", " : "") << config.templateParameters[i];
        }
        ss << ">\n";
    }
    ss << "class " << joinAttributes(config.attributes) << config.machineName << " {\n";
    ss << "public:\n";

    for (const auto &condition : config.staticAsserts) {
        ss << MEMBER_INDENT << "static_assert(" << condition << ", \"" << config.machineName
           << " requires " << escapeStringLiteral(condition) << "\");\n";
    }
    if (!config.staticAsserts.empty()) {
        ss << "\n";
    }

    generateVertexStructs(ss, classes);

    ss << MEMBER_INDENT << "/// The only storage of the current state, one alternative per state.\n";
    ss << MEMBER_INDENT << "using State " << joinAttributes(config.attributes) << "= std::variant<";
    for (size_t i = 0; i < classes.size(); ++i) {
        ss << (i > 0 ? ", " : "") << classes[i].vertex->name;
    }
    ss << ">;\n\n";

    ss << MEMBER_INDENT << "/// Start the machine in any state.\n";
    ss << MEMBER_INDENT << "explicit " << config.machineName << "(State initial) : state_(std::move(initial)) {}\n\n";
    ss << MEMBER_INDENT << "const State &state() const {\n";
    ss << HANDLE_INDENT << "return state_;\n";
    ss << MEMBER_INDENT << "}\n\n";

    if (config.entryVisibility == EntryVisibility::PROTECTED) {
        ss << "protected:\n";
    }

    generateTerminalCases(ss, classes);
    for (const auto &vertexClass : classes) {
        if (vertexClass.isActive()) {
            generateHandle(ss, vertexClass, classes, config);
        }
    }
    generateEntryDispatch(ss, classes, config);

    ss << "};\n";

    if (!config.namespaceName.empty()) {
        ss << "\n}  // namespace " << config.namespaceName << "\n";
    }

    LOG_DEBUG("EntryCodeGenerator: Generated {} bytes for '{}'", ss.str().size(), config.machineName);
    return ss.str();
}

bool EntryCodeGenerator::generateToFile(const Graph &graph, const std::string &outputDir) {
    auto content = generate(graph);
    if (!content) {
        return false;
    }

    fs::path outputPath = fs::path(outputDir) / getOutputFileName(graph);
    if (!writeToFile(outputPath.string(), *content)) {
        return false;
    }

    LOG_INFO("EntryCodeGenerator: Wrote {}", outputPath.string());
    return true;
}

void EntryCodeGenerator::generatePreamble(std::stringstream &ss, const GeneratorConfig &config) const {
    ss << "// Generated by esm-codegen from the '" << config.machineName << "' state graph. Do not edit.\n";
    ss << "#pragma once\n\n";

    if (config.safetyMode == SafetyMode::CHECKED) {
        ss << "#include <cstdio>\n";
        ss << "#include <cstdlib>\n";
    }
    ss << "#include <utility>\n";
    ss << "#include <variant>\n";
    for (const auto &header : config.includes) {
        ss << includeDirective(header) << "\n";
    }
    ss << "\n";

    if (!config.namespaceName.empty()) {
        ss << "namespace " << config.namespaceName << " {\n\n";
    }
}

void EntryCodeGenerator::generateMachineDoc(std::stringstream &ss, const Graph &graph,
                                            const GeneratorConfig &config) const {
    std::vector<std::string> lines = graph.getDocumentation();
    if (!lines.empty()) {
        lines.emplace_back();
    }

    if (config.safetyMode == SafetyMode::CHECKED) {
        lines.push_back("Handles verify on every call that the machine is still in their state,");
        lines.push_back("and abort with a diagnostic otherwise.");
    } else {
        lines.push_back("Handles are created only by entry() and are spent by their transition.");
        lines.push_back("Using a spent handle, or a handle whose state was replaced through another");
        lines.push_back("handle, is undefined behavior.");
    }
    lines.push_back("Handles point into this object and must not outlive or survive a move of it.");

    if (config.diagramEnabled) {
        std::shared_ptr<IDiagramRenderer> renderer = diagramRenderer_;
        if (!renderer) {
            renderer = std::make_shared<MermaidRenderer>(config.renameMethods);
        }
        lines.emplace_back();
        for (auto &line : splitLines(renderer->render(graph))) {
            lines.push_back(std::move(line));
        }
    }

    writeDocLines(ss, "", lines);
}

void EntryCodeGenerator::generateVertexStructs(std::stringstream &ss, const std::vector<VertexClass> &classes) const {
    for (const auto &vertexClass : classes) {
        const Vertex &vertex = *vertexClass.vertex;

        std::vector<std::string> lines = vertex.doc;
        if (!lines.empty()) {
            lines.emplace_back();
        }
        for (auto &line : reachabilityDoc(vertexClass, classes)) {
            lines.push_back(std::move(line));
        }
        writeDocLines(ss, MEMBER_INDENT, lines);

        if (vertex.hasPayload()) {
            ss << MEMBER_INDENT << "struct " << vertex.name << " {\n";
            ss << HANDLE_INDENT << *vertex.payloadType << " value;\n";
            ss << MEMBER_INDENT << "};\n\n";
        } else {
            ss << MEMBER_INDENT << "struct " << vertex.name << " {};\n\n";
        }
    }
}

void EntryCodeGenerator::generateTerminalCases(std::stringstream &ss, const std::vector<VertexClass> &classes) const {
    for (const auto &vertexClass : classes) {
        if (vertexClass.isActive()) {
            continue;
        }
        const Vertex &vertex = *vertexClass.vertex;

        if (vertex.hasPayload()) {
            ss << MEMBER_INDENT << "/// Entry case for `" << vertex.name
               << "`. Move from `value` to take ownership of the payload.\n";
            ss << MEMBER_INDENT << "struct " << vertex.name << "Terminal {\n";
            ss << HANDLE_INDENT << *vertex.payloadType << " &value;\n";
            ss << MEMBER_INDENT << "};\n\n";
        } else {
            ss << MEMBER_INDENT << "/// Entry case for `" << vertex.name << "`.\n";
            ss << MEMBER_INDENT << "struct " << vertex.name << "Terminal {};\n\n";
        }
    }
}

void EntryCodeGenerator::generateHandle(std::stringstream &ss, const VertexClass &vertexClass,
                                        const std::vector<VertexClass> &all, const GeneratorConfig &config) const {
    const Vertex &vertex = *vertexClass.vertex;
    const std::string handleName = vertex.name + "Handle";
    const std::string qualifiedVertex = config.machineName + "::" + vertex.name;
    const bool checked = config.safetyMode == SafetyMode::CHECKED;

    ss << MEMBER_INDENT << "/// Entry case for `" << vertex.name << "`: the capability to leave it.\n";
    ss << MEMBER_INDENT << "class " << handleName << " {\n";

    if (!checked) {
        ss << MEMBER_INDENT << "    friend class " << config.machineName << ";\n\n";
        ss << MEMBER_INDENT << "    explicit " << handleName << "(" << config.machineName
           << "::State &state) : state_(&state) {}\n\n";
    }

    ss << MEMBER_INDENT << "public:\n";
    if (checked) {
        ss << HANDLE_INDENT << "explicit " << handleName << "(" << config.machineName
           << "::State &state) : state_(&state) {}\n";
    }
    ss << HANDLE_INDENT << handleName << "(const " << handleName << " &) = delete;\n";
    ss << HANDLE_INDENT << handleName << " &operator=(const " << handleName << " &) = delete;\n";
    ss << HANDLE_INDENT << handleName << "(" << handleName
       << " &&other) noexcept : state_(std::exchange(other.state_, nullptr)) {}\n";
    ss << HANDLE_INDENT << handleName << " &operator=(" << handleName << " &&other) noexcept {\n";
    ss << BODY_INDENT << "state_ = std::exchange(other.state_, nullptr);\n";
    ss << BODY_INDENT << "return *this;\n";
    ss << HANDLE_INDENT << "}\n\n";

    if (vertex.hasPayload()) {
        ss << HANDLE_INDENT << "const " << *vertex.payloadType << " &get() const {\n";
        ss << BODY_INDENT << "return currentCase().value;\n";
        ss << HANDLE_INDENT << "}\n\n";
        ss << HANDLE_INDENT << *vertex.payloadType << " &get_mut() {\n";
        ss << BODY_INDENT << "return currentCase().value;\n";
        ss << HANDLE_INDENT << "}\n\n";
    }

    for (const auto &edge : vertexClass.outgoing) {
        generateTransition(ss, vertexClass, edge, all, config);
    }

    ss << MEMBER_INDENT << "private:\n";
    if (checked) {
        ss << HANDLE_INDENT << qualifiedVertex << " &currentCase() const {\n";
        ss << BODY_INDENT << "if (state_ == nullptr) {\n";
        ss << BODY_INDENT << "    " << config.machineName << "::mismatch(\"" << handleName
           << " used after its transition\");\n";
        ss << BODY_INDENT << "}\n";
        ss << BODY_INDENT << "auto *current = std::get_if<" << qualifiedVertex << ">(state_);\n";
        ss << BODY_INDENT << "if (current == nullptr) {\n";
        ss << BODY_INDENT << "    " << config.machineName << "::mismatch(\"" << handleName
           << " was constructed for a mismatched state\");\n";
        ss << BODY_INDENT << "}\n";
        ss << BODY_INDENT << "return *current;\n";
        ss << HANDLE_INDENT << "}\n\n";
    } else if (vertex.hasPayload()) {
        ss << HANDLE_INDENT << "// Only entry() creates handles, so the state holds " << vertex.name << "\n";
        ss << HANDLE_INDENT << qualifiedVertex << " &currentCase() const {\n";
        ss << BODY_INDENT << "return *std::get_if<" << qualifiedVertex << ">(state_);\n";
        ss << HANDLE_INDENT << "}\n\n";
    }
    ss << HANDLE_INDENT << config.machineName << "::State *state_;\n";
    ss << MEMBER_INDENT << "};\n\n";
}

void EntryCodeGenerator::generateTransition(std::stringstream &ss, const VertexClass &source,
                                            const ResolvedEdge &edge, const std::vector<VertexClass> &all,
                                            const GeneratorConfig &config) const {
    const Vertex &from = *source.vertex;
    const Vertex &to = *all[edge.peerIndex].vertex;
    const std::string qualifiedTarget = config.machineName + "::" + to.name;

    std::vector<std::string> lines = edge.edge->doc;
    if (!lines.empty()) {
        lines.emplace_back();
    }
    lines.push_back("Transition to `" + to.name + "`" +
                    (to.hasPayload() ? ", storing `next`." : ".") + " Spends this handle.");
    if (from.hasPayload()) {
        lines.push_back("Returns the payload of `" + from.name + "`.");
    }
    writeDocLines(ss, HANDLE_INDENT, lines);

    ss << HANDLE_INDENT;
    if (from.hasPayload()) {
        ss << "[[nodiscard]] " << *from.payloadType;
    } else {
        ss << "void";
    }
    ss << " " << edge.methodName << "(";
    if (to.hasPayload()) {
        ss << *to.payloadType << " next";
    }
    ss << ") {\n";

    if (from.hasPayload()) {
        ss << BODY_INDENT << *from.payloadType << " previous = std::move(currentCase().value);\n";
    } else if (config.safetyMode == SafetyMode::CHECKED) {
        ss << BODY_INDENT << "currentCase();\n";
    }

    ss << BODY_INDENT << "*std::exchange(state_, nullptr) = " << qualifiedTarget;
    ss << (to.hasPayload() ? "{std::move(next)};\n" : "{};\n");

    if (from.hasPayload()) {
        ss << BODY_INDENT << "return previous;\n";
    }
    ss << HANDLE_INDENT << "}\n\n";
}

void EntryCodeGenerator::generateEntryDispatch(std::stringstream &ss, const std::vector<VertexClass> &classes,
                                               const GeneratorConfig &config) const {
    ss << MEMBER_INDENT << "/// What the current state allows: a handle or a terminal case per state.\n";
    ss << MEMBER_INDENT << "using " << config.entryTypeName << " " << joinAttributes(config.attributes)
       << "= std::variant<";
    for (size_t i = 0; i < classes.size(); ++i) {
        ss << (i > 0 ? ", " : "") << entryCaseName(classes[i]);
    }
    ss << ">;\n\n";

    ss << MEMBER_INDENT << "/// Inspect the current state. Does not change it.\n";
    ss << MEMBER_INDENT << config.entryTypeName << " entry() {\n";
    ss << HANDLE_INDENT << "return std::visit([this](auto &current) -> " << config.entryTypeName
       << " { return this->makeEntry(current); }, state_);\n";
    ss << MEMBER_INDENT << "}\n\n";

    ss << "private:\n";
    for (const auto &vertexClass : classes) {
        const Vertex &vertex = *vertexClass.vertex;
        if (vertexClass.isActive()) {
            ss << MEMBER_INDENT << config.entryTypeName << " makeEntry(" << vertex.name << " &) {\n";
            ss << HANDLE_INDENT << "return " << vertex.name << "Handle(state_);\n";
        } else if (vertex.hasPayload()) {
            ss << MEMBER_INDENT << config.entryTypeName << " makeEntry(" << vertex.name << " &current) {\n";
            ss << HANDLE_INDENT << "return " << vertex.name << "Terminal{current.value};\n";
        } else {
            ss << MEMBER_INDENT << config.entryTypeName << " makeEntry(" << vertex.name << " &) {\n";
            ss << HANDLE_INDENT << "return " << vertex.name << "Terminal{};\n";
        }
        ss << MEMBER_INDENT << "}\n\n";
    }

    if (config.safetyMode == SafetyMode::CHECKED) {
        ss << MEMBER_INDENT << "[[noreturn]] static void mismatch(const char *message) {\n";
        ss << HANDLE_INDENT << "std::fprintf(stderr, \"" << config.machineName << ": %s\\n\", message);\n";
        ss << HANDLE_INDENT << "std::abort();\n";
        ss << MEMBER_INDENT << "}\n\n";
    }

    ss << MEMBER_INDENT << "State state_;\n";
}

std::string EntryCodeGenerator::entryCaseName(const VertexClass &vertexClass) {
    return vertexClass.vertex->name + (vertexClass.isActive() ? "Handle" : "Terminal");
}

void EntryCodeGenerator::writeDocLines(std::stringstream &ss, const std::string &indent,
                                       const std::vector<std::string> &lines) {
    for (const auto &line : lines) {
        ss << indent << "///" << (line.empty() ? "" : " " + line) << "\n";
    }
}

bool EntryCodeGenerator::writeToFile(const std::string &path, const std::string &content) {
    fs::path filePath(path);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(filePath.parent_path(), ec);
        if (ec) {
            LOG_ERROR("EntryCodeGenerator: Failed to create directory {}: {}", filePath.parent_path().string(),
                      ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("EntryCodeGenerator: Failed to open file for writing: {}", path);
        return false;
    }

    file << content;
    file.close();
    if (file.fail()) {
        LOG_ERROR("EntryCodeGenerator: Failed to write {}", path);
        return false;
    }

    LOG_DEBUG("EntryCodeGenerator: Successfully wrote {} bytes to {}", content.size(), path);
    return true;
}

}  // namespace ESM
