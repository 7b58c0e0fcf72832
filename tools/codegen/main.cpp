#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "codegen/DiagramExporter.h"
#include "codegen/EntryCodeGenerator.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "config/ConfigLoader.h"
#include "parsing/GraphReader.h"

namespace fs = std::filesystem;

namespace {

// Flags given on the command line; unset ones leave the config file value in place
struct CommandLineOverrides {
    std::optional<std::string> machineName;
    std::optional<std::string> namespaceName;
    std::optional<std::string> entryTypeName;
    std::optional<std::string> entryVisibility;
    bool trusted = false;
    bool noRename = false;
    bool diagram = false;
    std::vector<std::string> attributes;
    std::vector<std::string> includes;
    std::vector<std::string> templateParameters;
    std::vector<std::string> staticAsserts;
};

void printUsage(const char *programName) {
    LOG_INFO("Entry state machine code generator");
    LOG_INFO("Generates a statically-checked C++17 state machine header from a state graph\n");
    LOG_INFO("Usage: {} [options] [input.fsm|input.dot|input.scxml|-]", programName);
    LOG_INFO("Reads standard input when the input is '-' or omitted");
    LOG_INFO("\nOptions:");
    LOG_INFO("  -o, --output <dir>            Output directory (default: current directory)");
    LOG_INFO("  --config <file>               Load generator options from a JSON file");
    LOG_INFO("  --print-config                Print the effective options as JSON and exit");
    LOG_INFO("  --lang <fsm|dot|scxml>        Input language (default: from the file extension, fsm for stdin)");
    LOG_INFO("  --name <Name>                 Machine class name (default: from the input)");
    LOG_INFO("  --namespace <a::b>            Namespace of the generated code");
    LOG_INFO("  --entry-name <Name>           Name of the entry type (default: Entry)");
    LOG_INFO("  --entry-visibility <v>        public or protected (default: public)");
    LOG_INFO("  --trusted                     Omit the runtime handle checks");
    LOG_INFO("  --no-rename                   Name transition methods exactly like their target state");
    LOG_INFO("  --diagram                     Embed a Mermaid diagram in the class documentation");
    LOG_INFO("  --attribute <[[attr]]>        Attribute for the machine, state and entry types (repeatable)");
    LOG_INFO("  --include <header>            Header needed by payload types (repeatable)");
    LOG_INFO("  --template-parameter <decl>   Make the machine a template, e.g. 'typename T' (repeatable)");
    LOG_INFO("  --static-assert <condition>   Constraint on the template parameters (repeatable)");
    LOG_INFO("  --emit-dot <file>             Also write the graph in DOT syntax");
    LOG_INFO("  -h, --help                    Show this help message");
    LOG_INFO("  -v, --verbose                 Enable verbose logging");
    LOG_INFO("  --log-dir <dir>               Also write the log to <dir>/esm.log");
    LOG_INFO("  --version                     Show version information\n");
    LOG_INFO("Examples:");
    LOG_INFO("  {} traffic_light.fsm", programName);
    LOG_INFO("  {} -o generated/ --trusted --include '<string>' door.dot", programName);
    LOG_INFO("  cat pile.fsm | {} --template-parameter 'typename T' --include '<vector>' -", programName);
    LOG_INFO("\nOutput:");
    LOG_INFO("  Generates <Machine>_sm.h in the output directory");
}

void printVersion() {
    LOG_INFO("esm-codegen version 1.0.0");
    LOG_INFO("Entry state machine code generator");
}

void applyOverrides(const CommandLineOverrides &overrides, ESM::GeneratorConfig &config) {
    if (overrides.machineName) {
        config.machineName = *overrides.machineName;
    }
    if (overrides.namespaceName) {
        config.namespaceName = *overrides.namespaceName;
    }
    if (overrides.entryTypeName) {
        config.entryTypeName = *overrides.entryTypeName;
    }
    if (overrides.trusted) {
        config.safetyMode = ESM::SafetyMode::TRUSTED;
    }
    if (overrides.noRename) {
        config.renameMethods = false;
    }
    if (overrides.diagram) {
        config.diagramEnabled = true;
    }
    config.attributes.insert(config.attributes.end(), overrides.attributes.begin(), overrides.attributes.end());
    config.includes.insert(config.includes.end(), overrides.includes.begin(), overrides.includes.end());
    config.templateParameters.insert(config.templateParameters.end(), overrides.templateParameters.begin(),
                                     overrides.templateParameters.end());
    config.staticAsserts.insert(config.staticAsserts.end(), overrides.staticAsserts.begin(),
                                overrides.staticAsserts.end());
}

void reportErrors(const std::string &inputFile, const std::vector<ESM::GenerationError> &errors) {
    for (const auto &error : errors) {
        LOG_ERROR("{}:{}", inputFile, error.toString());
    }
}

}  // namespace

int main(int argc, char *argv[]) {
    std::string inputFile;
    std::string outputDir = ".";
    std::string configFile;
    std::string language;
    std::string dotFile;
    std::string logDir;
    bool verbose = false;
    bool printConfig = false;
    CommandLineOverrides overrides;

    // Options taking a value; returns nullopt and reports when the value is missing
    auto nextValue = [&](int &i, const std::string &option) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        LOG_ERROR("Error: {} requires a value", option);
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--version") {
            printVersion();
            return 0;
        } else if (arg == "--print-config") {
            printConfig = true;
        } else if (arg == "--trusted") {
            overrides.trusted = true;
        } else if (arg == "--no-rename") {
            overrides.noRename = true;
        } else if (arg == "--diagram") {
            overrides.diagram = true;
        } else if (arg.starts_with("--output=")) {
            outputDir = arg.substr(9);
        } else if (arg == "-o" || arg == "--output" || arg == "--config" || arg == "--lang" || arg == "--name" ||
                   arg == "--namespace" || arg == "--entry-name" || arg == "--entry-visibility" ||
                   arg == "--attribute" || arg == "--include" || arg == "--template-parameter" ||
                   arg == "--static-assert" || arg == "--emit-dot" || arg == "--log-dir") {
            auto value = nextValue(i, arg);
            if (!value) {
                return 1;
            }
            if (arg == "-o" || arg == "--output") {
                outputDir = *value;
            } else if (arg == "--config") {
                configFile = *value;
            } else if (arg == "--lang") {
                language = *value;
            } else if (arg == "--name") {
                overrides.machineName = *value;
            } else if (arg == "--namespace") {
                overrides.namespaceName = *value;
            } else if (arg == "--entry-name") {
                overrides.entryTypeName = *value;
            } else if (arg == "--entry-visibility") {
                overrides.entryVisibility = *value;
            } else if (arg == "--attribute") {
                overrides.attributes.push_back(*value);
            } else if (arg == "--include") {
                overrides.includes.push_back(*value);
            } else if (arg == "--template-parameter") {
                overrides.templateParameters.push_back(*value);
            } else if (arg == "--static-assert") {
                overrides.staticAsserts.push_back(*value);
            } else if (arg == "--log-dir") {
                logDir = *value;
            } else {
                dotFile = *value;
            }
        } else if (arg.starts_with("-") && arg != "-") {
            LOG_ERROR("Error: Unknown option {}", arg);
            printUsage(argv[0]);
            return 1;
        } else {
            if (inputFile.empty()) {
                inputFile = arg;
            } else {
                LOG_ERROR("Error: Multiple input files specified");
                return 1;
            }
        }
    }

    if (!logDir.empty()) {
        ESM::Logger::initialize(logDir);
    }

    if (verbose) {
        ESM::Logger::setLevel(spdlog::level::debug);
        LOG_DEBUG("Verbose mode enabled");
    }

    ESM::GeneratorConfig config;
    if (!configFile.empty()) {
        ESM::ConfigLoader loader;
        if (!loader.loadFile(configFile, config)) {
            for (const auto &message : loader.getErrorMessages()) {
                LOG_ERROR("{}: {}", configFile, message);
            }
            return 1;
        }
    }
    applyOverrides(overrides, config);
    if (overrides.entryVisibility) {
        auto visibility = ESM::parseEntryVisibility(*overrides.entryVisibility);
        if (!visibility) {
            LOG_ERROR("Error: --entry-visibility must be 'public' or 'protected', got '{}'",
                      *overrides.entryVisibility);
            return 1;
        }
        config.entryVisibility = *visibility;
    }

    if (printConfig) {
        std::cout << ESM::JsonUtils::toPrettyString(ESM::ConfigLoader::toJson(config)) << std::endl;
        return 0;
    }

    const bool fromStdin = inputFile.empty() || inputFile == "-";
    if (fromStdin) {
        inputFile = "<stdin>";
        if (language.empty()) {
            language = "fsm";
        }
    } else if (!fs::exists(inputFile)) {
        LOG_ERROR("Error: Input file '{}' does not exist", inputFile);
        return 1;
    }

    auto reader = language.empty() ? ESM::GraphReader::createForFile(inputFile)
                                   : ESM::GraphReader::createForLanguage(language);
    if (!reader) {
        LOG_ERROR("Error: Cannot tell the input language of '{}', use --lang fsm|dot|scxml", inputFile);
        return 1;
    }

    try {
        LOG_INFO("Input file: {}", inputFile);
        LOG_INFO("Output directory: {}", outputDir);

        std::optional<ESM::Graph> graph;
        if (fromStdin) {
            std::stringstream buffer;
            buffer << std::cin.rdbuf();
            graph = reader->parseContent(buffer.str());
        } else {
            graph = reader->parseFile(inputFile);
        }
        if (!graph) {
            reportErrors(inputFile, reader->getErrors());
            LOG_ERROR("Error: Failed to read '{}'", inputFile);
            return 1;
        }

        if (config.machineName.empty() && graph->getName().empty()) {
            if (fromStdin) {
                LOG_ERROR("Error: Input names no state machine, use --name");
                return 1;
            }
            config.machineName = fs::path(inputFile).stem().string();
            LOG_WARN("Input names no state machine, using the file name: {}", config.machineName);
        }

        ESM::EntryCodeGenerator generator(config);
        if (!generator.generateToFile(*graph, outputDir)) {
            reportErrors(inputFile, generator.getErrors());
            LOG_ERROR("Error: Code generation failed");
            return 1;
        }

        LOG_INFO("Generated: {}", (fs::path(outputDir) / generator.getOutputFileName(*graph)).string());

        if (!dotFile.empty()) {
            std::ofstream dot(dotFile);
            if (!dot.is_open()) {
                LOG_ERROR("Error: Cannot write DOT file '{}'", dotFile);
                return 1;
            }
            dot << ESM::DiagramExporter(config.renameMethods).toDot(*graph);
            LOG_INFO("Wrote DOT graph: {}", dotFile);
        }

        return 0;

    } catch (const std::exception &e) {
        LOG_ERROR("Error: {}", e.what());
        return 1;
    }
}
