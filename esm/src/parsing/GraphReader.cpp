#include "parsing/GraphReader.h"
#include "common/Logger.h"
#include "parsing/DotGraphReader.h"
#include "parsing/DslGraphReader.h"
#include "parsing/ScxmlGraphReader.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace ESM {

std::optional<Graph> GraphReader::parseFile(const std::string &filename) {
    initParsing();

    if (!std::filesystem::exists(filename)) {
        addError("File not found: " + filename);
        return std::nullopt;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        addError("Cannot open file: " + filename);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("GraphReader: Parsing {}", filename);
    return parseContent(buffer.str());
}

std::vector<std::string> GraphReader::getErrorMessages() const {
    std::vector<std::string> messages;
    messages.reserve(errors_.size());
    for (const auto &error : errors_) {
        messages.push_back(error.toString());
    }
    return messages;
}

std::unique_ptr<GraphReader> GraphReader::createForFile(const std::string &filename) {
    std::string extension = std::filesystem::path(filename).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".fsm") {
        return createForLanguage("fsm");
    }
    if (extension == ".dot" || extension == ".gv") {
        return createForLanguage("dot");
    }
    if (extension == ".scxml" || extension == ".xml") {
        return createForLanguage("scxml");
    }

    LOG_WARN("GraphReader: No reader for extension '{}' ({})", extension, filename);
    return nullptr;
}

std::unique_ptr<GraphReader> GraphReader::createForLanguage(const std::string &language) {
    if (language == "fsm") {
        return std::make_unique<DslGraphReader>();
    }
    if (language == "dot") {
        return std::make_unique<DotGraphReader>();
    }
    if (language == "scxml") {
        return std::make_unique<ScxmlGraphReader>();
    }
    return nullptr;
}

void GraphReader::initParsing() {
    errors_.clear();
}

void GraphReader::addError(const std::string &message, SourceLocation location) {
    LOG_DEBUG("GraphReader: {}:{}: {}", location.line, location.column, message);
    errors_.emplace_back(GenerationError::Kind::SYNTAX_ERROR, "", "", message, GenerationError::NO_POSITION,
                         location);
}

std::optional<Graph> GraphReader::finish(const GraphBuilder &builder) {
    for (const auto &error : builder.getErrors()) {
        errors_.push_back(error);
    }

    if (hasErrors()) {
        LOG_ERROR("GraphReader: Parsing failed with {} error(s)", errors_.size());
        return std::nullopt;
    }
    return builder.build();
}

}  // namespace ESM
