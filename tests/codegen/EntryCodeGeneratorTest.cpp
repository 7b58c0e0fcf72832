#include "codegen/EntryCodeGenerator.h"
#include "mocks/MockDiagramRenderer.h"
#include "model/GraphBuilder.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace ESM;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Return;

class EntryCodeGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Red -> RedAmber -> Green -> Amber, Green carries a string
        GraphBuilder builder;
        builder.setName("TrafficLight").addDocumentation({"A UK traffic light."});
        builder.addVertex("Red");
        builder.addVertex("RedAmber");
        builder.addVertex("Green", std::string("std::string"), {"Go, with a reason."});
        builder.addVertex("Amber");
        builder.addEdge("Red", "RedAmber");
        builder.addEdge("RedAmber", "Green");
        builder.addEdge("Green", "Amber", std::nullopt, {"Prepare to stop."});
        graph_ = *builder.build();
    }

    std::string generate(const GeneratorConfig &config) {
        EntryCodeGenerator generator(config);
        auto header = generator.generate(graph_);
        EXPECT_TRUE(header.has_value());
        EXPECT_FALSE(generator.hasErrors());
        return header.value_or("");
    }

    Graph graph_;
};

TEST_F(EntryCodeGeneratorTest, PreambleAndClassShape) {
    GeneratorConfig config;
    config.includes = {"<string>", "\"payload.h\"", "vector"};
    std::string header = generate(config);

    EXPECT_EQ(header.rfind("// Generated by esm-codegen from the 'TrafficLight' state graph. Do not edit.\n"
                           "#pragma once\n",
                           0),
              0u);
    EXPECT_THAT(header, HasSubstr("#include <cstdio>\n#include <cstdlib>\n#include <utility>\n#include <variant>\n"
                                  "#include <string>\n#include \"payload.h\"\n#include <vector>\n"));
    EXPECT_THAT(header, HasSubstr("/// A UK traffic light.\n///\n"));
    EXPECT_THAT(header, HasSubstr("class TrafficLight {\npublic:\n"));
    EXPECT_THAT(header, HasSubstr("using State = std::variant<Red, RedAmber, Green, Amber>;"));
    EXPECT_THAT(header, HasSubstr("explicit TrafficLight(State initial) : state_(std::move(initial)) {}"));
    EXPECT_THAT(header, HasSubstr("using Entry = std::variant<RedHandle, RedAmberHandle, GreenHandle, AmberTerminal>;"));
    EXPECT_THAT(header, Not(HasSubstr("namespace")));
    EXPECT_THAT(header, Not(HasSubstr("protected:")));
}

TEST_F(EntryCodeGeneratorTest, VertexStructsCarryPayloadAndReachability) {
    std::string header = generate(GeneratorConfig{});

    EXPECT_THAT(header, HasSubstr("    struct Red {};\n"));
    EXPECT_THAT(header, HasSubstr("    struct Green {\n        std::string value;\n    };\n"));
    EXPECT_THAT(header, HasSubstr("    /// Go, with a reason.\n    ///\n    /// Reachable from:\n"
                                  "    /// - `RedAmber` via `green()`\n    /// Can transition to:\n"
                                  "    /// - `Amber` via `amber()`\n"));
    EXPECT_THAT(header, HasSubstr("    /// Initial only: no transition leads to this state.\n"));
    EXPECT_THAT(header, HasSubstr("    /// Terminal: no transition leaves this state.\n"));
}

TEST_F(EntryCodeGeneratorTest, TransitionsMovePayloads) {
    std::string header = generate(GeneratorConfig{});

    EXPECT_THAT(header, HasSubstr("        void red_amber() {\n            currentCase();\n"
                                  "            *std::exchange(state_, nullptr) = TrafficLight::RedAmber{};\n"));
    EXPECT_THAT(header, HasSubstr("        void green(std::string next) {\n"));
    EXPECT_THAT(header, HasSubstr("TrafficLight::Green{std::move(next)};"));
    EXPECT_THAT(header, HasSubstr("        /// Prepare to stop.\n        ///\n"
                                  "        /// Transition to `Amber`. Spends this handle.\n"
                                  "        /// Returns the payload of `Green`.\n"
                                  "        [[nodiscard]] std::string amber() {\n"
                                  "            std::string previous = std::move(currentCase().value);\n"));
    EXPECT_THAT(header, HasSubstr("        const std::string &get() const {\n"));
    EXPECT_THAT(header, HasSubstr("        std::string &get_mut() {\n"));
    EXPECT_THAT(header, HasSubstr("    struct AmberTerminal {};\n"));
}

TEST_F(EntryCodeGeneratorTest, CheckedModeVerifiesHandles) {
    std::string header = generate(GeneratorConfig{});

    EXPECT_THAT(header, HasSubstr("TrafficLight::mismatch(\"GreenHandle used after its transition\");"));
    EXPECT_THAT(header, HasSubstr("TrafficLight::mismatch(\"GreenHandle was constructed for a mismatched state\");"));
    EXPECT_THAT(header, HasSubstr("[[noreturn]] static void mismatch(const char *message) {"));
    EXPECT_THAT(header, HasSubstr("std::fprintf(stderr, \"TrafficLight: %s\\n\", message);"));
    EXPECT_THAT(header, HasSubstr("        explicit RedHandle(TrafficLight::State &state) : state_(&state) {}\n"));
    EXPECT_THAT(header, Not(HasSubstr("friend class")));
    EXPECT_THAT(header, HasSubstr("Handles verify on every call that the machine is still in their state,"));
}

TEST_F(EntryCodeGeneratorTest, TrustedModeOmitsChecks) {
    GeneratorConfig config;
    config.safetyMode = SafetyMode::TRUSTED;
    std::string header = generate(config);

    EXPECT_THAT(header, Not(HasSubstr("#include <cstdio>")));
    EXPECT_THAT(header, Not(HasSubstr("mismatch")));
    EXPECT_THAT(header, HasSubstr("    class RedHandle {\n        friend class TrafficLight;\n\n"
                                  "        explicit RedHandle(TrafficLight::State &state) : state_(&state) {}\n\n"
                                  "    public:\n"));
    EXPECT_THAT(header, HasSubstr("return *std::get_if<TrafficLight::Green>(state_);"));
    // Handles of payload-free states never look at the storage
    EXPECT_THAT(header, Not(HasSubstr("TrafficLight::Red &currentCase()")));
    EXPECT_THAT(header, HasSubstr("Handles are created only by entry() and are spent by their transition."));
}

TEST_F(EntryCodeGeneratorTest, ProtectedEntryAndCustomNames) {
    GeneratorConfig config;
    config.machineName = "Signal";
    config.entryTypeName = "Step";
    config.entryVisibility = EntryVisibility::PROTECTED;
    config.namespaceName = "rail::uk";
    config.attributes = {"[[maybe_unused]]"};
    std::string header = generate(config);

    EXPECT_THAT(header, HasSubstr("from the 'Signal' state graph"));
    EXPECT_THAT(header, HasSubstr("namespace rail::uk {\n\n"));
    EXPECT_THAT(header, HasSubstr("}  // namespace rail::uk\n"));
    EXPECT_THAT(header, HasSubstr("class [[maybe_unused]] Signal {"));
    EXPECT_THAT(header, HasSubstr("using State [[maybe_unused]] = std::variant<"));
    EXPECT_THAT(header, HasSubstr("using Step [[maybe_unused]] = std::variant<"));
    EXPECT_THAT(header, HasSubstr("    Step entry() {\n"));

    size_t protectedPos = header.find("protected:\n");
    ASSERT_NE(protectedPos, std::string::npos);
    EXPECT_LT(header.find("const State &state() const"), protectedPos);
    EXPECT_GT(header.find("class RedHandle"), protectedPos);
    EXPECT_GT(header.find("Step entry()"), protectedPos);
}

TEST_F(EntryCodeGeneratorTest, VerbatimMethodNamesAreQualified) {
    GeneratorConfig config;
    config.renameMethods = false;
    std::string header = generate(config);

    EXPECT_THAT(header, HasSubstr("        void RedAmber() {\n"));
    EXPECT_THAT(header, HasSubstr("*std::exchange(state_, nullptr) = TrafficLight::RedAmber{};"));
}

TEST_F(EntryCodeGeneratorTest, OutputIsDeterministic) {
    EXPECT_EQ(generate(GeneratorConfig{}), generate(GeneratorConfig{}));
}

TEST_F(EntryCodeGeneratorTest, IsolatedVertexWithPayloadGetsReferenceTerminal) {
    GraphBuilder builder;
    builder.setName("Island");
    builder.addVertex("Desert", std::string("std::vector<int>"));
    auto graph = *builder.build();

    EntryCodeGenerator generator{GeneratorConfig{}};
    auto header = generator.generate(graph);
    ASSERT_TRUE(header.has_value());
    EXPECT_THAT(*header, HasSubstr("    /// Isolated: no transition leads to or from this state.\n"));
    EXPECT_THAT(*header, HasSubstr("    struct DesertTerminal {\n        std::vector<int> &value;\n    };\n"));
    EXPECT_THAT(*header, HasSubstr("return DesertTerminal{current.value};"));
    EXPECT_THAT(*header, Not(HasSubstr("class DesertHandle")));
}

TEST_F(EntryCodeGeneratorTest, ValidationFailureEmitsNothing) {
    GraphBuilder builder;
    builder.setName("Broken");
    builder.addEdge("A", "B");
    builder.addEdge("A", "B");

    EntryCodeGenerator generator{GeneratorConfig{}};
    EXPECT_FALSE(generator.generate(*builder.build()).has_value());
    ASSERT_TRUE(generator.hasErrors());
    EXPECT_EQ(generator.getErrors()[0].kind, GenerationError::Kind::METHOD_NAME_COLLISION);

    auto dir = std::filesystem::temp_directory_path() / "esm_codegen_rejected";
    std::filesystem::remove_all(dir);
    EXPECT_FALSE(generator.generateToFile(*builder.build(), dir.string()));
    EXPECT_FALSE(std::filesystem::exists(dir / "Broken_sm.h"));
}

TEST_F(EntryCodeGeneratorTest, TargetsFoldingToOneMethodNameEmitNothing) {
    GraphBuilder builder;
    builder.setName("Folded");
    builder.addEdge("A", "FooBar");
    builder.addEdge("A", "fooBar");

    EntryCodeGenerator generator{GeneratorConfig{}};
    EXPECT_FALSE(generator.generate(*builder.build()).has_value());
    ASSERT_EQ(generator.getErrors().size(), 1u);
    EXPECT_EQ(generator.getErrors()[0].kind, GenerationError::Kind::METHOD_NAME_COLLISION);
    EXPECT_EQ(generator.getErrors()[0].subject, "A");
    EXPECT_EQ(generator.getErrors()[0].name, "foo_bar");
}

TEST_F(EntryCodeGeneratorTest, NamesHidingOuterDeclarationsEmitNothing) {
    GraphBuilder selfPayload;
    selfPayload.setName("M");
    selfPayload.addVertex("Config", std::string("Config"));
    selfPayload.addEdge("Config", "Done");

    EntryCodeGenerator generator{GeneratorConfig{}};
    EXPECT_FALSE(generator.generate(*selfPayload.build()).has_value());
    EXPECT_EQ(generator.getErrors()[0].kind, GenerationError::Kind::RESERVED_NAME_COLLISION);

    GraphBuilder stdVertex;
    stdVertex.setName("M");
    stdVertex.addEdge("A", "std");
    EXPECT_FALSE(generator.generate(*stdVertex.build()).has_value());
    EXPECT_EQ(generator.getErrors()[0].kind, GenerationError::Kind::RESERVED_NAME_COLLISION);
}

TEST_F(EntryCodeGeneratorTest, TemplateParametersMakeAClassTemplate) {
    GraphBuilder builder;
    builder.setName("Pile");
    builder.addVertex("Filling", std::string("std::vector<T>"));
    builder.addVertex("Sealed", std::string("T"));
    builder.addEdge("Filling", "Sealed");
    auto graph = *builder.build();

    GeneratorConfig config;
    config.templateParameters = {"typename T"};
    config.staticAsserts = {"std::is_copy_constructible_v<T>", "sizeof(T) > 0 && \"T\"[0] == 'T'"};
    EntryCodeGenerator generator(config);
    auto header = generator.generate(graph);
    ASSERT_TRUE(header.has_value());

    EXPECT_THAT(*header, HasSubstr("template <typename T>\nclass Pile {\npublic:\n"
                                   "    static_assert(std::is_copy_constructible_v<T>, "
                                   "\"Pile requires std::is_copy_constructible_v<T>\");\n"));
    EXPECT_THAT(*header, HasSubstr("\"Pile requires sizeof(T) > 0 && \\\"T\\\"[0] == 'T'\");"));
    EXPECT_THAT(*header, HasSubstr("    struct Filling {\n        std::vector<T> value;\n    };\n"));
    EXPECT_THAT(*header, HasSubstr("        [[nodiscard]] std::vector<T> sealed(T next) {\n"));
    EXPECT_THAT(*header, HasSubstr("        explicit FillingHandle(Pile::State &state) : state_(&state) {}\n"));
    EXPECT_THAT(*header, HasSubstr("{ return this->makeEntry(current); }"));
}

TEST_F(EntryCodeGeneratorTest, NonTemplateMachineHasNoTemplateHeader) {
    std::string header = generate(GeneratorConfig{});
    EXPECT_THAT(header, Not(HasSubstr("template <")));
    EXPECT_THAT(header, Not(HasSubstr("static_assert")));
}

TEST_F(EntryCodeGeneratorTest, ErrorsAreClearedOnNextRun) {
    GeneratorConfig config;
    config.entryTypeName = "TrafficLight";
    EntryCodeGenerator generator(config);
    EXPECT_FALSE(generator.generate(graph_).has_value());
    EXPECT_TRUE(generator.hasErrors());

    GraphBuilder builder;
    builder.setName("Other");
    builder.addEdge("A", "B");
    EXPECT_TRUE(generator.generate(*builder.build()).has_value());
    EXPECT_FALSE(generator.hasErrors());
}

TEST_F(EntryCodeGeneratorTest, GenerateToFileWritesMachineHeader) {
    auto dir = std::filesystem::temp_directory_path() / "esm_codegen_test" / "nested";
    std::filesystem::remove_all(dir.parent_path());

    EntryCodeGenerator generator{GeneratorConfig{}};
    EXPECT_EQ(generator.getOutputFileName(graph_), "TrafficLight_sm.h");
    ASSERT_TRUE(generator.generateToFile(graph_, dir.string()));

    std::ifstream file(dir / "TrafficLight_sm.h");
    ASSERT_TRUE(file.is_open());
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str(), *generator.generate(graph_));

    std::filesystem::remove_all(dir.parent_path());
}

TEST_F(EntryCodeGeneratorTest, DiagramUsesInjectedRenderer) {
    GeneratorConfig config;
    config.diagramEnabled = true;
    auto renderer = std::make_shared<MockDiagramRenderer>();
    EXPECT_CALL(*renderer, render(_)).WillOnce(Return("line one\nline two\n"));

    EntryCodeGenerator generator(config);
    generator.setDiagramRenderer(renderer);
    auto header = generator.generate(graph_);
    ASSERT_TRUE(header.has_value());
    EXPECT_THAT(*header, HasSubstr("must not outlive or survive a move of it.\n///\n/// line one\n/// line two\n"));
}

TEST_F(EntryCodeGeneratorTest, RendererIsUnusedWithoutDiagrams) {
    auto renderer = std::make_shared<MockDiagramRenderer>();
    EXPECT_CALL(*renderer, render(_)).Times(0);

    EntryCodeGenerator generator{GeneratorConfig{}};
    generator.setDiagramRenderer(renderer);
    EXPECT_TRUE(generator.generate(graph_).has_value());
}

TEST_F(EntryCodeGeneratorTest, DefaultDiagramIsMermaid) {
    GeneratorConfig config;
    config.diagramEnabled = true;
    std::string header = generate(config);

    EXPECT_THAT(header, HasSubstr("/// ```mermaid\n/// graph LR\n"));
    EXPECT_THAT(header, HasSubstr("///     Green -->|amber| Amber\n"));
}

TEST_F(EntryCodeGeneratorTest, NullRendererIsRejected) {
    EntryCodeGenerator generator{GeneratorConfig{}};
    EXPECT_THROW(generator.setDiagramRenderer(nullptr), std::invalid_argument);
}
