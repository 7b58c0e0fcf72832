#include "model/GraphBuilder.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ESM;

class GraphBuilderTest : public ::testing::Test {
protected:
    GraphBuilder builder_;
};

TEST_F(GraphBuilderTest, KeepsDeclarationOrder) {
    builder_.addVertex("Red");
    builder_.addVertex("Green", std::string("std::string"), {"green doc"});
    builder_.addEdge("Red", "Green");

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    ASSERT_EQ(graph->getVertices().size(), 2u);
    EXPECT_EQ(graph->getVertices()[0].name, "Red");
    EXPECT_EQ(graph->getVertices()[1].name, "Green");
    EXPECT_EQ(graph->getVertices()[1].index, 1u);
    EXPECT_EQ(graph->getVertices()[1].payloadType, std::optional<std::string>("std::string"));
    EXPECT_EQ(graph->getVertices()[1].doc, (std::vector<std::string>{"green doc"}));
    ASSERT_EQ(graph->getEdges().size(), 1u);
    EXPECT_EQ(graph->getEdges()[0].source, "Red");
    EXPECT_EQ(graph->getEdges()[0].target, "Green");
}

TEST_F(GraphBuilderTest, EdgesCreateMissingVerticesImplicitly) {
    builder_.addEdge("A", "Z");

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    ASSERT_NE(graph->findVertex("Z"), nullptr);
    EXPECT_FALSE(graph->findVertex("Z")->hasPayload());
    EXPECT_TRUE(graph->findVertex("Z")->doc.empty());
    EXPECT_TRUE(graph->findVertex("Z")->implicit);
    EXPECT_EQ(graph->indexOf("A"), std::optional<size_t>(0));
    EXPECT_EQ(graph->indexOf("Z"), std::optional<size_t>(1));
}

TEST_F(GraphBuilderTest, LaterDeclarationFillsInImplicitVertex) {
    builder_.addEdge("A", "B");
    EXPECT_TRUE(builder_.addVertex("B", std::string("int"), {"declared late"}, SourceLocation{4, 5}));

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    const Vertex *b = graph->findVertex("B");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->implicit);
    EXPECT_EQ(b->payloadType, std::optional<std::string>("int"));
    EXPECT_EQ(b->doc, (std::vector<std::string>{"declared late"}));
    EXPECT_EQ(b->location.line, 4u);
    EXPECT_EQ(b->index, 1u);
}

TEST_F(GraphBuilderTest, PayloadMismatchIsDuplicateVertex) {
    EXPECT_TRUE(builder_.addVertex("A", std::string("int")));
    EXPECT_FALSE(builder_.addVertex("A"));

    EXPECT_TRUE(builder_.hasErrors());
    ASSERT_EQ(builder_.getErrors().size(), 1u);
    EXPECT_EQ(builder_.getErrors()[0].kind, GenerationError::Kind::DUPLICATE_VERTEX);
    EXPECT_EQ(builder_.getErrors()[0].name, "A");
    EXPECT_FALSE(builder_.build().has_value());
}

TEST_F(GraphBuilderTest, DifferentPayloadTypesAreDuplicateVertex) {
    builder_.addVertex("A", std::string("int"));
    EXPECT_FALSE(builder_.addVertex("A", std::string("long")));
    EXPECT_EQ(builder_.getErrors()[0].kind, GenerationError::Kind::DUPLICATE_VERTEX);
}

TEST_F(GraphBuilderTest, MatchingRedeclarationAppendsDocumentation) {
    builder_.addVertex("A", std::string("std::map<int, int>"), {"first"});
    EXPECT_TRUE(builder_.addVertex("A", std::string("std::map<int,  int>"), {"second"}));

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->getVertices().size(), 1u);
    EXPECT_EQ(graph->getVertices()[0].doc, (std::vector<std::string>{"first", "", "second"}));
}

TEST_F(GraphBuilderTest, ParallelEdgesAreKept) {
    builder_.addEdge("A", "B");
    builder_.addEdge("A", "B", std::string("again"));

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    ASSERT_EQ(graph->getEdges().size(), 2u);
    EXPECT_EQ(graph->getEdges()[1].index, 1u);
    EXPECT_EQ(graph->getEdges()[1].methodOverride, std::optional<std::string>("again"));
}

TEST_F(GraphBuilderTest, NameAndDocumentation) {
    builder_.setName("Machine").addDocumentation({"line one"}).addDocumentation({"line two"});

    auto graph = builder_.build();
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->getName(), "Machine");
    EXPECT_EQ(graph->getDocumentation(), (std::vector<std::string>{"line one", "", "line two"}));
    EXPECT_TRUE(graph->empty());
}

TEST_F(GraphBuilderTest, EmptyNamesAreRejected) {
    EXPECT_THROW(builder_.addVertex(""), std::invalid_argument);
    EXPECT_THROW(builder_.addEdge("A", ""), std::invalid_argument);
}
