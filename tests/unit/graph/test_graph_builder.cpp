//
// Created by gregorian-rayne on 2/18/26.
//

#include "kda/graph/graph_builder.hpp"

#include <gtest/gtest.h>

namespace kda::graph
{
    TEST(GraphBuilderTest, EmptyInput) {
        const auto graph = build_dependency_graph({});

        EXPECT_TRUE(graph.empty());
        EXPECT_EQ(graph.edge_count(), 0u);
    }

    TEST(GraphBuilderTest, BuildsForwardAndReverseAdjacency) {
        const auto graph = build_dependency_graph({
            {"A", {"B", "C"}},
            {"B", {"C"}},
            {"C", {}},
        });

        EXPECT_EQ(graph.component_count(), 3u);
        EXPECT_EQ(graph.dependencies("A"), (std::vector<std::string>{"B", "C"}));
        EXPECT_EQ(graph.dependents("C"), (std::vector<std::string>{"A", "B"}));
        EXPECT_TRUE(graph.dependents("A").empty());
    }

    TEST(GraphBuilderTest, EveryAdjacencyKeyIsAComponent) {
        const auto graph = build_dependency_graph({{"A", {"X"}}, {"B", {"A"}}});

        for (const auto& [name, deps] : graph.adjacency()) {
            EXPECT_TRUE(graph.has_component(name)) << name;
        }
        EXPECT_FALSE(graph.adjacency().contains("X"));
        EXPECT_TRUE(graph.reverse_adjacency().contains("X"));
    }

    TEST(GraphBuilderTest, DefaultModeAcceptsDuplicates) {
        const GraphBuilder builder;
        const auto result = builder.build({{"A", {"B"}}, {"A", {}}, {"B", {}}});

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().dependencies("A").empty());
    }

    TEST(GraphBuilderTest, StrictModeRejectsDuplicates) {
        GraphBuilder builder;
        builder.set_reject_duplicate_names(true);
        EXPECT_TRUE(builder.reject_duplicate_names());

        const auto result = builder.build({{"A", {}}, {"B", {}}, {"A", {"B"}}});

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::DuplicateComponent);
        EXPECT_EQ(result.error().context().value(), "A");
    }

    TEST(GraphBuilderTest, StrictModeAcceptsUniqueNames) {
        GraphBuilder builder;
        builder.set_reject_duplicate_names(true);

        EXPECT_TRUE(builder.build({{"A", {"B"}}, {"B", {}}}).is_ok());
    }

    TEST(GraphBuilderTest, FindDuplicateNames) {
        const auto duplicates = find_duplicate_names({
            {"x", {}}, {"y", {}}, {"y", {}}, {"x", {}}, {"y", {}},
        });

        EXPECT_EQ(duplicates, (std::vector<std::string>{"y", "x"}));
    }

}  // namespace kda::graph
