/**
 * @file dependency_graph_tests.cpp
 * @brief Unit tests for DependencyGraph and import resolution.
 */
#include <gtest/gtest.h>
#include "dependency_graph.hpp"
#include "module_scanner.hpp"

using namespace module_concat;

namespace {

ModuleTable make_table(const std::vector<std::pair<std::string, std::string>>& modules)
{
    ModuleScanner scanner(ScanOptions{});
    ModuleTable table;
    for (const auto& [id, content] : modules) table.add(scanner.scan_text(id, content));
    return table;
}

} // namespace

// ============================================================================
// Graph structure
// ============================================================================

TEST(DependencyGraphTests, AddEdge_IdempotentAndNoSelfEdges)
{
    DependencyGraph graph;
    graph.add_node("a.py");
    graph.add_node("b.py");

    EXPECT_TRUE(graph.add_edge("a.py", "b.py"));
    EXPECT_FALSE(graph.add_edge("a.py", "b.py"));
    EXPECT_FALSE(graph.add_edge("a.py", "a.py"));
    EXPECT_FALSE(graph.add_edge("a.py", "unknown.py"));

    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_TRUE(graph.has_edge("a.py", "b.py"));
    EXPECT_FALSE(graph.has_edge("b.py", "a.py"));
}

TEST(DependencyGraphTests, AddNode_ReturnsExistingIndex)
{
    DependencyGraph graph;
    EXPECT_EQ(graph.add_node("a.py"), 0u);
    EXPECT_EQ(graph.add_node("b.py"), 1u);
    EXPECT_EQ(graph.add_node("a.py"), 0u);
    EXPECT_EQ(graph.node_count(), 2u);
}

// ============================================================================
// Relative resolution
// ============================================================================

TEST(DependencyGraphBuilderTests, Relative_SiblingAtRoot)
{
    auto table = make_table({
        {"a.py", ""},
        {"b.py", "from .a import thing\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);

    EXPECT_TRUE(graph.has_edge("a.py", "b.py"));
    EXPECT_EQ(graph.edge_count(), 1u);
}

TEST(DependencyGraphBuilderTests, Relative_ParentPackageWithTwoDots)
{
    auto table = make_table({
        {"pkg/core/base.py", ""},
        {"pkg/util.py", ""},
        {"pkg/core/impl.py", "from ..util import helper\nfrom .base import Base\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);

    EXPECT_TRUE(graph.has_edge("pkg/util.py", "pkg/core/impl.py"));
    EXPECT_TRUE(graph.has_edge("pkg/core/base.py", "pkg/core/impl.py"));
}

TEST(DependencyGraphBuilderTests, Relative_DottedRemainderBecomesPath)
{
    auto table = make_table({
        {"pkg/sub/leaf.py", ""},
        {"pkg/main.py", "from .sub.leaf import x\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_TRUE(graph.has_edge("pkg/sub/leaf.py", "pkg/main.py"));
}

TEST(DependencyGraphBuilderTests, Relative_BareDotsResolveToIndexModule)
{
    auto table = make_table({
        {"pkg/__init__.py", ""},
        {"pkg/mod.py", "from . import sibling\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_TRUE(graph.has_edge("pkg/__init__.py", "pkg/mod.py"));
}

TEST(DependencyGraphBuilderTests, Relative_PackageFallsBackToIndexModule)
{
    auto table = make_table({
        {"pkg/sub/__init__.py", ""},
        {"pkg/mod.py", "from .sub import thing\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_TRUE(graph.has_edge("pkg/sub/__init__.py", "pkg/mod.py"));
}

TEST(DependencyGraphBuilderTests, Relative_TooManyDotsIsDroppedSilently)
{
    auto table = make_table({
        {"a.py", ""},
        {"pkg/b.py", "from ...a import x\n"},
    });
    DependencyGraphBuilder builder;
    EXPECT_TRUE(builder.resolve(table, *table.find("pkg/b.py"), "...a").empty());

    DependencyGraph graph;
    EXPECT_NO_THROW(graph = builder.build(table));
    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_EQ(graph.node_count(), 2u);
}

TEST(DependencyGraphBuilderTests, Relative_ClimbToRootFromPackage)
{
    auto table = make_table({
        {"a.py", ""},
        {"pkg/b.py", "from ..a import x\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_TRUE(graph.has_edge("a.py", "pkg/b.py"));
}

// ============================================================================
// Absolute resolution
// ============================================================================

TEST(DependencyGraphBuilderTests, Absolute_SuffixMatchesAnyDepth)
{
    auto table = make_table({
        {"src/app/models.py", ""},
        {"src/app/views.py", "from app.models import User\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_TRUE(graph.has_edge("src/app/models.py", "src/app/views.py"));
}

TEST(DependencyGraphBuilderTests, Absolute_MultipleSuffixMatchesAllGetEdges)
{
    auto table = make_table({
        {"one/util.py", ""},
        {"two/util.py", ""},
        {"main.py", "import util\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);

    EXPECT_TRUE(graph.has_edge("one/util.py", "main.py"));
    EXPECT_TRUE(graph.has_edge("two/util.py", "main.py"));
    EXPECT_EQ(graph.edge_count(), 2u);
}

TEST(DependencyGraphBuilderTests, Absolute_SuffixIsComponentAligned)
{
    auto table = make_table({
        {"chaos.py", ""},
        {"main.py", "import os\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_EQ(graph.edge_count(), 0u);
}

TEST(DependencyGraphBuilderTests, Absolute_ExternalImportsContributeNoEdges)
{
    auto table = make_table({
        {"main.py", "import numpy\nfrom collections import OrderedDict\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_EQ(graph.node_count(), 1u);
}

TEST(DependencyGraphBuilderTests, SelfImport_CreatesNoEdge)
{
    auto table = make_table({
        {"util.py", "import util\n"},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_EQ(graph.edge_count(), 0u);
}

TEST(DependencyGraphBuilderTests, Nodes_FollowDiscoveryOrder)
{
    auto table = make_table({
        {"z.py", ""},
        {"a.py", ""},
        {"m.py", ""},
    });
    auto graph = DependencyGraphBuilder().build(table);
    EXPECT_EQ(graph.nodes(), (std::vector<std::string>{"z.py", "a.py", "m.py"}));
}

TEST(DependencyGraphBuilderTests, CustomExtensionAndIndexModule)
{
    ModuleScanner scanner(ScanOptions{});
    ModuleTable table;
    table.add(scanner.scan_text("lib/mod.pyx", ""));
    table.add(scanner.scan_text("lib/index.pyx", ""));
    table.add(scanner.scan_text("lib/user.pyx", "from .mod import a\nfrom . import b\n"));

    ResolverOptions options;
    options.extension = ".pyx";
    options.index_module = "index";
    auto graph = DependencyGraphBuilder(options).build(table);

    EXPECT_TRUE(graph.has_edge("lib/mod.pyx", "lib/user.pyx"));
    EXPECT_TRUE(graph.has_edge("lib/index.pyx", "lib/user.pyx"));
}
