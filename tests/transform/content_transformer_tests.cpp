/**
 * @file content_transformer_tests.cpp
 * @brief Unit tests for ContentTransformer neutralization and summarization.
 */
#include <gtest/gtest.h>
#include "concat_errors.hpp"
#include "content_transformer.hpp"

using namespace module_concat;

// ============================================================================
// Relative import neutralization
// ============================================================================

TEST(ContentTransformerTests, Neutralize_WrapsSingleLineImport)
{
    EXPECT_EQ(ContentTransformer::neutralize_relative_imports("from .util import helper\nx = 1\n"),
              "\"\"\"RELATIVE_IMPORT:\n"
              "from .util import helper\n"
              "\"\"\"\n"
              "x = 1\n");
}

TEST(ContentTransformerTests, Neutralize_KeepsIndentationAndContinuations)
{
    std::string input =
        "def f():\n"
        "    from . import a\n"
        "    from ..pkg import (\n"
        "        b,\n"
        "        c,\n"
        "    )\n"
        "    return a\n";

    EXPECT_EQ(ContentTransformer::neutralize_relative_imports(input),
              "def f():\n"
              "    \"\"\"RELATIVE_IMPORT:\n"
              "    from . import a\n"
              "    \"\"\"\n"
              "    \"\"\"RELATIVE_IMPORT:\n"
              "    from ..pkg import (\n"
              "        b,\n"
              "        c,\n"
              "    )\n"
              "    \"\"\"\n"
              "    return a\n");
}

TEST(ContentTransformerTests, Neutralize_BackslashContinuation)
{
    EXPECT_EQ(ContentTransformer::neutralize_relative_imports("from .a import x, \\\n    y\nz = 2"),
              "\"\"\"RELATIVE_IMPORT:\n"
              "from .a import x, \\\n"
              "    y\n"
              "\"\"\"\n"
              "z = 2");
}

TEST(ContentTransformerTests, Neutralize_NoTrailingNewlinePreserved)
{
    EXPECT_EQ(ContentTransformer::neutralize_relative_imports("from .a import b"),
              "\"\"\"RELATIVE_IMPORT:\nfrom .a import b\n\"\"\"");
}

TEST(ContentTransformerTests, Neutralize_AbsoluteImportsUntouched)
{
    std::string input = "import os\nfrom pkg.sub import thing\nfromage = 1\n";
    EXPECT_EQ(ContentTransformer::neutralize_relative_imports(input), input);
}

// ============================================================================
// Summarization
// ============================================================================

TEST(ContentTransformerTests, None_IsIdentity)
{
    ContentTransformer transformer(SummaryLevel::None);
    std::string input = "class Foo:\n    def bar(self):\n        return 1\n";
    EXPECT_EQ(transformer.summarize(input), input);
    EXPECT_EQ(transformer.transform(input), input);
}

TEST(ContentTransformerTests, ScenarioC_InterfaceCollapsesClassBody)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    EXPECT_EQ(transformer.transform("class Foo:\n    def bar(self):\n        return 1\n"),
              "class Foo:\n    ...  # Class interface preserved\n");
}

TEST(ContentTransformerTests, Interface_AdjacentDeclarationsCollapseSeparately)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    std::string input =
        "class A:\n"
        "    x = 1\n"
        "class B(A):\n"
        "    y = 2\n"
        "\n"
        "async def f(a,\n"
        "            b) -> int:\n"
        "    return a + b\n";

    EXPECT_EQ(transformer.summarize(input),
              "class A:\n"
              "    ...  # Class interface preserved\n"
              "class B(A):\n"
              "    ...  # Class interface preserved\n"
              "\n"
              "async def f(a,\n"
              "            b) -> int:\n"
              "    ...  # Function signature preserved\n");
}

TEST(ContentTransformerTests, Interface_SummaryIsStable)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    std::string once = transformer.summarize("class Foo:\n    pass\n\ndef g():\n    return 3\n");
    EXPECT_EQ(transformer.summarize(once), once);
}

TEST(ContentTransformerTests, Interface_ImportsAndAssignmentsKept)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    std::string input = "import os\n\nLIMIT = 10\n\ndef g():\n    return LIMIT\n";
    EXPECT_EQ(transformer.summarize(input),
              "import os\n\nLIMIT = 10\n\ndef g():\n    ...  # Function signature preserved\n");
}

TEST(ContentTransformerTests, Core_GetterAndInitRules)
{
    // Core rules alone, so the interface rules do not collapse the class first.
    SummaryRules rules;
    rules.core = SummaryRules::default_rules().core;
    ContentTransformer transformer(SummaryLevel::Core, rules);

    std::string input =
        "class K:\n"
        "    def get_x(self): return self._x\n"
        "    def __init__(self, x=dict()):\n"
        "        self._x = x\n"
        "        self._y = 1\n"
        "    def other(self):\n"
        "        pass\n";

    EXPECT_EQ(transformer.summarize(input),
              "class K:\n"
              "    def get_x(self): ...  # Getter method summarized\n"
              "    def __init__(self, x=dict()): ...  # Standard initialization summarized\n"
              "    def other(self):\n"
              "        pass\n");
}

TEST(ContentTransformerTests, Interface_VeryLongSignatureCollapses)
{
    // Parameter lists are scanned without regex backtracking, so a header of
    // this size must not exhaust the stack.
    std::string header = "def f(x=(";
    for (int i = 0; i < 40000; ++i) header += "1, ";
    header += "))";
    ASSERT_GT(header.size(), 100000u);

    ContentTransformer transformer(SummaryLevel::Interface);
    EXPECT_EQ(transformer.transform(header + ":\n    return x\n"),
              header + ":\n    ...  # Function signature preserved\n");
}

TEST(ContentTransformerTests, Interface_ParenthesesInsideStringDefaults)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    EXPECT_EQ(transformer.summarize("def f(open=\"(\", close=')'):\n    return open + close\n"),
              "def f(open=\"(\", close=')'):\n    ...  # Function signature preserved\n");
}

TEST(ContentTransformerTests, Interface_UnclosedSignatureLeftAlone)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    std::string input = "def broken(a,\nx = 1\n";
    EXPECT_EQ(transformer.summarize(input), input);
}

TEST(ContentTransformerTests, Transform_NeutralizesBeforeSummarizing)
{
    ContentTransformer transformer(SummaryLevel::Interface);
    EXPECT_EQ(transformer.transform("from .util import helper\n\nclass Foo:\n    def bar(self):\n        return helper()\n"),
              "\"\"\"RELATIVE_IMPORT:\n"
              "from .util import helper\n"
              "\"\"\"\n"
              "\n"
              "class Foo:\n"
              "    ...  # Class interface preserved\n");
}

TEST(ContentTransformerTests, Transform_RejectsBinaryContent)
{
    ContentTransformer transformer(SummaryLevel::None);
    try {
        transformer.transform(std::string("x = 1\0\x01", 7), "blob.py");
        FAIL() << "expected ConcatError";
    } catch (const ConcatError& e) {
        EXPECT_EQ(e.code(), ConcatErrorCode::InvalidContent);
        EXPECT_EQ(e.path(), "blob.py");
    }
}

TEST(ContentTransformerTests, Transform_EmptyContent)
{
    ContentTransformer transformer(SummaryLevel::Core);
    EXPECT_EQ(transformer.transform(""), "");
}
