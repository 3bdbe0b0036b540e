/**
 * @file cli_options_tests.cpp
 * @brief Unit tests for command-line parsing and its overlay on ConcatConfig.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "cli_options.hpp"
#include "concat_errors.hpp"

using namespace module_concat;

namespace {

bool parse(std::vector<const char*> args, CliOptions& options, std::string* error = nullptr)
{
    args.insert(args.begin(), "modcat");
    std::ostringstream err;
    bool ok = parse_cli(static_cast<int>(args.size()), args.data(), options, err);
    if (error) *error = err.str();
    return ok;
}

} // namespace

TEST(CliOptionsTests, BareReportPrintsAndLeavesPositionalAsSource)
{
    CliOptions options;
    ASSERT_TRUE(parse({"--report", "src"}, options));

    EXPECT_TRUE(options.print_report);
    EXPECT_FALSE(options.report.has_value());
    ASSERT_TRUE(options.source_dir.has_value());
    EXPECT_EQ(*options.source_dir, "src");
}

TEST(CliOptionsTests, ReportWithFileNeedsEqualsForm)
{
    CliOptions options;
    ASSERT_TRUE(parse({"--report=deps.txt", "lib"}, options));

    EXPECT_FALSE(options.print_report);
    EXPECT_EQ(options.report, std::optional<std::string>("deps.txt"));
    EXPECT_EQ(options.source_dir, std::optional<std::string>("lib"));

    CliOptions empty;
    std::string error;
    EXPECT_FALSE(parse({"--report="}, empty, &error));
    EXPECT_NE(error.find("Missing file name"), std::string::npos);
}

TEST(CliOptionsTests, ValuesAndRepeatedExcludes)
{
    CliOptions options;
    ASSERT_TRUE(parse({"-l", "core", "-x", "tests/", "--exclude", "setup.py", "-o", "out.py",
                       "--labels", "numbers", "--prune-isolated", "--debug", "pkg"}, options));

    EXPECT_EQ(options.level, std::optional<std::string>("core"));
    EXPECT_EQ(options.excludes, (std::vector<std::string>{"tests/", "setup.py"}));
    EXPECT_EQ(options.output, std::optional<std::string>("out.py"));
    EXPECT_TRUE(options.prune_isolated);
    EXPECT_TRUE(options.debug);
    EXPECT_EQ(options.source_dir, std::optional<std::string>("pkg"));
}

TEST(CliOptionsTests, UsageErrors)
{
    CliOptions options;
    std::string error;
    EXPECT_FALSE(parse({"--level"}, options, &error));
    EXPECT_NE(error.find("Missing value for --level"), std::string::npos);

    CliOptions unknown;
    EXPECT_FALSE(parse({"--frobnicate"}, unknown, &error));
    EXPECT_NE(error.find("Unknown option"), std::string::npos);

    CliOptions twice;
    EXPECT_FALSE(parse({"a", "b"}, twice, &error));
    EXPECT_NE(error.find("Unexpected argument: b"), std::string::npos);
}

TEST(CliOptionsTests, ApplyOverlaysConfig)
{
    CliOptions options;
    ASSERT_TRUE(parse({"-l", "interface", "--report=r.txt", "-x", "extra", "src2"}, options));

    ConcatConfig config;
    config.exclude_patterns = {"from_file"};
    apply_cli(config, options);

    EXPECT_EQ(config.source_dir, fs::path("src2"));
    EXPECT_EQ(config.summary_level, SummaryLevel::Interface);
    EXPECT_EQ(config.report_file, std::optional<fs::path>("r.txt"));
    EXPECT_EQ(config.exclude_patterns, (std::vector<std::string>{"from_file", "extra"}));
}

TEST(CliOptionsTests, ApplyRejectsUnknownNames)
{
    CliOptions options;
    options.level = "everything";
    ConcatConfig config;
    EXPECT_THROW(apply_cli(config, options), ConcatError);

    CliOptions labels;
    labels.labels = "roman";
    EXPECT_THROW(apply_cli(config, labels), ConcatError);
}
