#include "gtest/gtest.h"
#include "TestLog.h"
#include "../../src/App/CommandLine.h"
#include <wx/cmdline.h>
#include <string>
#include <vector>

namespace
{
// Parses 'cmdLine' against the merger's option table; returns wxCmdLineParser::Parse's result
int ParseMergeCommandLine(wxCmdLineParser &parser, const wxString &cmdLine, const MergeSettings &settings)
{
    DescribeCommandLine(parser, settings);
    parser.SetCmdLine(cmdLine);
    return parser.Parse(false);
}
} // namespace

TEST(CommandLine, DefaultsComeFromSettings)
{
    MergeSettings settings;
    settings.defaultFileName = "combined.pdf";

    wxCmdLineParser parser;
    ASSERT_EQ(ParseMergeCommandLine(parser, "a.pdf b.pdf", settings), 0);

    CommandLineArguments arguments = ReadCommandLine(parser, settings);
    EXPECT_EQ(arguments.inputFiles, (std::vector<std::string>{"a.pdf", "b.pdf"}));
    EXPECT_EQ(arguments.outFile, "combined.pdf");
    EXPECT_FALSE(arguments.maxRenameAttempts.has_value());
    EXPECT_FALSE(arguments.verbose);
}

TEST(CommandLine, OptionsOverrideSettings)
{
    MergeSettings settings;

    wxCmdLineParser parser;
    ASSERT_EQ(ParseMergeCommandLine(parser, "-o out/ -n 5 -v x.pdf", settings), 0);

    CommandLineArguments arguments = ReadCommandLine(parser, settings);
    EXPECT_EQ(arguments.inputFiles, (std::vector<std::string>{"x.pdf"}));
    EXPECT_EQ(arguments.outFile, "out/");
    EXPECT_EQ(arguments.maxRenameAttempts.value_or(-1), 5);
    EXPECT_TRUE(arguments.verbose);
}

TEST(CommandLine, LongOptionNames)
{
    MergeSettings settings;

    wxCmdLineParser parser;
    ASSERT_EQ(ParseMergeCommandLine(parser, "--outfile=result.pdf --max-attempts=-2 --verbose x.pdf", settings), 0);

    CommandLineArguments arguments = ReadCommandLine(parser, settings);
    EXPECT_EQ(arguments.outFile, "result.pdf");
    // Range checks are left to MergerLogic::runMerge
    EXPECT_EQ(arguments.maxRenameAttempts.value_or(0), -2);
    EXPECT_TRUE(arguments.verbose);
}

TEST(CommandLine, VerboseSettingIsKept)
{
    MergeSettings settings;
    settings.verbose = true;

    wxCmdLineParser parser;
    ASSERT_EQ(ParseMergeCommandLine(parser, "x.pdf", settings), 0);
    EXPECT_TRUE(ReadCommandLine(parser, settings).verbose);
}

TEST(CommandLine, HelpSwitchRequestsHelp)
{
    MergeSettings settings;
    ScopedLogCapture capture;

    wxCmdLineParser parser;
    EXPECT_EQ(ParseMergeCommandLine(parser, "-h", settings), -1);

    wxCmdLineParser longParser;
    EXPECT_EQ(ParseMergeCommandLine(longParser, "--help", settings), -1);
}

TEST(CommandLine, MissingInputIsAParseError)
{
    MergeSettings settings;
    ScopedLogCapture capture;

    wxCmdLineParser parser;
    EXPECT_GT(ParseMergeCommandLine(parser, "-o out.pdf", settings), 0);
}
