#include "Reporter.h"

#include <gtest/gtest.h>

#include <locale>
#include <sstream>

namespace {

/**
 * Thousands separator independent of the locales installed on the test machine.
 */
class CommaGrouping : public std::numpunct<char>
{
	protected:
		char do_thousands_sep() const override { return ','; }
		std::string do_grouping() const override { return "\3"; }
};

Config makeReporterConfig()
{
	Config config;

	config.showProgress = false;
	config.colorMode = ColorMode::Never;

	return config;
}

RunSummary makeSummary(uint64_t numMatches)
{
	RunSummary summary;

	summary.numDirs = 12;
	summary.numFiles = 345;
	summary.numSymlinks = 3;
	summary.numMatches = numMatches;
	summary.elapsed = std::chrono::microseconds(1500000);

	return summary;
}

bool contains(const std::string& haystack, const std::string& needle)
{
	return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(JSONTest, EscapesSpecialChars)
{
	EXPECT_EQ(escapeStrforJSON("plain/path"), "plain/path");
	EXPECT_EQ(escapeStrforJSON("a\"b"), "a\\\"b");
	EXPECT_EQ(escapeStrforJSON("a\\b"), "a\\\\b");
	EXPECT_EQ(escapeStrforJSON("line\nbreak\ttab"), "line\\nbreak\\ttab");
	EXPECT_EQ(escapeStrforJSON(std::string("x\x01y") ), "x\\u0001y");
	EXPECT_EQ(escapeStrforJSON("ümlaut"), "ümlaut");
}

TEST(JSONTest, PathArrayIsPrettyPrinted)
{
	EXPECT_EQ(pathsToJSONArray( {} ), "[]");
	EXPECT_EQ(pathsToJSONArray( {"/a"} ), "[\n  \"/a\"\n]");
	EXPECT_EQ(pathsToJSONArray( {"/a", "/b\"c"} ), "[\n  \"/a\",\n  \"/b\\\"c\"\n]");
}

TEST(FormatTest, NumbersUseLocaleGrouping)
{
	std::locale commaLocale(std::locale::classic(), new CommaGrouping() );

	EXPECT_EQ(formatNumber(1234567, commaLocale), "1,234,567");
	EXPECT_EQ(formatNumber(999, commaLocale), "999");
	EXPECT_EQ(formatNumber(1234567, std::locale::classic() ), "1234567");
}

TEST(FormatTest, DisplayWidthCountsCodePoints)
{
	EXPECT_EQ(getDisplayWidth(""), 0u);
	EXPECT_EQ(getDisplayWidth("abc"), 3u);
	EXPECT_EQ(getDisplayWidth("ümlaut"), 6u);
	EXPECT_EQ(getDisplayWidth("─┐"), 2u);
}

TEST(ColorTest, ExplicitModesOverrideDetection)
{
	EXPECT_TRUE(shouldUseColors(ColorMode::Always) );
	EXPECT_FALSE(shouldUseColors(ColorMode::Never) );
}

TEST(ReporterTest, JSONModePrintsOnlyMatches)
{
	Config config = makeReporterConfig();
	config.printJSON = true;

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.printResults( {"/x/link1", "/x/link2"}, makeSummary(2) );

	EXPECT_EQ(outStream.str(), "[\n  \"/x/link1\",\n  \"/x/link2\"\n]\n");
}

TEST(ReporterTest, JSONModeWithoutMatchesPrintsEmptyArray)
{
	Config config = makeReporterConfig();
	config.printJSON = true;

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.printResults( {}, makeSummary(0) );

	EXPECT_EQ(outStream.str(), "[]\n");
}

TEST(ReporterTest, MatchesAreBoxedWhenNotStreamed)
{
	Config config = makeReporterConfig();
	config.streamMatches = false;

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.printResults( {"/a/link", "/b/longer-link"}, makeSummary(2) );

	const std::string output = outStream.str();

	EXPECT_TRUE(contains(output, "┌────────────────┐\n") ) << output;
	EXPECT_TRUE(contains(output, "│ /a/link        │\n") ) << output;
	EXPECT_TRUE(contains(output, "│ /b/longer-link │\n") ) << output;
	EXPECT_TRUE(contains(output, "└────────────────┘\n") ) << output;
	EXPECT_LT(output.find("/a/link"), output.find("/b/longer-link") );
	EXPECT_FALSE(contains(output, "\033[") ) << "no colors expected";
}

TEST(ReporterTest, NoMatchesMessage)
{
	Config config = makeReporterConfig();

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.printResults( {}, makeSummary(0) );

	EXPECT_TRUE(contains(outStream.str(), "│ No matches found. │") ) << outStream.str();
}

TEST(ReporterTest, StreamedMatchesAreNotRepeated)
{
	Config config = makeReporterConfig();

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.beginResults();
	reporter.matchFound("/a/link");
	reporter.printResults( {"/a/link"}, makeSummary(1) );

	const std::string output = outStream.str();

	EXPECT_EQ(output.rfind("\n/a/link\n", 0), 0u) << output;
	EXPECT_EQ(output.find("/a/link"), output.rfind("/a/link") ) << output;
	EXPECT_FALSE(contains(output, "┌") ) << output;
}

TEST(ReporterTest, StatisticsAreAlwaysPrintedOutsideJSON)
{
	Config config = makeReporterConfig();

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	reporter.printResults( {"/a/link"}, makeSummary(1) );

	const std::string output = outStream.str();

	EXPECT_TRUE(contains(output, "Folders traversed: 12\n") ) << output;
	EXPECT_TRUE(contains(output, "Files traversed: 345\n") ) << output;
	EXPECT_TRUE(contains(output, "Symlinks scanned: 3\n") ) << output;
	EXPECT_TRUE(contains(output, "Matches: 1\n") ) << output;
	EXPECT_TRUE(contains(output, "Elapsed: 1.50s\n") ) << output;
	EXPECT_TRUE(contains(output, "Rate: 2 symlinks/s\n") ) << output;
}

TEST(ReporterTest, ColorsWrapOutputInEscapeSequences)
{
	Config config = makeReporterConfig();
	config.colorMode = ColorMode::Always;

	std::ostringstream outStream;
	Reporter reporter(config, outStream);

	ASSERT_TRUE(reporter.isUsingColors() );

	reporter.beginResults();
	reporter.matchFound("/a/link");

	EXPECT_TRUE(contains(outStream.str(), "\033[" REPORTER_STYLE_BOLD_WHITE "m/a/link\033[0m") );
}
