#include "Reporter.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <inttypes.h> // defines PRIu64 for printf uint64_t
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#define PROGRESS_TICK_MILLISEC	80
#define PROGRESS_BAR_WIDTH		40
#define BOX_PADDING				1

namespace
{
	const char* const SPINNER_FRAMES[] =
		{ "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏" };

	std::string repeatStr(const char* str, size_t count)
	{
		std::string result;

		for(size_t i=0; i < count; i++)
			result += str;

		return result;
	}
}

/**
 * @return true if ANSI colors should be used for stdout.
 */
bool shouldUseColors(ColorMode colorMode)
{
	switch(colorMode)
	{
		case ColorMode::Always: return true;
		case ColorMode::Never: return false;
		default: return isatty(STDOUT_FILENO) && !getenv("NO_COLOR");
	}
}

/**
 * User locale from environment for nicer number formatting, or classic "C" locale if the
 * environment locale is invalid.
 */
std::locale getUserLocale()
{
	try
	{
		return std::locale("");
	}
	catch(std::runtime_error& exception)
	{
		/* static binaries from Alpine fail on Ubuntu with std::runtime_error
			"locale::facet::_S_create_c_locale name not valid". however, this is just for nicer
			number formatting, so not critical.*/
		return std::locale::classic();
	}
}

std::string formatNumber(uint64_t value, const std::locale& locale)
{
	std::ostringstream stream;

	stream.imbue(locale);
	stream << value;

	return stream.str();
}

/**
 * Add escape characters to make a string usable in JSON.
 *
 * @string input string to convert
 * @return copy of input string with escaped
 */
std::string escapeStrforJSON(const std::string& string)
{
	std::ostringstream stringStream;

	for(const auto& currentChar : string)
	{
		/* the case statments are the typical shortcut escapes, the "default" statment handles
			generic escapes */
		switch(currentChar)
		{
			case '"':
				stringStream << "\\\"";
			break;
			case '\\':
				stringStream << "\\\\";
			break;
			case '\b':
				stringStream << "\\b";
			break;
			case '\f':
				stringStream << "\\f";
			break;
			case '\n':
				stringStream << "\\n";
			break;
			case '\r':
				stringStream << "\\r";
			break;
			case '\t':
				stringStream << "\\t";
			break;

			default:
				if('\x00' <= currentChar && currentChar <= '\x1f')
				{ // escape this character
					stringStream << "\\u" << std::hex << std::setw(4) << std::setfill('0')
							<< static_cast<int>(currentChar) << std::dec;
				}
				else
				{ // nothing to escape (multi-byte UTF-8 chars are passed through)
					stringStream << currentChar;
				}
		}
	}

	return stringStream.str();
}

/**
 * Pretty-printed JSON array of strings with two spaces indent, "[]" if empty.
 */
std::string pathsToJSONArray(const std::vector<std::string>& paths)
{
	if(paths.empty() )
		return "[]";

	std::string json("[\n");

	for(size_t i=0; i < paths.size(); i++)
	{
		json += "  \"" + escapeStrforJSON(paths[i]) + "\"";
		json += (i == (paths.size() - 1) ) ? "\n" : ",\n";
	}

	json += "]";

	return json;
}

/**
 * Number of terminal columns for a UTF-8 string without escape sequences. (Counts code points,
 * so wide chars are off by one, which is good enough for the result box.)
 */
size_t getDisplayWidth(const std::string& text)
{
	size_t width = 0;

	for(unsigned char currentChar : text)
	{
		if( (currentChar & 0xC0) != 0x80)
			width++; // not a UTF-8 continuation byte
	}

	return width;
}

ProgressLine::~ProgressLine()
{
	stop();
}

void ProgressLine::startSpinner(const std::string& message)
{
	start(message, false, 0);
}

void ProgressLine::startCounter(const std::string& message, uint64_t total)
{
	start(message, true, total);
}

void ProgressLine::start(const std::string& message, bool isCounter, uint64_t total)
{
	if(!enabled)
		return;

	stop();

	this->message = message;
	this->isCounter = isCounter;
	counterTotal = total;
	counterPos = 0;
	tickCount = 0;
	stopRequested = false;

	tickThread = std::thread(&ProgressLine::tickLoop, this);
}

/**
 * Stop refreshing and remove the status line from the terminal.
 */
void ProgressLine::stop()
{
	if(!tickThread.joinable() )
		return;

	{
		std::unique_lock<std::mutex> lock(drawMutex); // L O C K

		stopRequested = true;
	}

	stopCondition.notify_all();
	tickThread.join();

	std::unique_lock<std::mutex> lock(drawMutex); // L O C K

	clearLine();
}

/**
 * Take the draw lock and remove the status line, so that the caller can print other output.
 * The status line gets redrawn with the next tick after the caller released the lock.
 */
void ProgressLine::lockAndClear(std::unique_lock<std::mutex>& outLock)
{
	outLock = std::unique_lock<std::mutex>(drawMutex); // L O C K

	if(enabled && tickThread.joinable() )
		clearLine();
}

void ProgressLine::tickLoop()
{
	std::unique_lock<std::mutex> lock(drawMutex); // L O C K

	while(!stopRequested)
	{
		draw();

		stopCondition.wait_for(lock, std::chrono::milliseconds(PROGRESS_TICK_MILLISEC) );
	}
}

/**
 * Caller must hold drawMutex.
 */
void ProgressLine::draw()
{
	const size_t numFrames = sizeof(SPINNER_FRAMES) / sizeof(SPINNER_FRAMES[0] );

	clearLine();

	if(!isCounter)
		fprintf(stderr, "%s %s", SPINNER_FRAMES[tickCount++ % numFrames], message.c_str() );
	else
	{
		uint64_t pos = counterPos;
		uint64_t numFilled = counterTotal ?
			(pos * PROGRESS_BAR_WIDTH) / counterTotal : PROGRESS_BAR_WIDTH;

		fprintf(stderr, "%s%s %" PRIu64 "/%" PRIu64 " %s",
			repeatStr("#", numFilled).c_str(),
			repeatStr("-", PROGRESS_BAR_WIDTH - numFilled).c_str(),
			pos, counterTotal, message.c_str() );
	}

	fflush(stderr);
}

void ProgressLine::clearLine()
{
	fprintf(stderr, "\r\033[2K");
	fflush(stderr);
}

Reporter::Reporter(const Config& config, std::ostream& outStream) :
	config(config), outStream(outStream),
	useColors(shouldUseColors(config.colorMode) ),
	streamingEnabled(config.streamMatches && !config.printJSON),
	numberLocale(getUserLocale() ),
	progressLine(config.showProgress && isatty(STDERR_FILENO) )
{
}

std::string Reporter::style(const std::string& text, const char* ansiCode) const
{
	if(!useColors)
		return text;

	return std::string("\033[") + ansiCode + "m" + text + "\033[0m";
}

/**
 * Blank line to separate streamed matches from the progress output.
 */
void Reporter::beginResults()
{
	std::unique_lock<std::mutex> lock;
	progressLine.lockAndClear(lock);

	outStream << std::endl;
}

void Reporter::matchFound(const std::string& path)
{
	std::unique_lock<std::mutex> lock;
	progressLine.lockAndClear(lock);

	numStreamed++;

	outStream << style(path, REPORTER_STYLE_BOLD_WHITE) << std::endl;
}

void Reporter::candidateDone()
{
	progressLine.increment();
}

void Reporter::walkStarted()
{
	progressLine.startSpinner("Walking filesystem…");
}

void Reporter::walkFinished()
{
	progressLine.stop();
}

void Reporter::resolveStarted(uint64_t numCandidates)
{
	progressLine.startCounter("Checking symlinks", numCandidates);
}

void Reporter::resolveFinished()
{
	progressLine.stop();
}

/**
 * Print final results. In JSON mode this is only the sorted match list. Otherwise the sorted
 * matches in a box (unless they were already streamed) and the statistics.
 */
void Reporter::printResults(const std::vector<std::string>& sortedMatches,
	const RunSummary& summary)
{
	if(config.printJSON)
	{
		outStream << pathsToJSONArray(sortedMatches) << std::endl;
		return;
	}

	if(!streamingEnabled || !numStreamed)
	{
		if(sortedMatches.empty() )
			printBox( {"No matches found."}, {REPORTER_STYLE_YELLOW} );
		else
			printBox(sortedMatches,
				std::vector<std::string>(sortedMatches.size(), REPORTER_STYLE_BOLD_WHITE) );
	}

	outStream << std::endl;

	printStatistics(summary);
}

/**
 * @styles ANSI style for each line.
 */
void Reporter::printBox(const std::vector<std::string>& lines,
	const std::vector<std::string>& styles)
{
	size_t contentWidth = 0;

	for(const std::string& line : lines)
		contentWidth = std::max(contentWidth, getDisplayWidth(line) );

	const size_t boxWidth = contentWidth + (BOX_PADDING * 2);
	const std::string padding(BOX_PADDING, ' ');

	outStream << style("┌" + repeatStr("─", boxWidth) + "┐", REPORTER_STYLE_CYAN) << std::endl;

	for(size_t i=0; i < lines.size(); i++)
	{
		const size_t rightPadding = boxWidth - getDisplayWidth(lines[i]) - BOX_PADDING;

		outStream << style("│", REPORTER_STYLE_CYAN) << padding <<
			style(lines[i], styles[i].c_str() ) << std::string(rightPadding, ' ') <<
			style("│", REPORTER_STYLE_CYAN) << std::endl;
	}

	outStream << style("└" + repeatStr("─", boxWidth) + "┘", REPORTER_STYLE_CYAN) << std::endl;
}

void Reporter::printStatistics(const RunSummary& summary)
{
	const double elapsedSec = summary.elapsed.count() / 1000000.0;
	const uint64_t symlinksPerSec = (elapsedSec > 0) ?
		(uint64_t)std::llround(summary.numSymlinks / elapsedSec) : summary.numSymlinks;

	std::ostringstream elapsedStream;
	elapsedStream << std::fixed << std::setprecision(2) << elapsedSec << "s";

	outStream << style("Folders traversed:", REPORTER_STYLE_DIM) << " " <<
		style(formatNumber(summary.numDirs, numberLocale), REPORTER_STYLE_BOLD_CYAN) << std::endl;
	outStream << style("Files traversed:", REPORTER_STYLE_DIM) << " " <<
		style(formatNumber(summary.numFiles, numberLocale), REPORTER_STYLE_BOLD_CYAN) << std::endl;
	outStream << style("Symlinks scanned:", REPORTER_STYLE_DIM) << " " <<
		style(formatNumber(summary.numSymlinks, numberLocale), REPORTER_STYLE_BOLD_CYAN) <<
		std::endl;
	outStream << style("Matches:", REPORTER_STYLE_DIM) << " " <<
		style(formatNumber(summary.numMatches, numberLocale), REPORTER_STYLE_BOLD_GREEN) <<
		std::endl;
	outStream << style("Elapsed:", REPORTER_STYLE_DIM) << " " << elapsedStream.str() << std::endl;
	outStream << style("Rate:", REPORTER_STYLE_DIM) << " " <<
		style(formatNumber(symlinksPerSec, numberLocale), REPORTER_STYLE_BOLD_MAGENTA) << " " <<
		style("symlinks/s", REPORTER_STYLE_DIM) << std::endl;
}
