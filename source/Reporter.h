#ifndef REPORTER_H_
#define REPORTER_H_

#include "Config.h"
#include "LinkResolver.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <locale>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#define REPORTER_STYLE_BOLD_WHITE	"1;37"
#define REPORTER_STYLE_BOLD_CYAN	"1;36"
#define REPORTER_STYLE_BOLD_GREEN	"1;32"
#define REPORTER_STYLE_BOLD_MAGENTA	"1;35"
#define REPORTER_STYLE_CYAN			"36"
#define REPORTER_STYLE_YELLOW		"33"
#define REPORTER_STYLE_DIM			"2"

/**
 * Self-refreshing status line on stderr: a spinner while walking and a progress bar while
 * resolving. Does nothing if disabled.
 */
class ProgressLine
{
	public:
		explicit ProgressLine(bool enabled) : enabled(enabled) {}
		~ProgressLine();

		void startSpinner(const std::string& message);
		void startCounter(const std::string& message, uint64_t total);
		void increment() { counterPos++; }
		void stop();

		void lockAndClear(std::unique_lock<std::mutex>& outLock);

	private:
		const bool enabled;
		std::string message;
		bool isCounter {false};
		uint64_t counterTotal {0};
		std::atomic_uint64_t counterPos {0};
		unsigned tickCount {0};

		std::thread tickThread;
		std::mutex drawMutex; // for stderr output and stopRequested
		std::condition_variable stopCondition;
		bool stopRequested {false};

		void start(const std::string& message, bool isCounter, uint64_t total);
		void tickLoop();
		void draw();
		void clearLine();
};

/**
 * Values for the summary at the end of a run.
 */
struct RunSummary
{
	uint64_t numDirs {0};
	uint64_t numFiles {0};
	uint64_t numSymlinks {0};
	uint64_t numMatches {0};
	std::chrono::microseconds elapsed {0};
};

/**
 * Prints streamed matches, the final result list and the statistics to the given stream.
 */
class Reporter : public MatchListener
{
	public:
		Reporter(const Config& config, std::ostream& outStream);

		void beginResults() override;
		void matchFound(const std::string& path) override;
		void candidateDone() override;

		void walkStarted();
		void walkFinished();
		void resolveStarted(uint64_t numCandidates);
		void resolveFinished();

		void printResults(const std::vector<std::string>& sortedMatches,
			const RunSummary& summary);

	private:
		const Config& config;
		std::ostream& outStream;
		const bool useColors;
		const bool streamingEnabled;
		std::locale numberLocale;
		ProgressLine progressLine;
		uint64_t numStreamed {0}; // modified under the progress line draw lock

		std::string style(const std::string& text, const char* ansiCode) const;
		void printBox(const std::vector<std::string>& lines, const std::vector<std::string>& styles);
		void printStatistics(const RunSummary& summary);

	public:
		bool isUsingColors() const { return useColors; }
};

bool shouldUseColors(ColorMode colorMode);
std::locale getUserLocale();
std::string formatNumber(uint64_t value, const std::locale& locale);
std::string escapeStrforJSON(const std::string& string);
std::string pathsToJSONArray(const std::vector<std::string>& paths);
size_t getDisplayWidth(const std::string& text);

#endif /* REPORTER_H_ */
