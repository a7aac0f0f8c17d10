/**
 * Parallel search for symlinks that point to a given target.
 *
 * The dir tree is scanned in parallel first to collect all symlinks. Afterwards, the symlinks are
 * resolved in parallel and compared to the canonical target path.
 */

#include "Config.h"
#include "DirWalker.h"
#include "FilterPolicy.h"
#include "LinkResolver.h"
#include "Reporter.h"
#include "Target.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

#ifndef EXE_NAME
	#define EXE_NAME		"symfindo"
#endif
#ifndef EXE_VERSION
	#define EXE_VERSION		"0.0.0"
#endif

#define ARG_COLOR_LONG				"color"
#define ARG_GODEEP_LONG				"godeep"
#define ARG_HELP_LONG				"help"
#define ARG_HELP_SHORT				'h'
#define ARG_IGNORE_LONG				"ignore"
#define ARG_IGNOREFILE_LONG			"ignore-file"
#define ARG_INCLUDEHEAVY_LONG		"include-heavy"
#define ARG_JSON_LONG				"json"
#define ARG_MAXDEPTH_LONG			"maxdepth"
#define ARG_NOHIDDEN_LONG			"no-hidden"
#define ARG_NOSTREAM_LONG			"no-stream"
#define ARG_NOTUI_LONG				"no-tui"
#define ARG_ONEFILESYSTEM_LONG		"one-filesystem"
#define ARG_RESPECTGITIGNORE_LONG	"respect-gitignore"
#define ARG_ROOT_LONG				"root"
#define ARG_THREADS_LONG			"threads"
#define ARG_THREADS_SHORT			't'
#define ARG_VERBOSE_LONG			"verbose"
#define ARG_VERSION_LONG			"version"

#define ARG_COLOR_AUTO		"auto"
#define ARG_COLOR_ALWAYS	"always"
#define ARG_COLOR_NEVER		"never"

Config config;

void printUsageAndExit()
{
	std::cout << EXE_NAME " - Parallel search for symlinks pointing to a target" << std::endl;
	std::cout << std::endl;
	std::cout << "VERSION: " EXE_VERSION << std::endl;
	std::cout << std::endl;
	std::cout << "USAGE: " EXE_NAME " [OPTIONS...] TARGET" << std::endl;
	std::cout << std::endl;
	std::cout << "Scans the current dir (or the dir given via \"--" ARG_ROOT_LONG "\") for symlinks" << std::endl;
	std::cout << "that resolve to TARGET after following all links." << std::endl;
	std::cout << std::endl;
	std::cout << "OPTIONS (in alphabetical order):" << std::endl;
	std::cout << "  --color WHEN       - Colored output: auto, always or never. (Default: auto)" << std::endl;
	std::cout << "  --godeep NUM       - Threshold to switch from breadth to depth search." << std::endl;
	std::cout << "                       (Default: number of scan threads)" << std::endl;
	std::cout << "  --ignore GLOB      - Ignore entries matching this gitignore-style glob." << std::endl;
	std::cout << "                       \"!\" prefix to force-include. Can be repeated." << std::endl;
	std::cout << "  --ignore-file PATH - Load gitignore-style patterns from file." << std::endl;
	std::cout << "                       Can be repeated." << std::endl;
	std::cout << "  --include-heavy    - Also scan node_modules, .cache, target, build, dist," << std::endl;
	std::cout << "                       out, .git, .venv and venv dirs." << std::endl;
	std::cout << "  --json             - Print sorted matches as JSON array." << std::endl;
	std::cout << "  --maxdepth NUM     - Max directory depth to scan. (Entries directly under" << std::endl;
	std::cout << "                       the scan root have depth 0.)" << std::endl;
	std::cout << "  --no-hidden        - Skip files and dirs with a leading \".\" in their name." << std::endl;
	std::cout << "  --no-stream        - Don't print matches as they are found, only the final" << std::endl;
	std::cout << "                       sorted summary." << std::endl;
	std::cout << "  --no-tui           - Disable progress output on stderr." << std::endl;
	std::cout << "  --one-filesystem   - Don't descend into dirs on other filesystems." << std::endl;
	std::cout << "  --respect-gitignore - Skip entries ignored by .gitignore files." << std::endl;
	std::cout << "  --root PATH        - Dir to scan. (Default: current dir)" << std::endl;
	std::cout << "  -t, --threads NUM  - Number of scan threads. (Default: number of CPU cores)" << std::endl;
	std::cout << "  --verbose          - Enable verbose output." << std::endl;
	std::cout << "  --version          - Print version and exit." << std::endl;
	std::cout << std::endl;
	std::cout << "Examples:" << std::endl;
	std::cout << "  Find all symlinks in the current dir that point to /opt/tool/bin/tool:" << std::endl;
	std::cout << "    $ " EXE_NAME " /opt/tool/bin/tool" << std::endl;
	std::cout << std::endl;
	std::cout << "  Find links to a shared lib in /usr, skipping other filesystems:" << std::endl;
	std::cout << "    $ " EXE_NAME " --root /usr --one-filesystem /usr/lib/libfoo.so.1" << std::endl;
	std::cout << std::endl;
	std::cout << "  Get sorted matches as plain list:" << std::endl;
	std::cout << "    $ " EXE_NAME " --json ~/.local/bin/tool | jq -r '.[]'" << std::endl;

	exit(EXIT_FAILURE);
}

void printVersionAndExit()
{
	std::cout << EXE_NAME << std::endl;
	std::cout << " * Version: " EXE_VERSION << std::endl;
	std::cout << " * Build date: " __DATE__ << " " << __TIME__ << std::endl;

	exit(EXIT_SUCCESS);
}

/**
 * Parse a non-negative number argument or exit with error message.
 */
unsigned parseUnsignedArg(const char* optionName, const char* userVal)
{
	try
	{
		size_t numParsedChars;
		unsigned long parsedVal = std::stoul(userVal, &numParsedChars);

		if( (userVal[0] != '-') && (numParsedChars == strlen(userVal) ) &&
			(parsedVal <= (unsigned)~0) )
			return (unsigned)parsedVal;
	}
	catch(std::logic_error& e)
	{ // std::invalid_argument or std::out_of_range
	}

	fprintf(stderr, "Invalid value for option \"--%s\": %s\n", optionName, userVal);
	exit(EXIT_FAILURE);
}

ColorMode parseColorArg(const char* userVal)
{
	std::string colorVal(userVal);

	if(colorVal == ARG_COLOR_AUTO)
		return ColorMode::Auto;

	if(colorVal == ARG_COLOR_ALWAYS)
		return ColorMode::Always;

	if(colorVal == ARG_COLOR_NEVER)
		return ColorMode::Never;

	fprintf(stderr, "Invalid value for option \"--" ARG_COLOR_LONG "\": %s; "
		"Valid values: " ARG_COLOR_AUTO ", " ARG_COLOR_ALWAYS ", " ARG_COLOR_NEVER "\n", userVal);
	exit(EXIT_FAILURE);
}

/**
 * Parse commmand line arguments and set corresponding config values.
 */
void parseArguments(int argc, char **argv)
{
	for( ; ; )
	{
		/* struct option:
			* (1) name: is the name of the long option.
			* (2) has_arg: no_argument, required_argument or optional_argument.
			* (3) flag: if NULL, then getopt_long() returns val. otherwise it returns 0 and flag
				points to a variable which is set to val if the option is found.
			* (4) val: the value to return, or to load into the variable pointed to by flag.
		*/
		static struct option long_options[] =
		{
				{ ARG_COLOR_LONG, required_argument, 0, 0 },
				{ ARG_GODEEP_LONG, required_argument, 0, 0 },
				{ ARG_HELP_LONG, no_argument, 0, ARG_HELP_SHORT },
				{ ARG_IGNORE_LONG, required_argument, 0, 0 },
				{ ARG_IGNOREFILE_LONG, required_argument, 0, 0 },
				{ ARG_INCLUDEHEAVY_LONG, no_argument, 0, 0 },
				{ ARG_JSON_LONG, no_argument, 0, 0 },
				{ ARG_MAXDEPTH_LONG, required_argument, 0, 0 },
				{ ARG_NOHIDDEN_LONG, no_argument, 0, 0 },
				{ ARG_NOSTREAM_LONG, no_argument, 0, 0 },
				{ ARG_NOTUI_LONG, no_argument, 0, 0 },
				{ ARG_ONEFILESYSTEM_LONG, no_argument, 0, 0 },
				{ ARG_RESPECTGITIGNORE_LONG, no_argument, 0, 0 },
				{ ARG_ROOT_LONG, required_argument, 0, 0 },
				{ ARG_THREADS_LONG, required_argument, 0, ARG_THREADS_SHORT },
				{ ARG_VERBOSE_LONG, no_argument, 0, 0 },
				{ ARG_VERSION_LONG, no_argument, 0, 0 },
				{ 0, 0, 0, 0 } // all-zero is the terminating element
		};

		int longOptionIndex = 0;

		/* currentOption:
		   * for short opts: the option character
		   * for long opts: they return val if flag (3rd val) is NULL, and 0 otherwise.
		   * -1: if all options parsed
		   * '?': undefined/extraneous option
		*/
		int currentOption = getopt_long_only(argc, argv, "t:h", long_options, &longOptionIndex);

		if(currentOption == -1)
			break; // done; all options parsed

		switch(currentOption)
		{
			case 0: // long option
			{
				std::string currentOptionName = long_options[longOptionIndex].name;

				if(ARG_COLOR_LONG == currentOptionName)
					config.colorMode = parseColorArg(optarg);
				else
				if(ARG_GODEEP_LONG == currentOptionName)
					config.depthSearchStartThreshold = parseUnsignedArg(ARG_GODEEP_LONG, optarg);
				else
				if(ARG_IGNORE_LONG == currentOptionName)
					config.ignoreGlobs.push_back(optarg);
				else
				if(ARG_IGNOREFILE_LONG == currentOptionName)
					config.ignoreFiles.push_back(optarg);
				else
				if(ARG_INCLUDEHEAVY_LONG == currentOptionName)
					config.includeHeavy = true;
				else
				if(ARG_JSON_LONG == currentOptionName)
					config.printJSON = true;
				else
				if(ARG_MAXDEPTH_LONG == currentOptionName)
					config.maxDirDepth = parseUnsignedArg(ARG_MAXDEPTH_LONG, optarg);
				else
				if(ARG_NOHIDDEN_LONG == currentOptionName)
					config.includeHidden = false;
				else
				if(ARG_NOSTREAM_LONG == currentOptionName)
					config.streamMatches = false;
				else
				if(ARG_NOTUI_LONG == currentOptionName)
					config.showProgress = false;
				else
				if(ARG_ONEFILESYSTEM_LONG == currentOptionName)
					config.oneFilesystem = true;
				else
				if(ARG_RESPECTGITIGNORE_LONG == currentOptionName)
					config.respectGitignore = true;
				else
				if(ARG_ROOT_LONG == currentOptionName)
					config.rootPath = optarg;
				else
				if(ARG_VERBOSE_LONG == currentOptionName)
					config.printVerbose = true;
				else
				if(ARG_VERSION_LONG == currentOptionName)
					config.printVersion = true;
			} break;

			case ARG_HELP_SHORT:
				printUsageAndExit();
			break;

			case ARG_THREADS_SHORT:
				config.numThreads = parseUnsignedArg(ARG_THREADS_LONG, optarg);
			break;

			case '?': // unknown (long or short) option
				fprintf(stderr, "Aborting due to unrecognized option\n");
				exit(EXIT_FAILURE);
			break;

			default:
				fprintf(stderr, "?? getopt returned character code 0%o ??\n", currentOption);
		}
	}

	if(config.printVersion)
		printVersionAndExit();

	// parse non-option arguments
	if( (argc - optind) != 1)
	{
		fprintf(stderr, "Exactly one target path is required. Given: %d\n\n", argc - optind);
		printUsageAndExit();
	}

	config.targetPath = argv[optind];

	if(config.rootPath.empty() )
	{
		fprintf(stderr, "Scan root must not be empty\n");
		exit(EXIT_FAILURE);
	}
}

void printVerboseStatistics(const DirWalker& dirWalker)
{
	const WalkStatistics& statistics = dirWalker.getStatistics();

	std::cerr << "CONFIG:" << std::endl;
	std::cerr << "  * threads:       " << dirWalker.getNumThreads() << std::endl;
	std::cerr << "  * root:          " << config.rootPath << std::endl;

	std::cerr << "STATISTICS:" << std::endl;

	std::cerr << "  * entries found: " <<
			"files: " << statistics.numFilesFound << "; " <<
			"dirs: " << statistics.numDirsFound << "; " <<
			"symlinks: " << statistics.numSymlinksFound << "; " <<
			"other: " << statistics.numOtherFound << std::endl;

	std::cerr << "  * special cases: " <<
			"unknown type: " << statistics.numUnknownFound << "; " <<
			"filtered: " << statistics.numFilteredOut << "; " <<
			"errors: " << statistics.numErrors << std::endl;

	if(statistics.numStatCalls)
		std::cerr << "  * stat calls:    " << statistics.numStatCalls << std::endl;
}

int main(int argc, char** argv)
{
	std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();

	parseArguments(argc, argv);

	ResolvedTarget target;

	try
	{
		target = ResolvedTarget::resolve(config.targetPath);
	}
	catch(TargetResolveException& e)
	{
		fprintf(stderr, "%s\n", e.what() );
		return EXIT_FAILURE;
	}

	struct stat rootStatBuf;

	if(stat(config.rootPath.c_str(), &rootStatBuf) )
	{
		fprintf(stderr, "Failed to open scan root dir: %s; Error: %s\n",
			config.rootPath.c_str(), strerror(errno) );
		return EXIT_FAILURE;
	}

	if(!S_ISDIR(rootStatBuf.st_mode) )
	{
		fprintf(stderr, "Scan root is not a directory: %s\n", config.rootPath.c_str() );
		return EXIT_FAILURE;
	}

	if(config.printVerbose)
		fprintf(stderr, "Target: %s\n", target.canonicalPath.c_str() );

	Reporter reporter(config, std::cout);
	FilterPolicy filterPolicy(config);
	DirWalker dirWalker(config, filterPolicy);

	reporter.walkStarted();
	dirWalker.run();
	reporter.walkFinished();

	// all scan threads are done at this point, so the symlink list is complete
	const std::vector<std::string> symlinks = dirWalker.takeSymlinks();

	LinkResolver linkResolver(config, target, &reporter);

	reporter.resolveStarted(symlinks.size() );
	linkResolver.run(symlinks);
	reporter.resolveFinished();

	const std::vector<std::string> sortedMatches = linkResolver.getMatchSet().getSortedPaths();
	const WalkStatistics& statistics = dirWalker.getStatistics();

	RunSummary summary;
	summary.numDirs = statistics.numDirsFound;
	summary.numFiles = statistics.numFilesFound;
	summary.numSymlinks = symlinks.size();
	summary.numMatches = sortedMatches.size();
	summary.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
		std::chrono::steady_clock::now() - startTime);

	reporter.printResults(sortedMatches, summary);

	if(config.printVerbose)
		printVerboseStatistics(dirWalker);

	return EXIT_SUCCESS;
}
