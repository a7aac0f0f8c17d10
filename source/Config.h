#ifndef CONFIG_H_
#define CONFIG_H_

#include <string>
#include <thread>
#include <vector>

#define CONFIG_DEFAULT_NUMTHREADS	16 // if hardware concurrency is unknown

enum class ColorMode
{
	Auto, // colors if stdout is a terminal and NO_COLOR is not set
	Always,
	Never,
};

/**
 * User-defined settings for a scan. Filled by argument parsing, read-only afterwards.
 */
struct Config
{
	std::string targetPath; // user-given path to match symlink targets against
	std::string rootPath {"."}; // dir in which the scan starts
	unsigned numThreads {0}; // scan threads for walk and resolve. 0 means auto.
	unsigned depthSearchStartThreshold {0}; // start depth search when this num of dirs is in stack
	unsigned maxDirDepth { (unsigned)~0}; // max dir depth to scan. (entries under root have depth 0)
	bool includeHidden {true}; // include entries with leading "." in name
	bool includeHeavy {false}; // scan node_modules, .cache, build etc
	bool oneFilesystem {false}; // don't descend into dirs on other devices than root
	bool respectGitignore {false}; // honor .gitignore and .git/info/exclude files
	std::vector<std::string> ignoreGlobs; // gitignore-style globs; "!" prefix to force-include
	std::vector<std::string> ignoreFiles; // paths to gitignore-style pattern files
	bool streamMatches {true}; // print matches as they are found
	bool printJSON {false}; // print sorted matches as JSON array. (disables streaming)
	bool showProgress {true}; // spinner and progress counter on stderr
	ColorMode colorMode {ColorMode::Auto};
	bool printVerbose {false}; // true to enable verbose output
	bool printVersion {false}; // print version and exit
};

/**
 * @return numThreads or the number of hardware threads if numThreads is 0.
 */
inline unsigned getEffectiveNumThreads(unsigned numThreads)
{
	if(numThreads)
		return numThreads;

	unsigned hardwareThreads = std::thread::hardware_concurrency();

	return hardwareThreads ? hardwareThreads : CONFIG_DEFAULT_NUMTHREADS;
}

#endif /* CONFIG_H_ */
