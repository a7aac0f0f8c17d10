#ifndef TEST_TESTUTILS_H_
#define TEST_TESTUTILS_H_

#include "Config.h"
#include "DirWalker.h"
#include "FilterPolicy.h"
#include "LinkResolver.h"
#include "Target.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * Fixture with a fresh temporary dir per test. The dir path is canonical, so paths built from
 * it can be compared with resolved paths.
 */
class TempDirTest : public ::testing::Test
{
	protected:
		std::string rootDir;

		void SetUp() override
		{
			std::string dirTemplate = (fs::temp_directory_path() / "symfindo-test-XXXXXX").string();

			ASSERT_NE(mkdtemp(&dirTemplate[0] ), nullptr) << "mkdtemp failed";

			ASSERT_TRUE(canonicalizePath(dirTemplate, rootDir) );
		}

		void TearDown() override
		{
			std::error_code errorCode;

			// restore permissions, otherwise remove_all fails on dirs from permission tests
			for(const std::string& lockedDir : lockedDirs)
				fs::permissions(lockedDir, fs::perms::owner_all, errorCode);

			fs::remove_all(rootDir, errorCode);
		}

		std::string path(const std::string& relPath) const
		{
			return rootDir + "/" + relPath;
		}

		std::string makeDir(const std::string& relPath)
		{
			fs::create_directories(path(relPath) );
			return path(relPath);
		}

		std::string makeFile(const std::string& relPath, const std::string& contents = "x")
		{
			fs::path filePath(path(relPath) );

			fs::create_directories(filePath.parent_path() );
			std::ofstream fileStream(filePath);
			fileStream << contents;

			return filePath.string();
		}

		std::string makeSymlink(const std::string& relPath, const std::string& linkTarget)
		{
			fs::path linkPath(path(relPath) );

			fs::create_directories(linkPath.parent_path() );
			fs::create_symlink(linkTarget, linkPath);

			return linkPath.string();
		}

		void lockDir(const std::string& dirPath)
		{
			fs::permissions(dirPath, fs::perms::none);
			lockedDirs.push_back(dirPath);
		}

		Config makeConfig(unsigned numThreads = 4) const
		{
			Config config;

			config.rootPath = rootDir;
			config.numThreads = numThreads;
			config.showProgress = false;
			config.colorMode = ColorMode::Never;

			return config;
		}

	private:
		std::vector<std::string> lockedDirs;
};

/**
 * Result of a full walk + resolve run.
 */
struct ScanResult
{
	std::vector<std::string> sortedMatches;
	std::vector<std::string> sortedSymlinks;
	uint64_t numDirs {0};
	uint64_t numFiles {0};
	uint64_t numErrors {0};
};

inline ScanResult runScan(const Config& config, const ResolvedTarget& target,
	MatchListener* listener = nullptr)
{
	ScanResult result;

	FilterPolicy filterPolicy(config);
	DirWalker dirWalker(config, filterPolicy);

	dirWalker.run();

	std::vector<std::string> symlinks = dirWalker.takeSymlinks();

	LinkResolver linkResolver(config, target, listener);
	linkResolver.run(symlinks);

	result.sortedMatches = linkResolver.getMatchSet().getSortedPaths();
	result.sortedSymlinks = symlinks;
	std::sort(result.sortedSymlinks.begin(), result.sortedSymlinks.end() );
	result.numDirs = dirWalker.getStatistics().numDirsFound;
	result.numFiles = dirWalker.getStatistics().numFilesFound;
	result.numErrors = dirWalker.getStatistics().numErrors;

	return result;
}

inline std::vector<std::string> walkSymlinks(const Config& config)
{
	FilterPolicy filterPolicy(config);
	DirWalker dirWalker(config, filterPolicy);

	dirWalker.run();

	std::vector<std::string> symlinks = dirWalker.takeSymlinks();
	std::sort(symlinks.begin(), symlinks.end() );

	return symlinks;
}

#endif /* TEST_TESTUTILS_H_ */
