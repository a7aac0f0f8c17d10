#include "TestUtils.h"

#include <gtest/gtest.h>

#include <set>

class ScanPipelineTest : public TempDirTest {};

TEST_F(ScanPipelineTest, FindsOnlyLinksToTarget)
{
	makeFile("real");
	makeFile("other");
	makeSymlink("a/link1", "../real");
	makeSymlink("b/link2", "../other");

	Config config = makeConfig();
	ResolvedTarget target = ResolvedTarget::resolve(path("real") );

	ScanResult result = runScan(config, target);

	EXPECT_EQ(result.sortedMatches, (std::vector<std::string>{path("a/link1")}) );
	EXPECT_EQ(result.sortedSymlinks.size(), 2u);
	EXPECT_EQ(result.numDirs, 3u);
	EXPECT_GE(result.numFiles, 1u);
	EXPECT_EQ(result.numErrors, 0u);
}

TEST_F(ScanPipelineTest, HeavyDirBeatsForceIncludeGlob)
{
	makeFile("real");
	makeSymlink("node_modules/pkg/link", "../../real");
	makeSymlink("src/link", "../real");

	Config config = makeConfig();
	config.ignoreGlobs = {"!node_modules"};

	ResolvedTarget target = ResolvedTarget::resolve(path("real") );

	EXPECT_EQ(runScan(config, target).sortedMatches, (std::vector<std::string>{path("src/link")}) );

	config.includeHeavy = true;

	EXPECT_EQ(runScan(config, target).sortedMatches,
		(std::vector<std::string>{path("node_modules/pkg/link"), path("src/link")}) );
}

TEST_F(ScanPipelineTest, RepeatedRunsGiveSameResult)
{
	makeFile("real");

	for(unsigned i=0; i < 10; i++)
		makeSymlink("d" + std::to_string(i) + "/link", (i % 3) ? "../real" : "../d0");

	Config config = makeConfig();
	ResolvedTarget target = ResolvedTarget::resolve(path("real") );

	ScanResult firstResult = runScan(config, target);
	ScanResult secondResult = runScan(config, target);

	EXPECT_EQ(firstResult.sortedMatches, secondResult.sortedMatches);
	EXPECT_EQ(firstResult.numDirs, secondResult.numDirs);
	EXPECT_EQ(firstResult.numFiles, secondResult.numFiles);
	EXPECT_EQ(firstResult.sortedMatches.size(), 6u);
}

TEST_F(ScanPipelineTest, ResultsDoNotDependOnThreadCount)
{
	const unsigned numDirs = 100;
	const unsigned numFilesPerDir = 98;

	makeFile("real");
	makeFile("decoy");

	for(unsigned dirIndex=0; dirIndex < numDirs; dirIndex++)
	{
		const std::string dirName = "dir" + std::to_string(dirIndex);

		for(unsigned fileIndex=0; fileIndex < numFilesPerDir; fileIndex++)
			makeFile(dirName + "/file" + std::to_string(fileIndex) );

		makeSymlink(dirName + "/link", (dirIndex % 2) ? "../real" : "../decoy");
	}

	ResolvedTarget target = ResolvedTarget::resolve(path("real") );

	std::vector<std::string> referenceMatches;

	for(unsigned numThreads : {1u, 2u, 16u} )
	{
		ScanResult result = runScan(makeConfig(numThreads), target);

		EXPECT_EQ(result.numDirs, numDirs + 1) << "threads: " << numThreads;
		EXPECT_EQ(result.numFiles, (numDirs * numFilesPerDir) + 2) << "threads: " << numThreads;
		EXPECT_EQ(result.sortedSymlinks.size(), numDirs) << "threads: " << numThreads;
		EXPECT_EQ(result.sortedMatches.size(), numDirs / 2) << "threads: " << numThreads;

		// each match exactly once
		std::set<std::string> uniqueMatches(result.sortedMatches.begin(),
			result.sortedMatches.end() );
		EXPECT_EQ(uniqueMatches.size(), result.sortedMatches.size() );

		if(referenceMatches.empty() )
			referenceMatches = result.sortedMatches;
		else
			EXPECT_EQ(result.sortedMatches, referenceMatches) << "threads: " << numThreads;
	}
}

TEST_F(ScanPipelineTest, TargetOutsideRootIsFound)
{
	makeFile("outside/real");
	makeSymlink("scan/x/link", path("outside/real") );

	Config config = makeConfig();
	config.rootPath = path("scan");

	ResolvedTarget target = ResolvedTarget::resolve(path("outside/real") );

	EXPECT_EQ(runScan(config, target).sortedMatches,
		(std::vector<std::string>{path("scan/x/link")}) );
}

TEST_F(ScanPipelineTest, LinkOutsideRootIsNotFound)
{
	makeFile("scan/real");
	makeSymlink("elsewhere/link", "../scan/real");

	Config config = makeConfig();
	config.rootPath = path("scan");

	ResolvedTarget target = ResolvedTarget::resolve(path("scan/real") );

	EXPECT_TRUE(runScan(config, target).sortedMatches.empty() );
}
