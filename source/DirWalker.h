#ifndef DIRWALKER_H_
#define DIRWALKER_H_

#include "Config.h"
#include "FilterPolicy.h"
#include "SharedStack.h"

#include <atomic>
#include <cstdint>
#include <dirent.h>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct WalkStatistics
{
	std::atomic_uint64_t numDirsFound {0}; // includes the scan root
	std::atomic_uint64_t numFilesFound {0}; // regular files
	std::atomic_uint64_t numSymlinksFound {0};
	std::atomic_uint64_t numOtherFound {0}; // fifos, sockets, devices
	std::atomic_uint64_t numUnknownFound {0}; // d_type was DT_UNKNOWN
	std::atomic_uint64_t numStatCalls {0};
	std::atomic_uint64_t numFilteredOut {0}; // excluded by filter policy
	std::atomic_uint64_t numErrors {0}; // e.g. permission errors
};

/**
 * Symlink paths found during the scan. Appended to by all scan threads; taken out once after
 * all threads are done.
 */
class SymlinkBuffer
{
	public:
		void push(const std::string& path)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K

			paths.push_back(path);
		}

		/**
		 * Move out all paths. Only call after all writers are done.
		 */
		std::vector<std::string> freeze()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K

			return std::move(paths);
		}

	private:
		std::mutex mutex;
		std::vector<std::string> paths;
};

/**
 * Parallel walk of a directory tree that collects symlinks and counts files & dirs.
 *
 * This uses a combination of breadth and depth search. Breadth to generate parallelism, depth
 * to limit memory usage. (If only one thread is active, then it does depth search, because
 * there is no parallelism anyways.)
 *
 * Symlinks are never followed, so a symlinked dir is reported as symlink and not descended.
 */
class DirWalker
{
	public:
		DirWalker(const Config& config, const FilterPolicy& filterPolicy);

		DirWalker(const DirWalker&) = delete;
		DirWalker& operator=(const DirWalker&) = delete;

		void run();
		std::vector<std::string> takeSymlinks();

	private:
		const Config& config;
		const FilterPolicy& filterPolicy;
		const unsigned numThreads;
		unsigned depthSearchStartThreshold;

		SharedStack sharedStack;
		WalkStatistics statistics;
		SymlinkBuffer symlinkBuffer;

		void threadStart();
		void scan(const DirStackElem& dirElem);
		bool classifyEntry(int dirFD, const struct dirent* dirEntry, WalkEntry& entry);
		void queueRootDir();

	public:
		const WalkStatistics& getStatistics() const { return statistics; }
		unsigned getNumThreads() const { return numThreads; }
};

std::string joinPath(const std::string& dirPath, const std::string& name);

#endif /* DIRWALKER_H_ */
