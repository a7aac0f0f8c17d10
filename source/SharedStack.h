#ifndef SHAREDSTACK_H_
#define SHAREDSTACK_H_

#include "GitIgnore.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stack>
#include <string>

/**
 * Thrown by popWait() when all threads are waiting, so the dir tree scan is complete.
 */
class ScanDoneException : public std::exception {};

/**
 * A directory waiting to be scanned.
 */
struct DirStackElem
{
	DirStackElem() {}

	DirStackElem(const std::string& dirPath, const std::string& dirRelPath, unsigned dirDepth,
		std::shared_ptr<const GitIgnoreScope> parentIgnoreScope) :
		dirPath(dirPath), dirRelPath(dirRelPath), dirDepth(dirDepth),
		parentIgnoreScope(parentIgnoreScope) {}

	std::string dirPath;
	std::string dirRelPath; // dirPath relative to scan root; empty for the root itself
	unsigned dirDepth {0}; // depth of the entries inside this dir (root entries have depth 0)
	std::shared_ptr<const GitIgnoreScope> parentIgnoreScope; // NULL if gitignore is disabled
};

/**
 * This is the stack for directories that were found by the breadth search threads.
 */
class SharedStack
{
	public:
		/**
		 * @numThreads number of threads calling popWait(); needed to detect termination.
		 */
		explicit SharedStack(unsigned numThreads) : numThreads(numThreads) {}

	private:
		std::stack<DirStackElem> dirPathStack;
		std::mutex mutex;
		std::condition_variable condition; // when new elems are pushed
		const unsigned numThreads;
		unsigned numWaiters {0}; // detect termination when equal to number of threads
		std::atomic_uint64_t stackSize {0}; // to get stack size lock-free

	public:
		void push(DirStackElem elem);
		bool popWait(DirStackElem& outElem);

		/**
		 * Lock-free getter of current stack size.
		 */
		uint64_t getSize() const
		{
			return stackSize;
		}
};

#endif /* SHAREDSTACK_H_ */
