#include "SharedStack.h"

#include <utility>

void SharedStack::push(DirStackElem elem)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K

	dirPathStack.push(std::move(elem) );

	stackSize++;

	condition.notify_one();
}

/**
 * If stack is empty, this waits for a new push.
 *
 * @return false if stack was empty, so outElem did not get assigned.
 * @throw ScanDoneException when all threads were waiting, so no thread was active anymore
 * 		to add more dirs to the stack.
 */
bool SharedStack::popWait(DirStackElem& outElem)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K

	numWaiters++;

	while(dirPathStack.empty() )
	{
		if(numWaiters == numThreads)
		{ // all threads waiting => end of dir tree scan
			// note: no numWaiters-- here, so that all threads see termination condition
			condition.notify_all();
			throw ScanDoneException();
		}

		condition.wait(lock);
	}

	numWaiters--;

	outElem = std::move(dirPathStack.top() );

	dirPathStack.pop();

	stackSize--;

	return true;
}
