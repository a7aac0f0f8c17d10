#include "SharedStack.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

TEST(SharedStackTest, PopReturnsLastPushed)
{
	SharedStack sharedStack(1);

	sharedStack.push(DirStackElem("/a", "a", 0, nullptr) );
	sharedStack.push(DirStackElem("/a/b", "a/b", 1, nullptr) );

	EXPECT_EQ(sharedStack.getSize(), 2u);

	DirStackElem elem;

	ASSERT_TRUE(sharedStack.popWait(elem) );
	EXPECT_EQ(elem.dirPath, "/a/b");
	EXPECT_EQ(elem.dirRelPath, "a/b");
	EXPECT_EQ(elem.dirDepth, 1u);

	ASSERT_TRUE(sharedStack.popWait(elem) );
	EXPECT_EQ(elem.dirPath, "/a");

	EXPECT_EQ(sharedStack.getSize(), 0u);
	EXPECT_THROW(sharedStack.popWait(elem), ScanDoneException);
}

TEST(SharedStackTest, PopWaitOnEmptyStackWithSingleThreadIsDone)
{
	SharedStack sharedStack(1);

	DirStackElem elem;

	EXPECT_THROW(sharedStack.popWait(elem), ScanDoneException);
}

TEST(SharedStackTest, AllWaitingThreadsTerminate)
{
	const unsigned numThreads = 8;

	SharedStack sharedStack(numThreads);
	std::atomic_uint numPopped {0};
	std::atomic_uint numDone {0};

	for(unsigned i=0; i < 100; i++)
		sharedStack.push(DirStackElem("/dir", "dir", 0, nullptr) );

	std::vector<std::thread> threads;

	for(unsigned i=0; i < numThreads; i++)
		threads.emplace_back( [&]()
		{
			try
			{
				DirStackElem elem;

				while(sharedStack.popWait(elem) )
				{
					// every tenth elem creates another one, like a dir with a subdir
					if(!(numPopped++ % 10) )
						sharedStack.push(DirStackElem("/dir/sub", "dir/sub", 1, nullptr) );
				}
			}
			catch(ScanDoneException& e)
			{
				numDone++;
			}
		} );

	for(std::thread& thread : threads)
		thread.join();

	EXPECT_EQ(numDone.load(), numThreads);
	EXPECT_GE(numPopped.load(), 100u);
	EXPECT_EQ(sharedStack.getSize(), 0u);
}
