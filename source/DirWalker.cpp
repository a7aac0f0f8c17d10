#include "DirWalker.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <stack>
#include <sys/stat.h>
#include <thread>

/**
 * Append name to dirPath with exactly one slash in between.
 */
std::string joinPath(const std::string& dirPath, const std::string& name)
{
	if(!dirPath.empty() && (dirPath.back() == '/') )
		return dirPath + name;

	return dirPath + "/" + name;
}

DirWalker::DirWalker(const Config& config, const FilterPolicy& filterPolicy) :
	config(config), filterPolicy(filterPolicy),
	numThreads(getEffectiveNumThreads(config.numThreads) ),
	depthSearchStartThreshold(config.depthSearchStartThreshold),
	sharedStack(numThreads)
{
	if(!depthSearchStartThreshold)
		depthSearchStartThreshold = numThreads;

	// with single thread, always do depth search because there is no parallelism anyways
	if(numThreads == 1)
		depthSearchStartThreshold = 0;
}

/**
 * Scan the whole tree below config.rootPath. Returns after all scan threads terminated, so
 * statistics and symlinks are complete afterwards.
 */
void DirWalker::run()
{
	queueRootDir();

	std::stack<std::thread> scanThreads;

	// start threads
	for(unsigned i=0; i < numThreads; i++)
		scanThreads.push(std::thread(&DirWalker::threadStart, this) );

	// wait for threads to self-terminate
	while(!scanThreads.empty() )
	{
		scanThreads.top().join();
		scanThreads.pop();
	}
}

/**
 * Take the collected symlink paths. Only valid after run() returned.
 */
std::vector<std::string> DirWalker::takeSymlinks()
{
	return symlinkBuffer.freeze();
}

/**
 * Check type of the scan root and add it to the stack if it's a dir. The root is resolved if it
 * is a symlink, because the user explicitly asked to scan it.
 */
void DirWalker::queueRootDir()
{
	struct stat statBuf;

	statistics.numStatCalls++;

	int statRes = stat(config.rootPath.c_str(), &statBuf);
	if(statRes)
	{
		statistics.numErrors++;

		if(config.printVerbose)
			fprintf(stderr, "Failed to open dir: %s; Error: %s\n",
				config.rootPath.c_str(), strerror(errno) );

		return;
	}

	if(!S_ISDIR(statBuf.st_mode) )
	{ // nothing to descend into
		if(S_ISREG(statBuf.st_mode) )
			statistics.numFilesFound++;
		else
			statistics.numOtherFound++;

		return;
	}

	statistics.numDirsFound++;

	// our scan() always adds one slash, so remove trailing slashes (but keep "/")
	std::string rootPathTrimmed(config.rootPath);
	while( (rootPathTrimmed.length() > 1) && (rootPathTrimmed.back() == '/') )
		rootPathTrimmed.pop_back();

	// ignore files of the enclosing repository also apply when scanning a subdir of it
	std::shared_ptr<const GitIgnoreScope> ancestorIgnoreScope;

	if(filterPolicy.usesGitIgnore() )
		ancestorIgnoreScope = GitIgnoreScope::loadAncestors(rootPathTrimmed, config.printVerbose);

	sharedStack.push(DirStackElem(rootPathTrimmed, "", 0, ancestorIgnoreScope) );
}

/**
 * Starting point for directory structure scan threads.
 */
void DirWalker::threadStart()
{
	try
	{
		DirStackElem dirElem;

		while(sharedStack.popWait(dirElem) )
			scan(dirElem);
	}
	catch(ScanDoneException& e)
	{
	}
}

/**
 * Set type of entry from dirEntry d_type or from fstatat() if d_type is unknown. Also gets the
 * device of dirs if the filter policy needs it.
 *
 * @return false if entry type could not be determined (e.g. because it was deleted meanwhile).
 */
bool DirWalker::classifyEntry(int dirFD, const struct dirent* dirEntry, WalkEntry& entry)
{
	struct stat statBuf;
	bool statDone = false;

	if(dirEntry->d_type == DT_UNKNOWN)
	{
		statistics.numUnknownFound++;
		statistics.numStatCalls++;

		int statRes = fstatat(dirFD, dirEntry->d_name, &statBuf, AT_SYMLINK_NOFOLLOW);
		if(statRes)
		{
			statistics.numErrors++;

			if(config.printVerbose)
				fprintf(stderr, "Failed to get attributes for path: %s; Error: %s\n",
					entry.path.c_str(), strerror(errno) );

			return false;
		}

		statDone = true;

		if(S_ISDIR(statBuf.st_mode) )
			entry.type = EntryType::Dir;
		else
		if(S_ISLNK(statBuf.st_mode) )
			entry.type = EntryType::Symlink;
		else
		if(S_ISREG(statBuf.st_mode) )
			entry.type = EntryType::File;
		else
			entry.type = EntryType::Other;
	}
	else
	{
		switch(dirEntry->d_type)
		{
			case DT_DIR: entry.type = EntryType::Dir; break;
			case DT_LNK: entry.type = EntryType::Symlink; break;
			case DT_REG: entry.type = EntryType::File; break;
			default: entry.type = EntryType::Other; break;
		}
	}

	if(!entry.isDir() || !filterPolicy.needsDirDevice() )
		return true;

	if(!statDone)
	{
		statistics.numStatCalls++;

		if(fstatat(dirFD, dirEntry->d_name, &statBuf, AT_SYMLINK_NOFOLLOW) )
		{ // dir is probably gone, so opendir() will fail later and count the error
			if(config.printVerbose)
				fprintf(stderr, "Failed to get attributes for path: %s; Error: %s\n",
					entry.path.c_str(), strerror(errno) );

			return true;
		}
	}

	entry.device = statBuf.st_dev;
	entry.deviceKnown = true;

	return true;
}

/**
 * This is the main workhorse. It does a breadth scan while dir stack size is below
 * depthSearchStartThreshold, in which cases discovered dirs are put on stack so that other
 * threads can grab them. Otherwise it switches to recursive depth search.
 *
 * Dirs that cannot be opened or read are skipped, the scan continues with the rest of the tree.
 */
void DirWalker::scan(const DirStackElem& dirElem)
{
	DIR* dirStream = opendir(dirElem.dirPath.c_str() );
	if(!dirStream)
	{
		statistics.numErrors++;

		if(config.printVerbose)
			fprintf(stderr, "Failed to open dir: %s; Error: %s\n",
				dirElem.dirPath.c_str(), strerror(errno) );

		return;
	}

	std::shared_ptr<const GitIgnoreScope> ignoreScope = dirElem.parentIgnoreScope;

	if(filterPolicy.usesGitIgnore() )
		ignoreScope = GitIgnoreScope::load(dirElem.dirPath, dirElem.dirRelPath,
			dirElem.parentIgnoreScope, config.printVerbose);

	/* loop over contents of this entire directory - potentially recursively descending into subdirs
		along the way, depending on config and current global state */
	for( ; ; )
	{
		errno = 0;
		struct dirent* dirEntry = readdir(dirStream);
		if(!dirEntry)
		{
			if(errno)
			{
				statistics.numErrors++;

				if(config.printVerbose)
					fprintf(stderr, "Failed to read from dir: %s; Error: %s\n",
						dirElem.dirPath.c_str(), strerror(errno) );
			}

			break;
		}

		if(!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, "..") )
			continue;

		WalkEntry entry;
		entry.name = dirEntry->d_name;
		entry.path = joinPath(dirElem.dirPath, entry.name);
		entry.relPath = dirElem.dirRelPath.empty() ?
			entry.name : (dirElem.dirRelPath + "/" + entry.name);
		entry.depth = dirElem.dirDepth;
		entry.ignoreScope = ignoreScope.get();

		if(!classifyEntry(dirfd(dirStream), dirEntry, entry) )
			continue;

		if(!filterPolicy.isIncluded(entry) )
		{
			statistics.numFilteredOut++;
			continue;
		}

		switch(entry.type)
		{
			case EntryType::Dir:
			{
				statistics.numDirsFound++;

				if(entry.depth < config.maxDirDepth)
				{
					DirStackElem subdirElem(entry.path, entry.relPath, entry.depth + 1, ignoreScope);

					if(sharedStack.getSize() >= depthSearchStartThreshold)
						scan(subdirElem);
					else // breadth search, so just add dir to stack for later processing
						sharedStack.push(std::move(subdirElem) );
				}
			} break;

			case EntryType::File:
				statistics.numFilesFound++;
			break;

			case EntryType::Symlink:
			{
				statistics.numSymlinksFound++;
				symlinkBuffer.push(entry.path);
			} break;

			default:
				statistics.numOtherFound++;
			break;
		}
	}

	closedir(dirStream);
}
