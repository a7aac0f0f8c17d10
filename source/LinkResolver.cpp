#include "LinkResolver.h"

#include <algorithm>
#include <functional>
#include <stack>
#include <sys/stat.h>
#include <thread>

std::vector<std::string> MatchSet::getSortedPaths() const
{
	std::vector<std::string> sortedPaths;

	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K

		sortedPaths = paths;
	}

	std::sort(sortedPaths.begin(), sortedPaths.end() );

	return sortedPaths;
}

size_t MatchSet::size() const
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K

	return paths.size();
}

LinkResolver::LinkResolver(const Config& config, const ResolvedTarget& target,
	MatchListener* listener) :
	target(target), listener(listener),
	numThreads(getEffectiveNumThreads(config.numThreads) ),
	streamingEnabled(listener && config.streamMatches && !config.printJSON)
{
}

/**
 * Check all candidates in parallel. Returns after all resolver threads terminated, so the match
 * set is complete afterwards.
 *
 * @candidates the frozen list of symlinks from the dir walk; must not change during this call.
 */
void LinkResolver::run(const std::vector<std::string>& candidates)
{
	nextCandidateIndex = 0;

	const size_t numUsedThreads = std::min<size_t>(numThreads, candidates.size() );

	std::stack<std::thread> resolveThreads;

	for(size_t i=0; i < numUsedThreads; i++)
		resolveThreads.push(std::thread(&LinkResolver::threadStart, this, std::cref(candidates) ) );

	while(!resolveThreads.empty() )
	{
		resolveThreads.top().join();
		resolveThreads.pop();
	}
}

/**
 * Starting point for resolver threads. Each thread grabs the next unchecked candidate until
 * all are done.
 */
void LinkResolver::threadStart(const std::vector<std::string>& candidates)
{
	for( ; ; )
	{
		size_t candidateIndex = nextCandidateIndex++;
		if(candidateIndex >= candidates.size() )
			return;

		const std::string& candidatePath = candidates[candidateIndex];

		if(isMatch(candidatePath) )
			publishMatch(candidatePath);

		if(listener)
			listener->candidateDone();
	}
}

/**
 * Add to match set and announce to listener if streaming is enabled. The announcement happens
 * after the add, so a listener never sees a match that is not in the set yet.
 *
 * No lock is held while the listener prints. call_once blocks concurrent callers until
 * beginResults() returned, so it precedes every matchFound().
 */
void LinkResolver::publishMatch(const std::string& path)
{
	matchSet.add(path);

	if(!streamingEnabled)
		return;

	std::call_once(resultsBegunFlag, &MatchListener::beginResults, listener);

	numStreamed++;

	listener->matchFound(path);
}

bool LinkResolver::isMatch(const std::string& candidatePath) const
{
	if(isMatchByIdentity(candidatePath) )
		return true;

	return isMatchByCanonicalPath(candidatePath);
}

/**
 * Fast path: compare device and inode of the final link target with the target.
 *
 * @return false if target identity is unknown, the candidate cannot be resolved or the
 * 		identities differ.
 */
bool LinkResolver::isMatchByIdentity(const std::string& candidatePath) const
{
	if(!target.hasIdentity)
		return false;

	struct stat statBuf;

	if(stat(candidatePath.c_str(), &statBuf) )
		return false; // dangling link, permission error or race with deletion

	return (statBuf.st_dev == target.device) && (statBuf.st_ino == target.inode);
}

/**
 * Slow path: fully canonicalize the candidate and compare with the canonical target path.
 *
 * @return false if the candidate cannot be resolved or resolves to another path.
 */
bool LinkResolver::isMatchByCanonicalPath(const std::string& candidatePath) const
{
	std::string canonicalPath;

	if(!canonicalizePath(candidatePath, canonicalPath) )
		return false;

	return canonicalPath == target.canonicalPath;
}
