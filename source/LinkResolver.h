#ifndef LINKRESOLVER_H_
#define LINKRESOLVER_H_

#include "Config.h"
#include "Target.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

/**
 * Receives notifications from the resolver threads.
 *
 * All methods are called concurrently from the resolver threads, so implementations must
 * synchronize their own output. beginResults() is guaranteed to have returned before the
 * first matchFound() is called.
 */
class MatchListener
{
	public:
		virtual ~MatchListener() {}

		virtual void beginResults() = 0; // once, before the first matchFound()
		virtual void matchFound(const std::string& path) = 0;
		virtual void candidateDone() {} // once per checked candidate
};

/**
 * Symlink paths that resolve to the target. Appended to by all resolver threads.
 */
class MatchSet
{
	public:
		void add(const std::string& path)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K

			paths.push_back(path);
		}

		std::vector<std::string> getSortedPaths() const;
		size_t size() const;

	private:
		mutable std::mutex mutex;
		std::vector<std::string> paths;
};

/**
 * Parallel check of symlink candidates against the target.
 *
 * Each candidate is first compared by filesystem identity (device and inode of the final link
 * target), which avoids building the canonical path. If that is unavailable or doesn't match,
 * the canonical path of the candidate is compared with the canonical target path.
 * Candidates that cannot be resolved (dangling, permission denied, deleted) are no match.
 */
class LinkResolver
{
	public:
		LinkResolver(const Config& config, const ResolvedTarget& target,
			MatchListener* listener);

		LinkResolver(const LinkResolver&) = delete;
		LinkResolver& operator=(const LinkResolver&) = delete;

		void run(const std::vector<std::string>& candidates);

		bool isMatch(const std::string& candidatePath) const;
		bool isMatchByIdentity(const std::string& candidatePath) const;
		bool isMatchByCanonicalPath(const std::string& candidatePath) const;

	private:
		const ResolvedTarget& target;
		MatchListener* listener; // may be NULL
		const unsigned numThreads;
		const bool streamingEnabled;

		MatchSet matchSet;
		std::atomic_size_t nextCandidateIndex {0};
		std::atomic_uint64_t numStreamed {0};
		std::once_flag resultsBegunFlag; // for the single beginResults() call

		void threadStart(const std::vector<std::string>& candidates);
		void publishMatch(const std::string& path);

	public:
		const MatchSet& getMatchSet() const { return matchSet; }
		uint64_t getNumStreamed() const { return numStreamed; }
		bool isStreamingEnabled() const { return streamingEnabled; }
};

#endif /* LINKRESOLVER_H_ */
