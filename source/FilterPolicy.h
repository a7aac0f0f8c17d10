#ifndef FILTERPOLICY_H_
#define FILTERPOLICY_H_

#include "Config.h"
#include "GitIgnore.h"
#include "IgnorePattern.h"

#include <memory>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

enum class EntryType
{
	File, // regular file
	Dir,
	Symlink,
	Other, // fifo, socket, device or unknown type
};

/**
 * A directory entry as seen by the filter rules.
 */
struct WalkEntry
{
	std::string path; // scan root path + relPath
	std::string relPath; // relative to scan root
	std::string name;
	EntryType type {EntryType::Other};
	unsigned depth {0}; // entries directly under the scan root have depth 0
	bool deviceKnown {false}; // true if device was queried (only for dirs when needed)
	dev_t device {0};
	const GitIgnoreScope* ignoreScope {nullptr}; // scope of containing dir; NULL if disabled

	bool isDir() const { return type == EntryType::Dir; }
};

enum class FilterDecision
{
	Include,
	Exclude,
	Defer, // let the next rule decide
};

/**
 * A single rule of the filter chain.
 */
class FilterRule
{
	public:
		virtual ~FilterRule() {}

		virtual FilterDecision decide(const WalkEntry& entry) const = 0;
		virtual const char* getName() const = 0;
};

/**
 * Excludes dirs that are typically huge and generated, e.g. node_modules.
 */
class HeavyDirRule : public FilterRule
{
	public:
		FilterDecision decide(const WalkEntry& entry) const override;
		const char* getName() const override { return "heavy-dirs"; }

		static bool isHeavyDirName(const std::string& name);
};

class HiddenEntryRule : public FilterRule
{
	public:
		FilterDecision decide(const WalkEntry& entry) const override;
		const char* getName() const override { return "hidden"; }
};

/**
 * Excludes dirs that live on another device than the scan root.
 */
class FilesystemBoundaryRule : public FilterRule
{
	public:
		explicit FilesystemBoundaryRule(dev_t rootDevice) : rootDevice(rootDevice) {}

		FilterDecision decide(const WalkEntry& entry) const override;
		const char* getName() const override { return "one-filesystem"; }

	private:
		const dev_t rootDevice;
};

/**
 * Gitignore-style patterns relative to the scan root, e.g. from "--ignore" or
 * "--ignore-file". A negated pattern includes the entry and skips the remaining rules.
 */
class IgnorePatternRule : public FilterRule
{
	public:
		IgnorePatternRule(const char* name, IgnoreMatcher matcher) :
			name(name), matcher(std::move(matcher) ) {}

		FilterDecision decide(const WalkEntry& entry) const override;
		const char* getName() const override { return name; }

	private:
		const char* name;
		IgnoreMatcher matcher;
};

/**
 * Per-directory .gitignore and .git/info/exclude patterns. The walker loads the scopes;
 * this rule only evaluates the scope that is attached to the entry.
 */
class GitIgnoreRule : public FilterRule
{
	public:
		FilterDecision decide(const WalkEntry& entry) const override;
		const char* getName() const override { return "gitignore"; }
};

/**
 * Ordered chain of filter rules. Immutable after construction, so it can be used by all
 * scan threads without locking.
 */
class FilterPolicy
{
	public:
		FilterPolicy() {}
		explicit FilterPolicy(const Config& config);

		FilterPolicy(const FilterPolicy&) = delete;
		FilterPolicy& operator=(const FilterPolicy&) = delete;

		void addRule(std::unique_ptr<FilterRule> rule);
		bool isIncluded(const WalkEntry& entry) const;

	private:
		std::vector<std::unique_ptr<FilterRule> > rules;
		bool needDirDevice {false};
		bool useGitIgnore {false};
		bool printVerbose {false};

	public:
		bool needsDirDevice() const { return needDirDevice; }
		bool usesGitIgnore() const { return useGitIgnore; }
		size_t getNumRules() const { return rules.size(); }
		const FilterRule& getRule(size_t index) const { return *rules[index]; }
};

#endif /* FILTERPOLICY_H_ */
