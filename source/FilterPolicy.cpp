#include "FilterPolicy.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace
{
	// dirs that are skipped unless the user explicitly asks for them
	const char* const HEAVY_DIR_NAMES[] =
	{
		"node_modules",
		".cache",
		"target",
		"build",
		"dist",
		"out",
		".git",
		".venv",
		"venv",
	};
}

bool HeavyDirRule::isHeavyDirName(const std::string& name)
{
	for(const char* heavyDirName : HEAVY_DIR_NAMES)
	{
		if(name == heavyDirName)
			return true;
	}

	return false;
}

FilterDecision HeavyDirRule::decide(const WalkEntry& entry) const
{
	if(entry.isDir() && isHeavyDirName(entry.name) )
		return FilterDecision::Exclude;

	return FilterDecision::Defer;
}

FilterDecision HiddenEntryRule::decide(const WalkEntry& entry) const
{
	if(!entry.name.empty() && (entry.name[0] == '.') )
		return FilterDecision::Exclude;

	return FilterDecision::Defer;
}

FilterDecision FilesystemBoundaryRule::decide(const WalkEntry& entry) const
{
	if(entry.isDir() && entry.deviceKnown && (entry.device != rootDevice) )
		return FilterDecision::Exclude;

	return FilterDecision::Defer;
}

FilterDecision IgnorePatternRule::decide(const WalkEntry& entry) const
{
	switch(matcher.match(entry.relPath, entry.isDir() ) )
	{
		case IgnoreMatch::Ignore: return FilterDecision::Exclude;
		case IgnoreMatch::Whitelist: return FilterDecision::Include;
		default: return FilterDecision::Defer;
	}
}

FilterDecision GitIgnoreRule::decide(const WalkEntry& entry) const
{
	if(!entry.ignoreScope)
		return FilterDecision::Defer;

	switch(entry.ignoreScope->match(entry.relPath, entry.isDir() ) )
	{
		case IgnoreMatch::Ignore: return FilterDecision::Exclude;
		case IgnoreMatch::Whitelist: return FilterDecision::Include;
		default: return FilterDecision::Defer;
	}
}

/**
 * Build the rule chain from user config. Structural rules (heavy dirs, hidden, filesystem
 * boundary) come first, so that a negated pattern cannot bring back what they excluded.
 *
 * Unreadable ignore files and malformed patterns are dropped, the scan continues without them.
 */
FilterPolicy::FilterPolicy(const Config& config) : printVerbose(config.printVerbose)
{
	if(!config.includeHeavy)
		addRule(std::unique_ptr<FilterRule>(new HeavyDirRule() ) );

	if(!config.includeHidden)
		addRule(std::unique_ptr<FilterRule>(new HiddenEntryRule() ) );

	if(config.oneFilesystem)
	{
		struct stat statBuf;

		int statRes = stat(config.rootPath.c_str(), &statBuf);

		if(!statRes)
		{
			addRule(std::unique_ptr<FilterRule>(new FilesystemBoundaryRule(statBuf.st_dev) ) );
			needDirDevice = true;
		}
		else
		if(config.printVerbose)
			fprintf(stderr, "Unable to get device of scan root, so filesystem boundaries are "
				"not enforced. Path: %s; Error: %s\n", config.rootPath.c_str(), strerror(errno) );
	}

	if(!config.ignoreGlobs.empty() )
	{
		IgnoreMatcher globMatcher;

		for(const std::string& glob : config.ignoreGlobs)
		{
			if(!globMatcher.addPattern(glob) && config.printVerbose)
				fprintf(stderr, "Dropping malformed ignore glob: \"%s\"\n", glob.c_str() );
		}

		if(!globMatcher.empty() )
			addRule(std::unique_ptr<FilterRule>(
				new IgnorePatternRule("ignore-globs", std::move(globMatcher) ) ) );
	}

	if(!config.ignoreFiles.empty() )
	{
		IgnoreMatcher fileMatcher;

		for(const std::string& ignoreFilePath : config.ignoreFiles)
		{
			if(!fileMatcher.addPatternsFromFile(ignoreFilePath, config.printVerbose) &&
				config.printVerbose)
				fprintf(stderr, "Failed to read ignore file: %s\n", ignoreFilePath.c_str() );
		}

		if(!fileMatcher.empty() )
			addRule(std::unique_ptr<FilterRule>(
				new IgnorePatternRule("ignore-files", std::move(fileMatcher) ) ) );
	}

	if(config.respectGitignore)
	{
		addRule(std::unique_ptr<FilterRule>(new GitIgnoreRule() ) );
		useGitIgnore = true;
	}
}

void FilterPolicy::addRule(std::unique_ptr<FilterRule> rule)
{
	rules.push_back(std::move(rule) );
}

/**
 * Evaluate rules in order until one of them decides. Entries that no rule decides on are
 * included.
 */
bool FilterPolicy::isIncluded(const WalkEntry& entry) const
{
	for(const std::unique_ptr<FilterRule>& rule : rules)
	{
		FilterDecision decision = rule->decide(entry);

		if(decision == FilterDecision::Defer)
			continue;

		if( (decision == FilterDecision::Exclude) && printVerbose)
			fprintf(stderr, "Skipping entry due to %s rule: %s\n",
				rule->getName(), entry.path.c_str() );

		return decision == FilterDecision::Include;
	}

	return true;
}
