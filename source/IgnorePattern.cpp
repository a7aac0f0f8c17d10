#include "IgnorePattern.h"

#include <cstdio>
#include <fnmatch.h>
#include <fstream>

/**
 * Split a path into its components. Empty components (e.g. from "a//b") are skipped.
 */
std::vector<std::string> splitPath(const std::string& path)
{
	std::vector<std::string> components;
	size_t startPos = 0;

	while(startPos <= path.length() )
	{
		size_t slashPos = path.find('/', startPos);
		if(slashPos == std::string::npos)
			slashPos = path.length();

		if(slashPos > startPos)
			components.push_back(path.substr(startPos, slashPos - startPos) );

		startPos = slashPos + 1;
	}

	return components;
}

/**
 * Parse a line from a gitignore-style file or a user-given glob.
 *
 * @outPattern only valid if ParseResult::Pattern is returned.
 */
IgnorePattern::ParseResult IgnorePattern::parse(const std::string& line,
	IgnorePattern& outPattern)
{
	std::string pattern(line);

	// files written on windows
	if(!pattern.empty() && (pattern.back() == '\r') )
		pattern.pop_back();

	// trailing spaces are ignored unless they are escaped with backslash
	while(!pattern.empty() && ( (pattern.back() == ' ') || (pattern.back() == '\t') ) )
	{
		if( (pattern.length() >= 2) && (pattern[pattern.length() - 2] == '\\') )
			break;

		pattern.pop_back();
	}

	if(pattern.empty() || (pattern[0] == '#') )
		return ParseResult::Empty;

	outPattern = IgnorePattern();
	outPattern.origLine = line;

	if(pattern[0] == '!')
	{
		outPattern.negated = true;
		pattern.erase(0, 1);
	}
	else
	if( (pattern.length() >= 2) && (pattern[0] == '\\') &&
		( (pattern[1] == '!') || (pattern[1] == '#') ) )
		pattern.erase(0, 1); // literal "!" or "#" at start of name

	if(!pattern.empty() && (pattern.back() == '/') )
	{
		outPattern.dirOnly = true;

		while(!pattern.empty() && (pattern.back() == '/') )
			pattern.pop_back();
	}

	if(pattern.empty() )
		return ParseResult::Malformed; // e.g. "!" or "/"

	if(!hasValidBrackets(pattern) )
		return ParseResult::Malformed;

	if(pattern.find('/') == std::string::npos)
	{ // no slash => matches basename in any dir
		outPattern.namePattern = pattern;
		return ParseResult::Pattern;
	}

	outPattern.anchored = true;
	outPattern.segments = splitPath(pattern);

	if(outPattern.segments.empty() )
		return ParseResult::Malformed;

	return ParseResult::Pattern;
}

/**
 * Check that each "[" starts a terminated bracket expression. fnmatch(3) would otherwise
 * treat it as a literal char, which is not what the user meant.
 */
bool IgnorePattern::hasValidBrackets(const std::string& pattern)
{
	for(size_t i = 0; i < pattern.length(); i++)
	{
		if(pattern[i] == '\\')
		{
			i++; // skip escaped char
			continue;
		}

		if(pattern[i] != '[')
			continue;

		size_t closePos = i + 1;

		if( (closePos < pattern.length() ) &&
			( (pattern[closePos] == '!') || (pattern[closePos] == '^') ) )
			closePos++;

		if( (closePos < pattern.length() ) && (pattern[closePos] == ']') )
			closePos++; // "]" as first char is part of the set

		closePos = pattern.find(']', closePos);
		if(closePos == std::string::npos)
			return false;

		i = closePos;
	}

	return true;
}

/**
 * @relPath path relative to the base dir of this pattern, without leading slash.
 * @isDir true if relPath refers to a directory.
 */
bool IgnorePattern::matches(const std::string& relPath, bool isDir) const
{
	if(dirOnly && !isDir)
		return false;

	if(!anchored)
	{
		size_t lastSlashPos = relPath.rfind('/');
		const char* baseName = (lastSlashPos == std::string::npos) ?
			relPath.c_str() : relPath.c_str() + lastSlashPos + 1;

		return !fnmatch(namePattern.c_str(), baseName, 0 /* flags */);
	}

	std::vector<std::string> pathSegments = splitPath(relPath);

	return matchSegments(0, pathSegments, 0);
}

bool IgnorePattern::matchSegments(size_t patternIndex,
	const std::vector<std::string>& pathSegments, size_t pathIndex) const
{
	if(patternIndex == segments.size() )
		return pathIndex == pathSegments.size();

	if(segments[patternIndex] == "**")
	{
		if(patternIndex == (segments.size() - 1) )
			return pathIndex < pathSegments.size(); // "dir/**" matches contents, not dir itself

		// "**" consumes zero or more path components
		for(size_t nextPathIndex = pathIndex; nextPathIndex <= pathSegments.size();
			nextPathIndex++)
		{
			if(matchSegments(patternIndex + 1, pathSegments, nextPathIndex) )
				return true;
		}

		return false;
	}

	if(pathIndex == pathSegments.size() )
		return false;

	if(fnmatch(segments[patternIndex].c_str(), pathSegments[pathIndex].c_str(), 0) )
		return false;

	return matchSegments(patternIndex + 1, pathSegments, pathIndex + 1);
}

/**
 * Add a pattern line. Blank lines and comments are accepted and skipped.
 *
 * @return false if the line was a malformed pattern and got dropped.
 */
bool IgnoreMatcher::addPattern(const std::string& line)
{
	IgnorePattern pattern;

	IgnorePattern::ParseResult parseRes = IgnorePattern::parse(line, pattern);

	if(parseRes == IgnorePattern::ParseResult::Malformed)
		return false;

	if(parseRes == IgnorePattern::ParseResult::Pattern)
		patterns.push_back(pattern);

	return true;
}

/**
 * Add all pattern lines of a gitignore-style file.
 *
 * @logDropped print malformed lines to stderr.
 * @return false if the file could not be read.
 */
bool IgnoreMatcher::addPatternsFromFile(const std::string& filePath, bool logDropped)
{
	std::ifstream fileStream(filePath);
	if(!fileStream.is_open() )
		return false;

	std::string line;

	while(std::getline(fileStream, line) )
	{
		if(!addPattern(line) && logDropped)
			fprintf(stderr, "Dropping malformed ignore pattern: \"%s\"; File: %s\n",
				line.c_str(), filePath.c_str() );
	}

	return true;
}

IgnoreMatch IgnoreMatcher::match(const std::string& relPath, bool isDir) const
{
	for(auto iter = patterns.rbegin(); iter != patterns.rend(); iter++)
	{
		if(iter->matches(relPath, isDir) )
			return iter->isNegated() ? IgnoreMatch::Whitelist : IgnoreMatch::Ignore;
	}

	return IgnoreMatch::None;
}
