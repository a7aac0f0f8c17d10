#ifndef IGNOREPATTERN_H_
#define IGNOREPATTERN_H_

#include <string>
#include <vector>

enum class IgnoreMatch
{
	None, // no pattern matched
	Ignore, // last matching pattern was an ignore pattern
	Whitelist, // last matching pattern was negated ("!" prefix)
};

/**
 * A single gitignore-style pattern.
 *
 * Supported syntax: "#" comments, "!" negation, "\" escapes, trailing "/" for dirs only,
 * leading or inner "/" to anchor the pattern to the base dir, "**" to match any number of
 * path components. Other wildcards are handled by fnmatch(3).
 */
class IgnorePattern
{
	public:
		enum class ParseResult
		{
			Pattern, // valid pattern
			Empty, // blank line or comment
			Malformed, // e.g. unterminated bracket expression
		};

		static ParseResult parse(const std::string& line, IgnorePattern& outPattern);

		bool matches(const std::string& relPath, bool isDir) const;

	private:
		std::string origLine;
		std::vector<std::string> segments; // path components of anchored patterns
		std::string namePattern; // for unanchored patterns (matched against basename)
		bool negated {false};
		bool dirOnly {false};
		bool anchored {false};

		static bool hasValidBrackets(const std::string& pattern);
		bool matchSegments(size_t patternIndex, const std::vector<std::string>& pathSegments,
			size_t pathIndex) const;

	public:
		bool isNegated() const { return negated; }
		bool isDirOnly() const { return dirOnly; }
		bool isAnchored() const { return anchored; }
		const std::string& getOrigLine() const { return origLine; }
};

/**
 * Ordered list of gitignore-style patterns. Last matching pattern wins.
 */
class IgnoreMatcher
{
	public:
		bool addPattern(const std::string& line);
		bool addPatternsFromFile(const std::string& filePath, bool logDropped);

		IgnoreMatch match(const std::string& relPath, bool isDir) const;

	private:
		std::vector<IgnorePattern> patterns;

	public:
		bool empty() const { return patterns.empty(); }
		size_t getNumPatterns() const { return patterns.size(); }
};

std::vector<std::string> splitPath(const std::string& path);

#endif /* IGNOREPATTERN_H_ */
