#include "GitIgnore.h"
#include "Target.h"

#include <sys/stat.h>
#include <utility>
#include <vector>

/**
 * Read dir/.gitignore and, if dir is a repository root, dir/.git/info/exclude.
 *
 * @return NULL if the dir has no patterns.
 */
std::shared_ptr<GitIgnoreScope> GitIgnoreScope::loadFiles(const std::string& dirPath,
	bool logDropped)
{
	std::shared_ptr<GitIgnoreScope> scope(new GitIgnoreScope() );

	const std::string dirPathSlash = (dirPath.back() == '/') ? dirPath : (dirPath + "/");

	// missing files are the common case, so no error handling here
	scope->gitIgnoreMatcher.addPatternsFromFile(dirPathSlash + GITIGNORE_FILENAME, logDropped);

	struct stat statBuf;

	// ".git" can be a dir or a file (worktrees, submodules). only real dirs have info/exclude.
	if(!stat( (dirPathSlash + GITIGNORE_GITDIR_NAME).c_str(), &statBuf) &&
		S_ISDIR(statBuf.st_mode) )
		scope->excludeMatcher.addPatternsFromFile(dirPathSlash + GITIGNORE_EXCLUDE_SUBPATH,
			logDropped);

	if(scope->gitIgnoreMatcher.empty() && scope->excludeMatcher.empty() )
		return nullptr;

	return scope;
}

/**
 * @return true if dirPath contains ".git" (dir or file), so it is the root of a repository.
 */
bool GitIgnoreScope::hasGitDir(const std::string& dirPath)
{
	const std::string dirPathSlash = (dirPath.back() == '/') ? dirPath : (dirPath + "/");

	struct stat statBuf;

	return !lstat( (dirPathSlash + GITIGNORE_GITDIR_NAME).c_str(), &statBuf);
}

/**
 * Load the ignore files of a directory.
 *
 * @dirRelPath dirPath relative to the scan root.
 * @return a new scope if the dir contains patterns, otherwise parentScope (which may be NULL).
 */
std::shared_ptr<const GitIgnoreScope> GitIgnoreScope::load(const std::string& dirPath,
	const std::string& dirRelPath, std::shared_ptr<const GitIgnoreScope> parentScope,
	bool logDropped)
{
	std::shared_ptr<GitIgnoreScope> scope = loadFiles(dirPath, logDropped);
	if(!scope)
		return parentScope;

	scope->parentScope = parentScope;
	scope->dirRelPath = dirRelPath;

	return scope;
}

/**
 * Load the ignore files of the dirs above the scan root, up to the enclosing repository root
 * (the first dir that contains ".git") or up to "/" if there is none. Nothing is loaded if the
 * scan root itself is a repository root.
 *
 * @return scope chain with the outermost dir at the end, NULL if no ancestor has patterns.
 */
std::shared_ptr<const GitIgnoreScope> GitIgnoreScope::loadAncestors(const std::string& rootPath,
	bool logDropped)
{
	std::string canonicalRootPath;

	if(!canonicalizePath(rootPath, canonicalRootPath) )
		return nullptr; // the walker reports problems with the root

	if( (canonicalRootPath == "/") || hasGitDir(canonicalRootPath) )
		return nullptr;

	// pairs of ancestor dir and path from that dir to the scan root, innermost first
	std::vector<std::pair<std::string, std::string> > ancestors;

	std::string currentDir(canonicalRootPath);
	std::string currentRootPrefix;

	while(currentDir != "/")
	{
		size_t lastSlashPos = currentDir.rfind('/');
		const std::string dirName = currentDir.substr(lastSlashPos + 1);

		currentRootPrefix = currentRootPrefix.empty() ?
			dirName : (dirName + "/" + currentRootPrefix);
		currentDir = lastSlashPos ? currentDir.substr(0, lastSlashPos) : "/";

		ancestors.push_back(std::make_pair(currentDir, currentRootPrefix) );

		if(hasGitDir(currentDir) )
			break; // repository root
	}

	std::shared_ptr<const GitIgnoreScope> scope;

	// outermost first, so that deeper dirs take precedence in match()
	for(auto iter = ancestors.rbegin(); iter != ancestors.rend(); iter++)
	{
		std::shared_ptr<GitIgnoreScope> ancestorScope = loadFiles(iter->first, logDropped);
		if(!ancestorScope)
			continue;

		ancestorScope->parentScope = scope;
		ancestorScope->rootPrefix = iter->second;
		scope = ancestorScope;
	}

	return scope;
}

/**
 * Translate a path relative to the scan root into a path relative to this scope's dir.
 *
 * @return false if relPath is not inside this scope's dir.
 */
bool GitIgnoreScope::getPathInScope(const std::string& relPath,
	std::string& outPathInScope) const
{
	if(!rootPrefix.empty() )
	{ // dir above the scan root contains everything below the root
		outPathInScope = rootPrefix + "/" + relPath;
		return true;
	}

	if(dirRelPath.empty() )
	{
		outPathInScope = relPath;
		return true;
	}

	if( (relPath.length() <= dirRelPath.length() ) ||
		relPath.compare(0, dirRelPath.length(), dirRelPath) ||
		(relPath[dirRelPath.length()] != '/') )
		return false;

	outPathInScope = relPath.substr(dirRelPath.length() + 1);

	return true;
}

/**
 * Check relPath against this scope and all parent scopes. Deeper .gitignore files take
 * precedence over shallower ones and all .gitignore files take precedence over exclude files.
 *
 * @relPath path relative to the scan root.
 */
IgnoreMatch GitIgnoreScope::match(const std::string& relPath, bool isDir) const
{
	std::string pathInScope;

	for(const GitIgnoreScope* scope = this; scope; scope = scope->parentScope.get() )
	{
		if(!scope->getPathInScope(relPath, pathInScope) )
			continue;

		IgnoreMatch matchRes = scope->gitIgnoreMatcher.match(pathInScope, isDir);
		if(matchRes != IgnoreMatch::None)
			return matchRes;
	}

	for(const GitIgnoreScope* scope = this; scope; scope = scope->parentScope.get() )
	{
		if(!scope->getPathInScope(relPath, pathInScope) )
			continue;

		IgnoreMatch matchRes = scope->excludeMatcher.match(pathInScope, isDir);
		if(matchRes != IgnoreMatch::None)
			return matchRes;
	}

	return IgnoreMatch::None;
}
