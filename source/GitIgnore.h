#ifndef GITIGNORE_H_
#define GITIGNORE_H_

#include "IgnorePattern.h"

#include <memory>
#include <string>

#define GITIGNORE_FILENAME			".gitignore"
#define GITIGNORE_GITDIR_NAME		".git"
#define GITIGNORE_EXCLUDE_SUBPATH	".git/info/exclude"

/**
 * Gitignore patterns of one directory, linked to the scope of its parent dir.
 *
 * Scopes are immutable once loaded and shared between the scan threads, so children of a
 * dir can be scanned in parallel with the same parent chain.
 */
class GitIgnoreScope
{
	public:
		static std::shared_ptr<const GitIgnoreScope> load(const std::string& dirPath,
			const std::string& dirRelPath, std::shared_ptr<const GitIgnoreScope> parentScope,
			bool logDropped);
		static std::shared_ptr<const GitIgnoreScope> loadAncestors(const std::string& rootPath,
			bool logDropped);

		IgnoreMatch match(const std::string& relPath, bool isDir) const;

	private:
		GitIgnoreScope() {}

		std::shared_ptr<const GitIgnoreScope> parentScope;
		std::string dirRelPath; // relative to scan root; empty for the root itself
		std::string rootPrefix; // for dirs above the scan root: path from this dir to the root
		IgnoreMatcher gitIgnoreMatcher; // from dir/.gitignore
		IgnoreMatcher excludeMatcher; // from dir/.git/info/exclude if dir is a repo root

		static std::shared_ptr<GitIgnoreScope> loadFiles(const std::string& dirPath,
			bool logDropped);
		static bool hasGitDir(const std::string& dirPath);

		bool getPathInScope(const std::string& relPath, std::string& outPathInScope) const;
};

#endif /* GITIGNORE_H_ */
