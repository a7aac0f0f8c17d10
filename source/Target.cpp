#include "Target.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

/**
 * Resolve all symlinks and "."/".." components of path.
 *
 * @return false on error (e.g. dangling link, permission denied, symlink loop), errno is set
 * 		accordingly.
 */
bool canonicalizePath(const std::string& path, std::string& outCanonicalPath)
{
	char* resolvedPath = realpath(path.c_str(), NULL);
	if(!resolvedPath)
		return false;

	outCanonicalPath = resolvedPath;

	free(resolvedPath);

	return true;
}

/**
 * Canonicalize the user-given target and get its filesystem identity for fast comparisons.
 *
 * @throw TargetResolveException if the target does not exist or cannot be resolved.
 */
ResolvedTarget ResolvedTarget::resolve(const std::string& userPath)
{
	ResolvedTarget target;

	if(userPath.empty() )
		throw TargetResolveException("Failed to resolve target: empty path");

	if(!canonicalizePath(userPath, target.canonicalPath) )
		throw TargetResolveException("Failed to resolve target: " + userPath + "; "
			"Error: " + strerror(errno) );

	struct stat statBuf;

	// identity is only an optimization, so the slow path is used if this fails
	if(!stat(target.canonicalPath.c_str(), &statBuf) )
	{
		target.hasIdentity = true;
		target.device = statBuf.st_dev;
		target.inode = statBuf.st_ino;
	}

	return target;
}
