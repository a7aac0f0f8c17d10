#ifndef TARGET_H_
#define TARGET_H_

#include <stdexcept>
#include <string>
#include <sys/types.h>

/**
 * Thrown if the user-given target path cannot be canonicalized. This aborts the run.
 */
class TargetResolveException : public std::runtime_error
{
	public:
		explicit TargetResolveException(const std::string& message) :
			std::runtime_error(message) {}
};

/**
 * The canonical path that symlinks get compared against. Immutable after resolve(), so it can
 * be shared by all resolver threads.
 */
struct ResolvedTarget
{
	std::string canonicalPath;
	bool hasIdentity {false}; // true if device and inode are valid
	dev_t device {0};
	ino_t inode {0};

	static ResolvedTarget resolve(const std::string& userPath);
};

bool canonicalizePath(const std::string& path, std::string& outCanonicalPath);

#endif /* TARGET_H_ */
