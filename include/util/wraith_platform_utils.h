#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

namespace WraithPlatform {

// True if |path| is a regular file the current user may execute
bool IsExecutable(const std::string& path);

// Resolve |name| against $PATH. Names containing '/' are checked as-is.
// Returns "" when nothing executable is found.
std::string FindExecutable(const std::string& name);

// Bind a TCP socket to 127.0.0.1:0 and return the port the kernel picked,
// or -1 with |error| filled in.
int AllocateLoopbackPort(std::string& error);

// Create a fresh private directory under $TMPDIR (or /tmp) whose name
// includes |tag|. Returns "" with |error| filled in on failure.
std::string MakeTempDirectory(const std::string& tag, std::string& error);

// Recursively delete |path|. Missing paths count as removed.
bool RemoveDirectoryTree(const std::string& path);

// Write |contents| to |path|, replacing the file
bool WriteFile(const std::string& path, const std::string& contents, std::string& error);

// SIGTERM |pid|, wait up to |grace_ms| for it to exit, then SIGKILL and
// reap. Returns false if the child could not be reaped.
bool TerminateChild(pid_t pid, int grace_ms);

// Non-blocking check whether child |pid| has exited. When it has, the child
// is reaped and |how| describes the exit ("exit code 1", "signal 9").
bool ChildExited(pid_t pid, std::string& how);

// Random RFC 4122 id, lower-case
std::string GenerateInstanceId();

// Split on runs of spaces/tabs, dropping empty tokens
std::vector<std::string> SplitArgs(const std::string& s);

}  // namespace WraithPlatform
