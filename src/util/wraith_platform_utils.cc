#include "wraith_platform_utils.h"
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/wait.h>
#include <uuid/uuid.h>
#include <signal.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace WraithPlatform {

bool IsExecutable(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string FindExecutable(const std::string& name) {
  if (name.empty()) {
    return "";
  }
  if (name.find('/') != std::string::npos) {
    return IsExecutable(name) ? name : "";
  }

  const char* path_env = getenv("PATH");
  if (!path_env) {
    return "";
  }

  std::stringstream ss(path_env);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (IsExecutable(candidate)) {
      return candidate;
    }
  }
  return "";
}

int AllocateLoopbackPort(std::string& error) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    error = std::string("socket() failed: ") + strerror(errno);
    return -1;
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;

  if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = std::string("bind() failed: ") + strerror(errno);
    close(fd);
    return -1;
  }

  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
    error = std::string("getsockname() failed: ") + strerror(errno);
    close(fd);
    return -1;
  }

  int port = ntohs(addr.sin_port);
  close(fd);
  return port;
}

std::string MakeTempDirectory(const std::string& tag, std::string& error) {
  const char* tmp = getenv("TMPDIR");
  std::string base = (tmp && *tmp) ? tmp : "/tmp";
  std::string pattern = base + "/" + tag + "-XXXXXX";

  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    error = "mkdtemp(" + pattern + ") failed: " + strerror(errno);
    return "";
  }
  return std::string(buf.data());
}

bool RemoveDirectoryTree(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    return errno == ENOENT;
  }
  if (!S_ISDIR(st.st_mode)) {
    return unlink(path.c_str()) == 0;
  }

  DIR* dir = opendir(path.c_str());
  if (!dir) {
    return false;
  }

  bool ok = true;
  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
      continue;
    }
    if (!RemoveDirectoryTree(path + "/" + entry->d_name)) {
      ok = false;
    }
  }
  closedir(dir);

  if (rmdir(path.c_str()) != 0) {
    ok = false;
  }
  return ok;
}

bool WriteFile(const std::string& path, const std::string& contents, std::string& error) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    error = "open(" + path + ") failed: " + strerror(errno);
    return false;
  }

  size_t written = 0;
  while (written < contents.size()) {
    ssize_t n = write(fd, contents.data() + written, contents.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      error = "write(" + path + ") failed: " + strerror(errno);
      close(fd);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (close(fd) != 0) {
    error = "close(" + path + ") failed: " + strerror(errno);
    return false;
  }
  return true;
}

bool TerminateChild(pid_t pid, int grace_ms) {
  if (pid <= 0) {
    return true;
  }

  kill(pid, SIGTERM);

  // Wait with timeout
  int status = 0;
  pid_t wait_result = 0;
  int waited_ms = 0;
  while (true) {
    wait_result = waitpid(pid, &status, WNOHANG);
    if (wait_result != 0 || waited_ms >= grace_ms) break;
    usleep(10000);  // 10ms
    waited_ms += 10;
  }

  if (wait_result == 0) {
    // Force kill
    kill(pid, SIGKILL);
    do {
      wait_result = waitpid(pid, &status, 0);
    } while (wait_result < 0 && errno == EINTR);
  }

  // ECHILD means somebody already reaped it
  return wait_result == pid || (wait_result < 0 && errno == ECHILD);
}

bool ChildExited(pid_t pid, std::string& how) {
  int status = 0;
  pid_t result = waitpid(pid, &status, WNOHANG);
  if (result == 0) {
    return false;
  }
  if (result < 0) {
    how = std::string("waitpid failed: ") + strerror(errno);
    return true;
  }
  if (WIFEXITED(status)) {
    how = "exit code " + std::to_string(WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    how = "signal " + std::to_string(WTERMSIG(status));
  } else {
    how = "unknown status";
  }
  return true;
}

std::string GenerateInstanceId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

std::vector<std::string> SplitArgs(const std::string& s) {
  std::vector<std::string> out;
  std::string current;
  for (char ch : s) {
    if (ch == ' ' || ch == '\t') {
      if (!current.empty()) {
        out.push_back(current);
        current.clear();
      }
    } else {
      current += ch;
    }
  }
  if (!current.empty()) {
    out.push_back(current);
  }
  return out;
}

}  // namespace WraithPlatform
