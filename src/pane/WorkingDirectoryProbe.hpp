#ifndef __LPANE_WORKING_DIRECTORY_PROBE__
#define __LPANE_WORKING_DIRECTORY_PROBE__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Finds the working directory of another process.
 *
 * Results are advisory: any failure is reported as nullopt.  Directories are
 * returned as `file://localhost/...` URLs.
 */
class WorkingDirectoryProbe {
 public:
  virtual ~WorkingDirectoryProbe() {}

  virtual optional<string> resolve(pid_t pid) const = 0;

  /** @brief nullopt when there is no pid to look at. */
  optional<string> resolve(const optional<pid_t>& pid) const {
    if (!pid) {
      return nullopt;
    }
    return resolve(*pid);
  }

  /** @brief The probe for the platform we are running on. */
  static shared_ptr<WorkingDirectoryProbe> create();

  /** @brief Percent-encodes `path` into a file URL on localhost. */
  static string fileUrlFromPath(const string& path);
};

/**
 * @brief Reads the /proc/<pid>/cwd symlink.
 */
class LinuxProbe : public WorkingDirectoryProbe {
 public:
  explicit LinuxProbe(const string& _procRoot = "/proc")
      : procRoot(_procRoot) {}
  virtual ~LinuxProbe() {}

  using WorkingDirectoryProbe::resolve;
  virtual optional<string> resolve(pid_t pid) const;

 protected:
  string procRoot;
};

/**
 * @brief Asks libproc for the vnode path of the process' current directory.
 */
class DarwinProbe : public WorkingDirectoryProbe {
 public:
  virtual ~DarwinProbe() {}

  using WorkingDirectoryProbe::resolve;
  virtual optional<string> resolve(pid_t pid) const;
};

class UnsupportedProbe : public WorkingDirectoryProbe {
 public:
  virtual ~UnsupportedProbe() {}

  using WorkingDirectoryProbe::resolve;
  virtual optional<string> resolve(pid_t) const { return nullopt; }
};
}  // namespace lpane

#endif  // __LPANE_WORKING_DIRECTORY_PROBE__
