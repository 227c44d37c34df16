#ifndef __LPANE_RAW_FD_UTILS__
#define __LPANE_RAW_FD_UTILS__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Blocking wrappers around POSIX read/write loops on pty and tty fds.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever is available (at most `count` bytes), blocking until
   * at least one byte arrives.
   * @return The number of bytes read, 0 on end of file.
   */
  static size_t readSome(int fd, char* buf, size_t count);

  /**
   * @brief Waits for `fd` to become readable.
   * @param timeoutMs Milliseconds to wait, -1 to wait forever.
   * @return true if the descriptor is readable (or hung up).
   */
  static bool waitReadable(int fd, int timeoutMs);

  /** @brief Toggles O_NONBLOCK on a descriptor. */
  static void setNonBlocking(int fd, bool nonBlocking);
};

/**
 * @brief Owns a file descriptor and closes it when destroyed.
 */
class UniqueFd {
 public:
  UniqueFd() : fd(-1) {}
  explicit UniqueFd(int _fd) : fd(_fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      reset(other.fd);
      other.fd = -1;
    }
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const { return fd; }
  bool valid() const { return fd >= 0; }
  void reset(int newFd = -1) {
    if (fd >= 0) {
      ::close(fd);
    }
    fd = newFd;
  }
  int release() {
    int retval = fd;
    fd = -1;
    return retval;
  }

 private:
  int fd;
};
}  // namespace lpane
#endif  // __LPANE_RAW_FD_UTILS__
