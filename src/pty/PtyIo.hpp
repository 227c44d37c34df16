#ifndef __LPANE_PTY_IO__
#define __LPANE_PTY_IO__

#include "Headers.hpp"
#include "RawFdUtils.hpp"

namespace lpane {
/**
 * @brief Independently owned read side of a pty master.
 */
class PtyReader {
 public:
  virtual ~PtyReader() {}
  /**
   * @brief Blocks until some bytes are available.
   * @return Number of bytes stored in `buf`, 0 once the child side is gone.
   */
  virtual size_t read(char* buf, size_t count) = 0;
};

/**
 * @brief Write side of a pty master, i.e. the child's stdin.
 */
class PtyWriter {
 public:
  virtual ~PtyWriter() {}
  /** @brief Writes every byte or throws. */
  virtual void write(const string& data) = 0;
  virtual void flush() {}
};

class FdPtyReader : public PtyReader {
 public:
  explicit FdPtyReader(UniqueFd _fd) : fd(std::move(_fd)) {}
  virtual ~FdPtyReader() {}

  virtual size_t read(char* buf, size_t count) {
    return RawFdUtils::readSome(fd.get(), buf, count);
  }

  int getFd() const { return fd.get(); }

 protected:
  UniqueFd fd;
};

class FdPtyWriter : public PtyWriter {
 public:
  explicit FdPtyWriter(UniqueFd _fd) : fd(std::move(_fd)) {}
  virtual ~FdPtyWriter() {}

  virtual void write(const string& data) {
    RawFdUtils::writeAll(fd.get(), data.c_str(), data.length());
  }

 protected:
  UniqueFd fd;
};
}  // namespace lpane

#endif  // __LPANE_PTY_IO__
