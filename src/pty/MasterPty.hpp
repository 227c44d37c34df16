#ifndef __LPANE_MASTER_PTY__
#define __LPANE_MASTER_PTY__

#include "Headers.hpp"
#include "PtyIo.hpp"
#include "TerminalTypes.hpp"

namespace lpane {
/**
 * @brief The controlling side of a pseudo terminal.
 */
class MasterPty {
 public:
  virtual ~MasterPty() {}

  /**
   * @brief Tells the kernel (and so the child) about a new window size.
   * @throws std::system_error if the size cannot be applied.
   */
  virtual void resize(const ScreenSize& size) = 0;
  virtual ScreenSize getSize() = 0;

  /** @brief A new reader that owns its own descriptor. */
  virtual unique_ptr<PtyReader> tryCloneReader() = 0;
  /** @brief A new writer that owns its own descriptor. */
  virtual shared_ptr<PtyWriter> tryCloneWriter() = 0;
  /** @brief The writer owned by this pty. */
  virtual PtyWriter& writer() = 0;

  /** @brief Foreground process group of the pty, if there is one. */
  virtual optional<pid_t> processGroupLeader() = 0;
};
}  // namespace lpane

#endif  // __LPANE_MASTER_PTY__
