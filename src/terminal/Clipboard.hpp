#ifndef __LPANE_CLIPBOARD__
#define __LPANE_CLIPBOARD__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Clipboard backend an emulator stores OSC 52 selections into.
 */
class Clipboard {
 public:
  virtual ~Clipboard() {}
  /** @brief Replaces the contents, `nullopt` clears the clipboard. */
  virtual void setContents(const optional<string>& data) = 0;
  virtual optional<string> getContents() = 0;
};

/**
 * @brief Clipboard that keeps its contents in process memory.
 */
class MemoryClipboard : public Clipboard {
 public:
  virtual ~MemoryClipboard() {}

  virtual void setContents(const optional<string>& data) {
    lock_guard<std::mutex> guard(mutex);
    contents = data;
  }

  virtual optional<string> getContents() {
    lock_guard<std::mutex> guard(mutex);
    return contents;
  }

 protected:
  std::mutex mutex;
  optional<string> contents;
};
}  // namespace lpane

#endif  // __LPANE_CLIPBOARD__
