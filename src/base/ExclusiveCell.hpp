#ifndef __LPANE_EXCLUSIVE_CELL__
#define __LPANE_EXCLUSIVE_CELL__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Single-writer lock that refuses re-entry from the owning thread.
 *
 * Another thread blocks until the current holder releases.  The thread that
 * already holds the flag gets a `std::logic_error` instead of a deadlock.
 */
class BorrowFlag {
 public:
  BorrowFlag() : owner(std::thread::id()) {}

  void acquire(const char* what) {
    if (owner.load() == std::this_thread::get_id()) {
      STERROR << "Re-entrant borrow of " << what;
      throw std::logic_error(string("Re-entrant borrow of ") + what +
                             " while it is already borrowed on this thread");
    }
    m.lock();
    owner.store(std::this_thread::get_id());
  }

  void release() {
    owner.store(std::thread::id());
    m.unlock();
  }

  bool isHeldByThisThread() const {
    return owner.load() == std::this_thread::get_id();
  }

 private:
  std::mutex m;
  std::atomic<std::thread::id> owner;
};

/**
 * @brief Scoped exclusive access to a value owned by an `ExclusiveCell`.
 *
 * The borrow is released when the guard is destroyed.  A guard over a derived
 * type converts to a guard over any of its bases.
 */
template <typename T>
class BorrowGuard {
 public:
  BorrowGuard(BorrowFlag* _flag, T* _value) : flag(_flag), value(_value) {}

  BorrowGuard(const BorrowGuard&) = delete;
  BorrowGuard& operator=(const BorrowGuard&) = delete;

  BorrowGuard(BorrowGuard&& other) noexcept
      : flag(other.flag), value(other.value) {
    other.flag = nullptr;
    other.value = nullptr;
  }

  template <typename U, typename = typename std::enable_if<
                            std::is_convertible<U*, T*>::value>::type>
  BorrowGuard(BorrowGuard<U>&& other) noexcept
      : flag(other.flag), value(other.value) {
    other.flag = nullptr;
    other.value = nullptr;
  }

  ~BorrowGuard() {
    if (flag) {
      flag->release();
    }
  }

  T* operator->() const { return value; }
  T& operator*() const { return *value; }
  T* get() const { return value; }

  /**
   * @brief Hands the borrow over to a guard on a part of the borrowed value.
   * This guard is left empty.
   */
  template <typename U>
  BorrowGuard<U> project(U* part) && {
    BorrowGuard<U> retval(flag, part);
    flag = nullptr;
    value = nullptr;
    return retval;
  }

 private:
  template <typename>
  friend class BorrowGuard;

  BorrowFlag* flag;
  T* value;
};

/**
 * @brief Owns a value and hands out exclusive, scoped access to it.
 */
template <typename T>
class ExclusiveCell {
 public:
  ExclusiveCell(unique_ptr<T> _value, const char* _name)
      : value(std::move(_value)), name(_name) {
    if (!value) {
      throw std::invalid_argument(string("ExclusiveCell needs a value: ") +
                                  name);
    }
  }

  BorrowGuard<T> borrowMut() {
    flag.acquire(name);
    return BorrowGuard<T>(&flag, value.get());
  }

  bool isBorrowedByThisThread() const { return flag.isHeldByThisThread(); }

 private:
  unique_ptr<T> value;
  const char* name;
  BorrowFlag flag;
};
}  // namespace lpane

#endif  // __LPANE_EXCLUSIVE_CELL__
