#include "RawFdUtils.hpp"

namespace lpane {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw SystemErrorFromErrno("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

size_t RawFdUtils::readSome(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readSome");
  }
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc >= 0) {
      return size_t(rc);
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      waitReadable(fd, -1);
      continue;
    }
    // A pty master reports EIO once the slave side has been closed by every
    // process, which is the end of the stream for our purposes.
    if (localErrno == EIO) {
      return 0;
    }
    throw SystemErrorFromErrno("Cannot read from fd");
  }
}

bool RawFdUtils::waitReadable(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw SystemErrorFromErrno("poll failed");
  }
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void RawFdUtils::setNonBlocking(int fd, bool nonBlocking) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    throw SystemErrorFromErrno("fcntl(F_GETFL) failed");
  }
  flags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    throw SystemErrorFromErrno("fcntl(F_SETFL) failed");
  }
}
}  // namespace lpane
