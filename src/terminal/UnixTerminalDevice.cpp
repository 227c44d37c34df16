#include "UnixTerminalDevice.hpp"

namespace lpane {
namespace {
// SIGWINCH bookkeeping shared by every device in the process
std::mutex winchMutex;
int winchUsers = 0;
int winchPipe[2] = {-1, -1};
struct sigaction previousWinchAction;
std::atomic<uint64_t> winchGeneration(0);

void winchHandler(int) {
  int savedErrno = GetErrno();
  winchGeneration++;
  if (winchPipe[1] >= 0) {
    char c = 'w';
    // Pipe full means a wakeup is already pending
    ssize_t rc = ::write(winchPipe[1], &c, 1);
    (void)rc;
  }
  SetErrno(savedErrno);
}

void installWinchHandler() {
  lock_guard<std::mutex> guard(winchMutex);
  if (winchUsers++ > 0) {
    return;
  }
  if (::pipe(winchPipe) < 0) {
    winchUsers--;
    throw SystemErrorFromErrno("Cannot create SIGWINCH pipe");
  }
  for (int fd : winchPipe) {
    RawFdUtils::setNonBlocking(fd, true);
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
  }
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = winchHandler;
  sigemptyset(&action.sa_mask);
  FATAL_FAIL(::sigaction(SIGWINCH, &action, &previousWinchAction));
}

void uninstallWinchHandler() {
  lock_guard<std::mutex> guard(winchMutex);
  if (--winchUsers > 0) {
    return;
  }
  if (::sigaction(SIGWINCH, &previousWinchAction, NULL) < 0) {
    LOG(WARNING) << "Cannot restore SIGWINCH handler: " << strerror(GetErrno());
  }
  for (int& fd : winchPipe) {
    ::close(fd);
    fd = -1;
  }
}

void drainWinchPipe() {
  char buf[64];
  while (::read(winchPipe[0], buf, sizeof(buf)) > 0) {
  }
}
}  // namespace

UnixTerminalDevice::UnixTerminalDevice(int _readFd, int _writeFd,
                                       const Capabilities& _caps)
    : readFd(_readFd),
      writeFd(_writeFd),
      originalMode(TerminalMode::Cooked),
      mode(TerminalMode::Cooked),
      renderer(_caps),
      closed(false),
      lastGeneration(0) {
  if (::tcgetattr(readFd, &originalTermios) < 0) {
    throw SystemErrorFromErrno("Cannot read terminal attributes");
  }
  originalMode = (originalTermios.c_lflag & ICANON) ? TerminalMode::Cooked
                                                     : TerminalMode::Raw;
  mode = originalMode;
  installWinchHandler();
  lastGeneration = winchGeneration.load();
  try {
    lastSize = getScreenSize();
  } catch (const std::system_error& se) {
    VLOG(1) << "Terminal did not report a size: " << se.what();
  }
  VLOG(1) << "Opened terminal device, initial size " << lastSize;
}

unique_ptr<UnixTerminalDevice> UnixTerminalDevice::openControllingTerminal(
    const Capabilities& caps) {
  int fd = ::open("/dev/tty", O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd < 0) {
    throw SystemErrorFromErrno("Cannot open /dev/tty");
  }
  UniqueFd owned(fd);
  unique_ptr<UnixTerminalDevice> device(new UnixTerminalDevice(fd, fd, caps));
  device->ownedFd = std::move(owned);
  return device;
}

UnixTerminalDevice::~UnixTerminalDevice() {
  try {
    flush();
  } catch (const std::exception& ex) {
    VLOG(1) << "Discarding unflushed terminal output: " << ex.what();
  }
  if (::tcsetattr(readFd, TCSANOW, &originalTermios) < 0) {
    LOG(WARNING) << "Cannot restore terminal attributes: "
                 << strerror(GetErrno());
  }
  uninstallWinchHandler();
}

void UnixTerminalDevice::applyTermios(const termios& t, const char* what) {
  if (::tcsetattr(readFd, TCSANOW, &t) < 0) {
    throw SystemErrorFromErrno(string("Cannot switch terminal to ") + what +
                               " mode");
  }
}

void UnixTerminalDevice::setRawMode() {
  termios raw = originalTermios;
  cfmakeraw(&raw);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  applyTermios(raw, "raw");
  mode = TerminalMode::Raw;
}

void UnixTerminalDevice::setCookedMode() {
  termios cooked = originalTermios;
  cooked.c_iflag |= ICRNL | IXON | BRKINT;
  cooked.c_oflag |= OPOST | ONLCR;
  cooked.c_lflag |= ICANON | ECHO | ECHOE | ISIG | IEXTEN;
  applyTermios(cooked, "cooked");
  mode = TerminalMode::Cooked;
}

ScreenSize UnixTerminalDevice::getScreenSize() {
  winsize win;
  memset(&win, 0, sizeof(win));
  if (::ioctl(writeFd, TIOCGWINSZ, &win) < 0) {
    throw SystemErrorFromErrno("Cannot query terminal size");
  }
  return ScreenSize(checkedCast<size_t>(win.ws_row),
                    checkedCast<size_t>(win.ws_col),
                    checkedCast<size_t>(win.ws_xpixel),
                    checkedCast<size_t>(win.ws_ypixel));
}

void UnixTerminalDevice::setScreenSize(const ScreenSize& size) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = checkedCast<unsigned short>(size.rows);
  win.ws_col = checkedCast<unsigned short>(size.cols);
  win.ws_xpixel = checkedCast<unsigned short>(size.pixelWidth);
  win.ws_ypixel = checkedCast<unsigned short>(size.pixelHeight);
  if (::ioctl(writeFd, TIOCSWINSZ, &win) < 0) {
    throw SystemErrorFromErrno("Cannot set terminal size");
  }
  lastSize = size;
}

void UnixTerminalDevice::render(const vector<Change>& changes) {
  renderer.render(changes, &outputBuffer);
}

void UnixTerminalDevice::flush() {
  if (outputBuffer.empty()) {
    return;
  }
  string pending;
  pending.swap(outputBuffer);
  RawFdUtils::writeAll(writeFd, pending.c_str(), pending.length());
}

optional<InputEvent> UnixTerminalDevice::checkForResize() {
  uint64_t generation = winchGeneration.load();
  if (generation == lastGeneration) {
    return nullopt;
  }
  lastGeneration = generation;
  ScreenSize size;
  try {
    size = getScreenSize();
  } catch (const std::system_error& se) {
    LOG(WARNING) << "Window changed but the new size is unknown: "
                 << se.what();
    return nullopt;
  }
  if (size == lastSize) {
    return nullopt;
  }
  VLOG(1) << "Terminal resized from " << lastSize << " to " << size;
  lastSize = size;
  return InputEvent::resized(size);
}

bool UnixTerminalDevice::readIntoParser() {
  char buf[4096];
  size_t bytesRead = RawFdUtils::readSome(readFd, buf, sizeof(buf));
  if (bytesRead == 0) {
    return false;
  }
  parser.feed(string(buf, bytesRead));
  return true;
}

optional<InputEvent> UnixTerminalDevice::pollInput(Blocking blocking) {
  while (true) {
    auto event = parser.pop();
    if (event) {
      return event;
    }
    auto resized = checkForResize();
    if (resized) {
      return resized;
    }
    if (closed) {
      return nullopt;
    }

    pollfd fds[2];
    fds[0].fd = readFd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = winchPipe[0];
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, 2, blocking == Blocking::Wait ? -1 : 0);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        // Usually SIGWINCH, picked up at the top of the loop
        continue;
      }
      throw SystemErrorFromErrno("Cannot poll terminal");
    }
    if (rc == 0) {
      return nullopt;
    }
    if (fds[1].revents & POLLIN) {
      drainWinchPipe();
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      if (!readIntoParser()) {
        VLOG(1) << "Terminal device closed";
        closed = true;
        parser.flush();
        continue;
      }
      // An ESC with nothing after it is the Escape key, not a sequence start
      if (parser.hasPartial() &&
          !RawFdUtils::waitReadable(readFd, ESCAPE_TIMEOUT_MS)) {
        parser.flush();
      }
    }
  }
}
}  // namespace lpane
