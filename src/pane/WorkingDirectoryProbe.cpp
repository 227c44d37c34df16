#include "WorkingDirectoryProbe.hpp"

namespace lpane {
shared_ptr<WorkingDirectoryProbe> WorkingDirectoryProbe::create() {
#if __APPLE__
  return shared_ptr<WorkingDirectoryProbe>(new DarwinProbe());
#elif __linux__
  return shared_ptr<WorkingDirectoryProbe>(new LinuxProbe());
#else
  return shared_ptr<WorkingDirectoryProbe>(new UnsupportedProbe());
#endif
}

namespace {
// ASCII only, independent of the locale
bool keepInUrl(uint8_t ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
      (ch >= '0' && ch <= '9')) {
    return true;
  }
  return ch != 0 && strchr("/-._~!$&'()*+,;=:@", ch) != NULL;
}
}  // namespace

string WorkingDirectoryProbe::fileUrlFromPath(const string& path) {
  static const char* HEX = "0123456789ABCDEF";
  string url = "file://localhost";
  for (char c : path) {
    uint8_t ch = uint8_t(c);
    if (keepInUrl(ch)) {
      url.push_back(c);
    } else {
      url.push_back('%');
      url.push_back(HEX[ch >> 4]);
      url.push_back(HEX[ch & 0xf]);
    }
  }
  return url;
}

optional<string> LinuxProbe::resolve(pid_t pid) const {
  std::error_code ec;
  fs::path cwd =
      fs::read_symlink(procRoot + "/" + to_string(pid) + "/cwd", ec);
  if (ec) {
    VLOG(2) << "No working directory for pid " << pid << ": " << ec.message();
    return nullopt;
  }
  return fileUrlFromPath(cwd.string());
}

optional<string> DarwinProbe::resolve(pid_t pid) const {
#if __APPLE__
  struct proc_vnodepathinfo pathinfo;
  memset(&pathinfo, 0, sizeof(pathinfo));
  int size = int(sizeof(pathinfo));
  int ret = proc_pidinfo(pid, PROC_PIDVNODEPATHINFO, 0, &pathinfo, size);
  if (ret != size) {
    VLOG(2) << "proc_pidinfo failed for pid " << pid;
    return nullopt;
  }
  return fileUrlFromPath(pathinfo.pvi_cdir.vip_path);
#else
  VLOG(2) << "libproc is not available, cannot probe pid " << pid;
  return nullopt;
#endif
}
}  // namespace lpane
