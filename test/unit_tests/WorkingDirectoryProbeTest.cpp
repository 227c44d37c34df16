#include <clocale>

#include "TestHeaders.hpp"
#include "WorkingDirectoryProbe.hpp"

using namespace lpane;

TEST_CASE("File urls", "[WorkingDirectoryProbe]") {
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath("/home/user") ==
          "file://localhost/home/user");
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath("/a dir/100%") ==
          "file://localhost/a%20dir/100%25");
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath("/x-y_z.~!$&'()*+,;=:@") ==
          "file://localhost/x-y_z.~!$&'()*+,;=:@");
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath("/caf\xc3\xa9") ==
          "file://localhost/caf%C3%A9");
}

TEST_CASE("File URLs escape high bytes in any locale",
          "[WorkingDirectoryProbe]") {
  string previous = ::setlocale(LC_CTYPE, NULL);
  // Single byte locales classify some bytes >= 0x80 as letters
  ::setlocale(LC_CTYPE, "C");
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath("/\xe9t\xe9") ==
          "file://localhost/%E9t%E9");
  REQUIRE(WorkingDirectoryProbe::fileUrlFromPath(string("/a\0b", 4)) ==
          "file://localhost/a%00b");
  ::setlocale(LC_CTYPE, previous.c_str());
}

TEST_CASE("Linux probe reads the cwd link", "[WorkingDirectoryProbe]") {
  char procTemplate[] = "/tmp/lpane_proc_XXXXXX";
  REQUIRE(::mkdtemp(procTemplate) != NULL);
  string procRoot = procTemplate;
  fs::create_directories(procRoot + "/123");
  fs::create_symlink("/some/dir with space", procRoot + "/123/cwd");

  LinuxProbe probe(procRoot);
  REQUIRE(probe.resolve(pid_t(123)) ==
          string("file://localhost/some/dir%20with%20space"));
  REQUIRE(probe.resolve(optional<pid_t>(123)) ==
          string("file://localhost/some/dir%20with%20space"));
  REQUIRE(!probe.resolve(pid_t(456)));
  REQUIRE(!probe.resolve(optional<pid_t>()));

  std::error_code ec;
  fs::remove_all(procRoot, ec);
}

TEST_CASE("Unsupported probe knows nothing", "[WorkingDirectoryProbe]") {
  UnsupportedProbe probe;
  REQUIRE(!probe.resolve(::getpid()));
}

#ifdef __linux__
TEST_CASE("Probing this process", "[WorkingDirectoryProbe]") {
  auto probe = WorkingDirectoryProbe::create();
  REQUIRE(probe->resolve(::getpid()) ==
          WorkingDirectoryProbe::fileUrlFromPath(fs::current_path().string()));
}
#endif
