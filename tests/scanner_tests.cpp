#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <sbdump/scanner.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace sbdump;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() /
           (std::string("sbdump_scan_") + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void touch(const fs::path &p, const std::string &data = "") {
  std::ofstream o(p, std::ios::binary);
  o << data;
}

TEST_CASE("scan finds .sbstore files sorted by name") {
  auto d = mkd("sorted");
  touch(d / "test-phish-simple.sbstore");
  touch(d / "test-phish-simple.pset");
  touch(d / "goog-malware-shavar.sbstore");
  touch(d / "goog-malware-shavar.pset");
  touch(d / "readme.txt");
  touch(d / "goog-malware-shavar.cache");
  touch(d / ".sbstore");
  fs::create_directories(d / "dir.sbstore");

  auto lists = scan_lists(d, "");
  REQUIRE(lists.size() == 2);
  REQUIRE(lists[0].name == "goog-malware-shavar");
  REQUIRE(lists[0].store_path == d / "goog-malware-shavar.sbstore");
  REQUIRE(lists[0].prefix_set_path == d / "goog-malware-shavar.pset");
  REQUIRE(lists[1].name == "test-phish-simple");
}

TEST_CASE("scan skips a store file with an empty list name") {
  auto d = mkd("bare");
  touch(d / ".sbstore");
  touch(d / ".pset");
  REQUIRE(scan_lists(d, "").empty());
  touch(d / "x.sbstore");
  auto lists = scan_lists(d, "");
  REQUIRE(lists.size() == 1);
  REQUIRE(lists[0].name == "x");
}

TEST_CASE("scan applies the name filter") {
  auto d = mkd("filter");
  touch(d / "a.sbstore");
  touch(d / "b.sbstore");

  auto only_b = scan_lists(d, "b");
  REQUIRE(only_b.size() == 1);
  REQUIRE(only_b[0].name == "b");
  REQUIRE(scan_lists(d, "c").empty());
}

TEST_CASE("scan pairs a .pset path even when it is missing") {
  auto d = mkd("nopset");
  touch(d / "lonely.sbstore");
  auto lists = scan_lists(d, "");
  REQUIRE(lists.size() == 1);
  REQUIRE_FALSE(fs::exists(lists[0].prefix_set_path));
  REQUIRE_THROWS_AS(read_file(lists[0].prefix_set_path), std::runtime_error);
}

TEST_CASE("scan rejects a missing directory") {
  auto d = mkd("gone");
  fs::remove_all(d);
  REQUIRE_THROWS_AS(scan_lists(d, ""), std::runtime_error);
}

TEST_CASE("read_file returns the whole file") {
  auto d = mkd("read");
  std::string data("\x00\x01\xff\x7f", 4);
  touch(d / "f.bin", data);
  REQUIRE(read_file(d / "f.bin") == std::vector<uint8_t>{0x00, 0x01, 0xff, 0x7f});
  touch(d / "empty.bin");
  REQUIRE(read_file(d / "empty.bin").empty());
}
