/**
 * @file Helpers_uTest.cpp
 * @brief Unit tests for vigil::helpers (files, strings, format, logging).
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace files = vigil::helpers::files;
namespace strings = vigil::helpers::strings;
namespace format = vigil::helpers::format;
namespace logging = vigil::helpers::logging;

class FilesTest : public ::testing::Test {
protected:
  std::string dir_{};

  void SetUp() override {
    char tmpl[] = "/tmp/vigil_helpers_XXXXXX";
    const char* made = ::mkdtemp(tmpl);
    ASSERT_NE(made, nullptr);
    dir_ = made;
  }

  void TearDown() override {
    const std::string CMD = "rm -rf '" + dir_ + "'";
    EXPECT_EQ(std::system(CMD.c_str()), 0);
  }

  std::string write(const std::string& name, const std::string& body) const {
    const std::string PATH = dir_ + "/" + name;
    std::ofstream(PATH) << body;
    return PATH;
  }
};

/* ----------------------------- Files ----------------------------- */

/** @test joinPath yields exactly one separator. */
TEST(JoinPathTest, SingleSeparator) {
  EXPECT_EQ(files::joinPath("/proc", "meminfo"), "/proc/meminfo");
  EXPECT_EQ(files::joinPath("/host/proc/", "/meminfo"), "/host/proc/meminfo");
  EXPECT_EQ(files::joinPath("/", "/data"), "/data");
  EXPECT_EQ(files::joinPath("/host", ""), "/host");
}

/** @test readFileUint64 parses and falls back to the default. */
TEST_F(FilesTest, ReadUint64) {
  const std::string GOOD = write("n", "12345\n");
  const std::string BAD = write("bad", "abc\n");
  EXPECT_EQ(files::readFileUint64(GOOD.c_str()), 12345U);
  EXPECT_EQ(files::readFileUint64(BAD.c_str(), 7), 7U);
  EXPECT_EQ(files::readFileUint64((dir_ + "/missing").c_str(), 9), 9U);
}

/** @test readTextFile returns whole contents or nullopt. */
TEST_F(FilesTest, ReadTextFile) {
  const std::string PATH = write("t", "line1\nline2\n");
  const auto TEXT = files::readTextFile(PATH);
  ASSERT_TRUE(TEXT.has_value());
  EXPECT_EQ(*TEXT, "line1\nline2\n");
  EXPECT_FALSE(files::readTextFile(dir_ + "/missing").has_value());
}

/** @test procfs files (reported size 0) are read completely. */
TEST(ReadProcTest, ProcStatNonEmpty) {
  const auto TEXT = files::readTextFile("/proc/stat");
  ASSERT_TRUE(TEXT.has_value());
  EXPECT_TRUE(strings::startsWith(*TEXT, "cpu "));
}

/** @test Directory predicates. */
TEST_F(FilesTest, PathPredicates) {
  EXPECT_TRUE(files::isDirectory(dir_.c_str()));
  const std::string F = write("f", "x");
  EXPECT_FALSE(files::isDirectory(F.c_str()));
  EXPECT_FALSE(files::isDirectory(nullptr));
}

/* ----------------------------- Strings ----------------------------- */

/** @test forEachLine visits every line including the last unterminated one. */
TEST(StringsTest, ForEachLine) {
  int count = 0;
  std::string last;
  strings::forEachLine("a\nb\nc", [&](std::string_view line) {
    ++count;
    last = std::string(line);
  });
  EXPECT_EQ(count, 3);
  EXPECT_EQ(last, "c");
}

/** @test Numeric parsers reject trailing garbage. */
TEST(StringsTest, ParseNumbers) {
  std::uint64_t u = 0;
  double d = 0.0;
  EXPECT_TRUE(strings::parseUint64("42", u));
  EXPECT_EQ(u, 42U);
  EXPECT_FALSE(strings::parseUint64("42x", u));
  EXPECT_FALSE(strings::parseUint64("", u));
  EXPECT_TRUE(strings::parseDouble("0.75", d));
  EXPECT_DOUBLE_EQ(d, 0.75);
  EXPECT_FALSE(strings::parseDouble("nope", d));
}

/** @test Kernel octal escapes are decoded. */
TEST(StringsTest, UnescapeOctal) {
  EXPECT_EQ(strings::unescapeOctal("/mnt/my\\040disk"), "/mnt/my disk");
  EXPECT_EQ(strings::unescapeOctal("/plain"), "/plain");
  EXPECT_EQ(strings::unescapeOctal("trailing\\04"), "trailing\\04");
}

/** @test trim and toLower. */
TEST(StringsTest, TrimLower) {
  EXPECT_EQ(strings::trim("  x y \r\n"), "x y");
  EXPECT_EQ(strings::toLower("SQLite"), "sqlite");
}

/* ----------------------------- Format ----------------------------- */

/** @test Binary units. */
TEST(FormatTest, BytesBinary) {
  EXPECT_EQ(format::bytesBinary(0), "0 B");
  EXPECT_EQ(format::bytesBinary(512), "512 B");
  EXPECT_EQ(format::bytesBinary(1536), "1.5 KiB");
  EXPECT_EQ(format::bytesBinary(3ULL << 30), "3.0 GiB");
}

/** @test Durations pick a readable unit. */
TEST(FormatTest, Duration) {
  using std::chrono::milliseconds;
  EXPECT_EQ(format::duration(milliseconds(250)), "250ms");
  EXPECT_EQ(format::duration(milliseconds(1500)), "1.5s");
  EXPECT_EQ(format::duration(milliseconds(300'000)), "5m");
}

/* ----------------------------- Clock ----------------------------- */

/** @test Unix milliseconds convert both ways; wallNow is after 2020. */
TEST(ClockTest, WallTimeConversions) {
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(vigil::helpers::clock::fromUnixMillis(1234)), 1234);
  EXPECT_GT(vigil::helpers::clock::toUnixMillis(vigil::helpers::clock::wallNow()),
            1'577'836'800'000);
}

/* ----------------------------- Logging ----------------------------- */

/** @test Level names map to spdlog levels. */
TEST(LoggingTest, ParseLevel) {
  spdlog::level::level_enum lvl = spdlog::level::info;
  EXPECT_TRUE(logging::parseLevel("debug", lvl));
  EXPECT_EQ(lvl, spdlog::level::debug);
  EXPECT_TRUE(logging::parseLevel("warn", lvl));
  EXPECT_EQ(lvl, spdlog::level::warn);
  EXPECT_FALSE(logging::parseLevel("loud", lvl));
}

/** @test get() returns one shared logger per name without prior init. */
TEST(LoggingTest, GetIsStable) {
  const auto A = logging::get("helpers-test");
  const auto B = logging::get("helpers-test");
  ASSERT_NE(A, nullptr);
  EXPECT_EQ(A, B);
  EXPECT_EQ(A->name(), "helpers-test");
}

/** @test init() rejects an unknown level and accepts a file sink. */
TEST_F(FilesTest, InitWithFileSink) {
  std::string err;
  logging::LogSettings bad{};
  bad.level = "shout";
  EXPECT_FALSE(logging::init(bad, err));
  EXPECT_FALSE(err.empty());

  logging::LogSettings good{};
  good.level = "debug";
  good.file = dir_ + "/vigil.log";
  ASSERT_TRUE(logging::init(good, err)) << err;
  logging::get("helpers-file")->info("event=test_line");
  logging::get("helpers-file")->flush();
  EXPECT_EQ(::access(good.file.c_str(), F_OK), 0);

  logging::LogSettings plain{};
  EXPECT_TRUE(logging::init(plain, err)) << err;
}
