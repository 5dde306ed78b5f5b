/**
 * @file ProcessTable_uTest.cpp
 * @brief Unit tests for the procfs-backed process table.
 *
 * Notes:
 *  - Builds a fake procfs tree under the temp directory; fd entries are
 *    dangling symlinks whose text names the device node.
 */

#include "src/system/inc/ProcessTable.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using rebind::system::parseStartTicks;
using rebind::system::ProcfsProcessTable;

namespace {

/// starttime = 5000 ticks, comm with spaces and parens.
constexpr const char* STAT_TEXT =
    "4242 (my (odd) app) S 1 4242 4242 0 -1 4194560 100 0 0 0 10 5 0 0 20 0 1 0 5000 "
    "1000000 200 18446744073709551615 0 0 0 0 0 0 0 0 0 0 0 0 17 3 0 0 0 0 0\n";

void writeFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

} // namespace

/* ----------------------------- Fixture ----------------------------- */

class ProcessTableTest : public ::testing::Test {
protected:
  static inline fs::path root_;

  static void SetUpTestSuite() {
    root_ = fs::temp_directory_path() / ("rebind_proc_" + std::to_string(::getpid()));
    fs::remove_all(root_);

    addProcess(100, "python3", {"python3", "train.py"}, {"/dev/nvidia0", "/dev/null"});
    addProcess(200, "Xorg", {"/usr/lib/xorg/Xorg", ":0"}, {"/dev/dri/card0"});
    addProcess(300, "gpu-reset", {"gpu-reset"}, {"/dev/nvidia0"});
    addProcess(400, "watch", {"watch", "-n", "1", "nvidia-smi"}, {});
    fs::create_directories(root_ / "self");
    writeFile(root_ / "uptime", "6000.50 12000.00\n");
    writeFile(root_ / "100" / "stat", STAT_TEXT);
  }

  static void TearDownTestSuite() { fs::remove_all(root_); }

  static void addProcess(int pid, const std::string& comm, const std::vector<std::string>& args,
                         const std::vector<std::string>& fds) {
    const fs::path DIR = root_ / std::to_string(pid);
    fs::create_directories(DIR / "fd");
    writeFile(DIR / "comm", comm + "\n");
    std::string cmdline;
    for (const std::string& arg : args) {
      cmdline += arg;
      cmdline.push_back('\0');
    }
    writeFile(DIR / "cmdline", cmdline);
    int fd = 3;
    for (const std::string& target : fds) {
      fs::create_symlink(target, DIR / "fd" / std::to_string(fd++));
    }
  }

  /// Table that treats pid 300 as itself.
  ProcfsProcessTable table() const { return ProcfsProcessTable(root_.string(), 300); }
};

/* ----------------------------- Names ----------------------------- */

/** @test comm is read and trimmed. */
TEST_F(ProcessTableTest, CommandName) {
  auto t = table();
  EXPECT_EQ(t.commandName(100).value_or(""), "python3");
  EXPECT_EQ(t.commandName(200).value_or(""), "Xorg");
  EXPECT_FALSE(t.commandName(999).has_value());
}

/** @test cmdline NULs become spaces; the trailing NUL is dropped. */
TEST_F(ProcessTableTest, CommandLine) {
  auto t = table();
  EXPECT_EQ(t.commandLine(100).value_or(""), "python3 train.py");
  EXPECT_EQ(t.commandLine(400).value_or(""), "watch -n 1 nvidia-smi");
  EXPECT_FALSE(t.commandLine(999).has_value());
}

/* ----------------------------- Holders ----------------------------- */

/** @test Holders of a node exclude the calling process. */
TEST_F(ProcessTableTest, HoldersExcludeSelf) {
  auto t = table();
  const auto PIDS = t.holders("/dev/nvidia0");
  ASSERT_TRUE(PIDS.has_value());
  ASSERT_EQ(PIDS->size(), 1U);
  EXPECT_EQ((*PIDS)[0], 100);
}

/** @test DRM card holders are found by link text. */
TEST_F(ProcessTableTest, HoldersOfDrmCard) {
  auto t = table();
  const auto PIDS = t.holders("/dev/dri/card0");
  ASSERT_TRUE(PIDS.has_value());
  ASSERT_EQ(PIDS->size(), 1U);
  EXPECT_EQ((*PIDS)[0], 200);
  const auto NONE = t.holders("/dev/nvidia-uvm");
  ASSERT_TRUE(NONE.has_value());
  EXPECT_TRUE(NONE->empty());
}

/** @test An unreadable proc root is a failure, not an empty holder list. */
TEST_F(ProcessTableTest, HoldersFailWithoutProcRoot) {
  ProcfsProcessTable t((root_ / "missing").string(), 300);
  EXPECT_FALSE(t.listPids().has_value());
  EXPECT_FALSE(t.holders("/dev/nvidia0").has_value());
  EXPECT_TRUE(t.matchCommandLine("nvidia-smi").empty());
}

/** @test Non-numeric directories are not processes. */
TEST_F(ProcessTableTest, ListPidsSkipsNonNumeric) {
  const auto PIDS = table().listPids();
  ASSERT_TRUE(PIDS.has_value());
  EXPECT_EQ(*PIDS, (std::vector<pid_t>{100, 200, 300, 400}));
}

/* ----------------------------- Pattern Match ----------------------------- */

/** @test Watcher pattern matches by regex search over the command line. */
TEST_F(ProcessTableTest, MatchCommandLine) {
  auto t = table();
  const std::vector<pid_t> PIDS = t.matchCommandLine("watch.*nvidia-smi");
  ASSERT_EQ(PIDS.size(), 1U);
  EXPECT_EQ(PIDS[0], 400);
}

/** @test Self is never matched. */
TEST_F(ProcessTableTest, MatchCommandLineExcludesSelf) {
  auto t = table();
  const std::vector<pid_t> PIDS = t.matchCommandLine("gpu-reset");
  EXPECT_TRUE(PIDS.empty());
}

/** @test Invalid patterns match nothing. */
TEST_F(ProcessTableTest, MatchCommandLineInvalidPattern) {
  EXPECT_TRUE(table().matchCommandLine("(").empty());
}

/** @test kill refuses self and non-positive pids. */
TEST_F(ProcessTableTest, KillRefusesSelf) {
  auto t = table();
  EXPECT_FALSE(t.kill(300));
  EXPECT_FALSE(t.kill(0));
  EXPECT_FALSE(t.kill(-1));
}

/* ----------------------------- Elapsed ----------------------------- */

/** @test starttime is read after the last ')'. */
TEST(ProcessTableParseTest, StartTicks) {
  EXPECT_EQ(parseStartTicks(STAT_TEXT).value_or(0), 5000U);
  EXPECT_FALSE(parseStartTicks("garbage").has_value());
  EXPECT_FALSE(parseStartTicks("1 (x) S 1 2").has_value());
}

/** @test Elapsed time is uptime minus start time. */
TEST_F(ProcessTableTest, ElapsedSeconds) {
  const long HZ = ::sysconf(_SC_CLK_TCK);
  ASSERT_GT(HZ, 0);
  const auto ELAPSED = table().elapsedSeconds(100);
  ASSERT_TRUE(ELAPSED.has_value());
  const double EXPECTED = 6000.50 - 5000.0 / static_cast<double>(HZ);
  EXPECT_EQ(*ELAPSED, static_cast<std::uint64_t>(EXPECTED));
  EXPECT_FALSE(table().elapsedSeconds(200).has_value());
}
