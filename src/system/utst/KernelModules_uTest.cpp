/**
 * @file KernelModules_uTest.cpp
 * @brief Unit tests for rebind::system kernel module inventory.
 */

#include "src/system/inc/KernelModules.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using rebind::system::getLoadedModules;
using rebind::system::LoadedModule;
using rebind::system::ModprobeBinder;
using rebind::system::normalizeModuleName;
using rebind::system::parseProcModules;

namespace {

constexpr const char* SAMPLE =
    "nvidia_uvm 1531904 0 - Live 0x0000000000000000 (POE)\n"
    "nvidia_drm 110592 4 - Live 0x0000000000000000 (POE)\n"
    "nvidia_modeset 1343488 6 nvidia_drm, Live 0x0000000000000000 (POE)\n"
    "nvidia 56442880 1639 nvidia_uvm,nvidia_modeset, Live 0x0000000000000000 (POE)\n"
    "garbage\n"
    "video 73728 1 nvidia_modeset, Live 0x0000000000000000\n";

} // namespace

/* ----------------------------- Parsing ----------------------------- */

/** @test Well-formed lines parse; malformed lines are skipped. */
TEST(KernelModulesTest, ParsesProcModules) {
  const auto MODS = parseProcModules(SAMPLE);
  ASSERT_EQ(MODS.size(), 5U);
  EXPECT_EQ(MODS[0].name, "nvidia_uvm");
  EXPECT_EQ(MODS[0].useCount, 0);
  EXPECT_TRUE(MODS[0].holders.empty());
  EXPECT_EQ(MODS[3].name, "nvidia");
  EXPECT_EQ(MODS[3].sizeBytes, 56442880U);
  ASSERT_EQ(MODS[3].holders.size(), 2U);
  EXPECT_EQ(MODS[3].holders[0], "nvidia_uvm");
  EXPECT_EQ(MODS[3].holders[1], "nvidia_modeset");
  EXPECT_EQ(MODS[3].state, "Live");
}

/** @test Summary line names the module and its holders. */
TEST(KernelModulesTest, ToStringIncludesHolders) {
  const auto MODS = parseProcModules(SAMPLE);
  ASSERT_GE(MODS.size(), 3U);
  const std::string S = MODS[2].toString();
  EXPECT_NE(S.find("nvidia_modeset"), std::string::npos);
  EXPECT_NE(S.find("holders=[nvidia_drm]"), std::string::npos);
}

/** @test Hyphens become underscores. */
TEST(KernelModulesTest, NormalizeName) {
  EXPECT_EQ(normalizeModuleName("nvidia-drm"), "nvidia_drm");
  EXPECT_EQ(normalizeModuleName("nvidia"), "nvidia");
}

/** @test Unreadable file yields an empty list. */
TEST(KernelModulesTest, MissingFileIsEmpty) {
  EXPECT_TRUE(getLoadedModules("/nonexistent/modules").empty());
}

/* ----------------------------- ModprobeBinder ----------------------------- */

/** @test isBound reads the module list it was given. */
TEST(KernelModulesTest, BinderIsBoundFromFile) {
  const fs::path PATH =
      fs::temp_directory_path() / ("rebind_modules_" + std::to_string(::getpid()));
  {
    std::ofstream out(PATH);
    out << SAMPLE;
  }
  ModprobeBinder binder(PATH.string());
  EXPECT_TRUE(binder.isBound("nvidia_drm"));
  EXPECT_TRUE(binder.isBound("nvidia-drm"));
  EXPECT_FALSE(binder.isBound("nouveau"));
  fs::remove(PATH);
}
