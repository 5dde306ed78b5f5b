/**
 * @file GpuTarget_uTest.cpp
 * @brief Unit tests for target resolution against a fake sysfs/procfs/dev tree.
 */

#include "src/gpu/inc/GpuTarget.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using rebind::gpu::computeDeviceNodes;
using rebind::gpu::drmCardsForDriver;
using rebind::gpu::GpuTarget;
using rebind::gpu::listNvidiaGpus;
using rebind::gpu::normalizeBdf;
using rebind::gpu::probeDeviceSurface;
using rebind::gpu::readDeviceMinor;
using rebind::gpu::resolveTarget;
using rebind::gpu::SysPaths;
using rebind::gpu::TargetSelector;

namespace {

void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
}

void addPciDevice(const fs::path& sys, const std::string& bdf, const std::string& vendor,
                  const std::string& cls) {
  const fs::path DIR = sys / "bus/pci/devices" / bdf;
  writeFile(DIR / "vendor", vendor + "\n");
  writeFile(DIR / "class", cls + "\n");
}

void addDrmCard(const fs::path& sys, const std::string& card, const std::string& driver) {
  const fs::path DEVICE = sys / "class/drm" / card / "device";
  fs::create_directories(DEVICE);
  fs::create_symlink("../../../../bus/pci/drivers/" + driver, DEVICE / "driver");
}

} // namespace

/* ----------------------------- normalizeBdf ----------------------------- */

/** @test Domain is added or shortened; case is folded. */
TEST(GpuTargetBdfTest, Normalizes) {
  EXPECT_EQ(normalizeBdf("65:00.0").value_or(""), "0000:65:00.0");
  EXPECT_EQ(normalizeBdf("0000:65:00.0").value_or(""), "0000:65:00.0");
  EXPECT_EQ(normalizeBdf("00000000:65:00.0").value_or(""), "0000:65:00.0");
  EXPECT_EQ(normalizeBdf(" 0000:B3:00.0\n").value_or(""), "0000:b3:00.0");
}

/** @test Non-BDF text is rejected. */
TEST(GpuTargetBdfTest, Rejects) {
  EXPECT_FALSE(normalizeBdf("").has_value());
  EXPECT_FALSE(normalizeBdf("gpu0").has_value());
  EXPECT_FALSE(normalizeBdf("0000:zz:00.0").has_value());
  EXPECT_FALSE(normalizeBdf("0000-65-00.0").has_value());
}

/* ----------------------------- Fixture ----------------------------- */

class GpuTargetTest : public ::testing::Test {
protected:
  static inline fs::path root_;
  static inline SysPaths paths_;

  static void SetUpTestSuite() {
    root_ = fs::temp_directory_path() / ("rebind_gpu_target_" + std::to_string(::getpid()));
    fs::remove_all(root_);
    const fs::path SYS = root_ / "sys";
    const fs::path PROC = root_ / "proc";
    const fs::path DEV = root_ / "dev";

    addPciDevice(SYS, "0000:b3:00.0", "0x10de", "0x030200"); // 3D controller
    addPciDevice(SYS, "0000:65:00.0", "0x10de", "0x030000"); // VGA
    addPciDevice(SYS, "0000:65:00.1", "0x10de", "0x040300"); // HDMI audio
    addPciDevice(SYS, "0000:00:02.0", "0x8086", "0x030000"); // iGPU

    addDrmCard(SYS, "card0", "i915");
    addDrmCard(SYS, "card1", "nvidia");
    fs::create_directories(SYS / "class/drm/card1-HDMI-A-1");

    writeFile(PROC / "driver/nvidia/gpus/0000:65:00.0/information",
              "Model: \t\t NVIDIA RTX A4000\nIRQ:   \t\t 150\nDevice Minor: \t 0\n");
    writeFile(PROC / "driver/nvidia/gpus/0000:b3:00.0/information",
              "Model: \t\t NVIDIA A100\nDevice Minor: \t 1\n");

    for (const char* node : {"nvidia0", "nvidia1", "nvidiactl", "nvidia-uvm", "nvidia-modeset"}) {
      writeFile(DEV / node, "");
    }

    paths_.sys = SYS.string();
    paths_.proc = PROC.string();
    paths_.dev = DEV.string();
  }

  static void TearDownTestSuite() { fs::remove_all(root_); }
};

/* ----------------------------- Discovery ----------------------------- */

/** @test Only NVIDIA display-class functions, sorted by BDF. */
TEST_F(GpuTargetTest, ListsNvidiaGpus) {
  const std::vector<std::string> GPUS = listNvidiaGpus(paths_);
  ASSERT_EQ(GPUS.size(), 2U);
  EXPECT_EQ(GPUS[0], "0000:65:00.0");
  EXPECT_EQ(GPUS[1], "0000:b3:00.0");
}

/** @test Device minor comes from the driver's information file. */
TEST_F(GpuTargetTest, ReadsDeviceMinor) {
  EXPECT_EQ(readDeviceMinor("0000:65:00.0", paths_).value_or(-1), 0);
  EXPECT_EQ(readDeviceMinor("0000:b3:00.0", paths_).value_or(-1), 1);
  EXPECT_FALSE(readDeviceMinor("0000:01:00.0", paths_).has_value());
}

/* ----------------------------- Resolution ----------------------------- */

/** @test No selector picks index 0. */
TEST_F(GpuTargetTest, DefaultsToFirstGpu) {
  const auto T = resolveTarget(TargetSelector{}, paths_);
  ASSERT_TRUE(T.has_value());
  EXPECT_EQ(T->deviceIndex, 0);
  EXPECT_EQ(T->pciBdf, "0000:65:00.0");
  EXPECT_EQ(T->deviceMinor.value_or(-1), 0);
}

/** @test A BDF wins over an index. */
TEST_F(GpuTargetTest, BdfWinsOverIndex) {
  TargetSelector sel;
  sel.deviceIndex = 0;
  sel.pciBdf = "b3:00.0";
  const auto T = resolveTarget(sel, paths_);
  ASSERT_TRUE(T.has_value());
  EXPECT_EQ(T->deviceIndex, 1);
  EXPECT_EQ(T->pciBdf, "0000:b3:00.0");
  EXPECT_EQ(T->deviceMinor.value_or(-1), 1);
  EXPECT_NE(T->toString().find("minor=1"), std::string::npos);
}

/** @test Unknown devices do not resolve. */
TEST_F(GpuTargetTest, MissingTarget) {
  TargetSelector byIndex;
  byIndex.deviceIndex = 5;
  EXPECT_FALSE(resolveTarget(byIndex, paths_).has_value());

  TargetSelector byBdf;
  byBdf.pciBdf = "0000:00:02.0";
  EXPECT_FALSE(resolveTarget(byBdf, paths_).has_value());

  TargetSelector garbage;
  garbage.pciBdf = "not-a-bdf";
  EXPECT_FALSE(resolveTarget(garbage, paths_).has_value());
}

/* ----------------------------- Device Surface ----------------------------- */

/** @test Per-GPU node plus the shared nodes that exist. */
TEST_F(GpuTargetTest, ComputeNodesWithMinor) {
  GpuTarget target;
  target.deviceIndex = 1;
  target.pciBdf = "0000:b3:00.0";
  target.deviceMinor = 1;
  const std::vector<std::string> NODES = computeDeviceNodes(target, paths_);
  const std::vector<std::string> EXPECTED = {paths_.dev + "/nvidia1", paths_.dev + "/nvidiactl",
                                             paths_.dev + "/nvidia-uvm"};
  EXPECT_EQ(NODES, EXPECTED);
}

/** @test Unknown minor falls back to every numbered node. */
TEST_F(GpuTargetTest, ComputeNodesWithoutMinor) {
  GpuTarget target;
  target.deviceIndex = 0;
  target.pciBdf = "0000:65:00.0";
  const std::vector<std::string> NODES = computeDeviceNodes(target, paths_);
  ASSERT_EQ(NODES.size(), 4U);
  EXPECT_EQ(NODES[0], paths_.dev + "/nvidia0");
  EXPECT_EQ(NODES[1], paths_.dev + "/nvidia1");
}

/** @test DRM cards are selected by their bound driver; connectors are skipped. */
TEST_F(GpuTargetTest, DrmCardsForDriver) {
  const std::vector<std::string> CARDS = drmCardsForDriver("nvidia", paths_);
  ASSERT_EQ(CARDS.size(), 1U);
  EXPECT_EQ(CARDS[0], paths_.dev + "/dri/card1");
  EXPECT_TRUE(drmCardsForDriver("nouveau", paths_).empty());
}

/** @test The surface combines both node sets. */
TEST_F(GpuTargetTest, ProbeSurface) {
  const auto T = resolveTarget(TargetSelector{}, paths_);
  ASSERT_TRUE(T.has_value());
  const auto SURFACE = probeDeviceSurface(*T, paths_);
  EXPECT_EQ(SURFACE.drmCards.size(), 1U);
  ASSERT_FALSE(SURFACE.computeNodes.empty());
  EXPECT_EQ(SURFACE.computeNodes.front(), paths_.dev + "/nvidia0");
}

/** @test Empty roots produce empty results rather than errors. */
TEST(GpuTargetEmptyTest, EmptyRoots) {
  SysPaths nowhere;
  nowhere.sys = "/nonexistent/sys";
  nowhere.proc = "/nonexistent/proc";
  nowhere.dev = "/nonexistent/dev";
  EXPECT_TRUE(listNvidiaGpus(nowhere).empty());
  EXPECT_FALSE(resolveTarget(TargetSelector{}, nowhere).has_value());
}
