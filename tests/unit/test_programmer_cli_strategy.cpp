#include "FakeCommandRunner.hpp"
#include "TestFixtures.hpp"
#include "board-ident/acquisition/ProgrammerCliStrategy.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace boardident;
using namespace boardident::acquisition;
using namespace boardident::test;
namespace fs = std::filesystem;

namespace {

const std::array<uint32_t, 3> WORDS = {0x00350038, 0x470D3133, 0x32333333};
const char *EXPECTED_UID = "3800350033310D4733333332";

bool any_call_contains(const FakeCommandRunner &runner,
                       const std::string &needle) {
  for (const auto &call : runner.calls()) {
    for (const auto &arg : call) {
      if (arg.find(needle) != std::string::npos)
        return true;
    }
  }
  return false;
}

} // namespace

TEST(MemoryWordParsing, CubeProgrammerFormat) {
  auto words = ProgrammerCliStrategy::parse_memory_words(
      "Reading 32-bit memory content\n"
      "  Size          : 12 Bytes\n"
      "  Address:      : 0x1FFF7A10\n\n"
      "0x1FFF7A10 : 00350038 470D3133 32333333\n",
      0x1FFF7A10);
  ASSERT_TRUE(words);
  EXPECT_EQ(*words, WORDS);
}

TEST(MemoryWordParsing, OpenOcdFormat) {
  auto words = ProgrammerCliStrategy::parse_memory_words(
      "Info : stm32f4x.cpu: hardware has 6 breakpoints\n"
      "0x1fff7a10: 00350038 470d3133 32333333 \n",
      0x1FFF7A10);
  ASSERT_TRUE(words);
  EXPECT_EQ(*words, WORDS);
}

TEST(MemoryWordParsing, JLinkFormat) {
  auto words = ProgrammerCliStrategy::parse_memory_words(
      "J-Link>mem32 0x1FFF7A10, 3\n1FFF7A10 = 00350038 470D3133 32333333 \n",
      0x1FFF7A10);
  ASSERT_TRUE(words);
  EXPECT_EQ(*words, WORDS);
}

TEST(MemoryWordParsing, WrongAddressOrTooFewWords) {
  EXPECT_FALSE(ProgrammerCliStrategy::parse_memory_words(
      "0x1FFF7590 : 00350038 470D3133 32333333\n", 0x1FFF7A10));
  EXPECT_FALSE(ProgrammerCliStrategy::parse_memory_words(
      "0x1FFF7A10 : 00350038 470D3133\n", 0x1FFF7A10));
  EXPECT_FALSE(ProgrammerCliStrategy::parse_memory_words("", 0x1FFF7A10));
}

TEST(MemoryWordParsing, WordsBecomeLittleEndianBytes) {
  EXPECT_EQ(ProgrammerCliStrategy::words_to_uid(WORDS), EXPECTED_UID);
}

class ToolLocatorTest : public TempDirTest {
protected:
  std::string make_executable(const fs::path &file) {
    write_file(file, "#!/bin/sh\nexit 0\n");
    fs::permissions(file, fs::perms::owner_all);
    return file.string();
  }
};

TEST_F(ToolLocatorTest, ConfiguredPathIsUsed) {
  auto exe = make_executable(path("bin/my-openocd"));
  ToolLocator locator({{"openocd", exe}});
  EXPECT_EQ(locator.locate(ProgrammerTool::OpenOcd), exe);
}

TEST_F(ToolLocatorTest, ToolsDirectoryIsSearched) {
  auto exe = make_executable(path("tools/JLinkExe"));
  ToolLocator locator({}, path("tools"));
  EXPECT_EQ(locator.locate(ProgrammerTool::JLink), exe);
}

TEST_F(ToolLocatorTest, NonExecutableConfiguredPathIsSkipped) {
  write_file(path("bin/openocd"), "not a program");
  fs::permissions(path("bin/openocd"),
                  fs::perms::owner_read | fs::perms::owner_write);

  ToolLocator locator({{"openocd", path("bin/openocd").string()}});
  EXPECT_NE(locator.locate(ProgrammerTool::OpenOcd),
            path("bin/openocd").string());
  EXPECT_FALSE(is_executable_file(path("bin/openocd")));
}

TEST(ToolDescriptors, OrderAndIds) {
  const auto &tools = programmer_tools();
  ASSERT_EQ(tools.size(), 3u);
  EXPECT_EQ(tools[0].id, "stm32_programmer_cli");
  EXPECT_EQ(tools[1].id, "openocd");
  EXPECT_EQ(tools[2].id, "jlink");
  EXPECT_EQ(tool_descriptor(ProgrammerTool::JLink).executable, "JLinkExe");
}

class ProgrammerCliStrategyTest : public ToolLocatorTest {
protected:
  void SetUp() override {
    ToolLocatorTest::SetUp();
    openocd_ = make_executable(path("bin/openocd"));
    probe_ = make_device("/dev/ttyACM0", 0x0483, 0x374B, "0669FF3731");
  }

  std::string openocd_;
  Device probe_;
  FakeCommandRunner runner_;
  ProgrammerConfig config_;
  UidAddressMap addresses_;
};

TEST_F(ProgrammerCliStrategyTest, ReadsUidThroughOpenOcd) {
  runner_.on("mdw 0x1FFF7A10 3", 0,
             "Info : Listening on port 3333\n"
             "0x1fff7a10: 00350038 470d3133 32333333 \n");
  runner_.on(openocd_, 0, "Info : clock speed 2000 kHz\n");

  ToolLocator locator({{"openocd", openocd_}});
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);
  EXPECT_EQ(strategy.attempt(probe_), EXPECTED_UID);
  EXPECT_TRUE(any_call_contains(runner_, "adapter serial 0669FF3731"));
}

TEST_F(ProgrammerCliStrategyTest, FailedConnectSkipsTheRead) {
  runner_.on(openocd_, 1, "Error: open failed\n");

  ToolLocator locator({{"openocd", openocd_}});
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(probe_));
  EXPECT_FALSE(any_call_contains(runner_, "mdw"));
}

TEST_F(ProgrammerCliStrategyTest, TimeoutIsAFailure) {
  runner_.on_timeout(openocd_);

  ToolLocator locator({{"openocd", openocd_}});
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(probe_));
}

TEST_F(ProgrammerCliStrategyTest, UnparsableOutputIsAFailure) {
  runner_.on(openocd_, 0, "Error: target not halted\n");

  ToolLocator locator({{"openocd", openocd_}});
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(probe_));
}

TEST_F(ProgrammerCliStrategyTest, CommandLinesPerTool) {
  ToolLocator locator;
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);

  auto cube = strategy.read_command(ProgrammerTool::CubeProgrammer, "cli",
                                    probe_, 0x1FFF7A10);
  EXPECT_EQ(cube, (std::vector<std::string>{"cli", "-c", "port=SWD",
                                            "sn=0669FF3731", "-r32",
                                            "0x1FFF7A10", "12"}));

  auto ocd = strategy.read_command(ProgrammerTool::OpenOcd, "openocd",
                                   probe_, 0x1FFF7A10);
  ASSERT_GE(ocd.size(), 4u);
  EXPECT_EQ(ocd[ocd.size() - 3], "mdw 0x1FFF7A10 3");
  EXPECT_EQ(ocd.back(), "exit");

  auto jlink =
      strategy.connect_command(ProgrammerTool::JLink, "JLinkExe", probe_);
  auto usb = std::find(jlink.begin(), jlink.end(), "-USB");
  ASSERT_NE(usb, jlink.end());
  EXPECT_EQ(*(usb + 1), "0669FF3731");
}

TEST_F(ProgrammerCliStrategyTest, AppliesToDebugProbesByDefault) {
  ToolLocator locator;
  ProgrammerCliStrategy strategy(runner_, locator, config_, addresses_);
  EXPECT_TRUE(strategy.applies_to(probe_));
  EXPECT_FALSE(strategy.applies_to(make_device("/dev/ttyACM1", 0x0483, 0x5740)));

  config_.debug_probes_only = false;
  ProgrammerCliStrategy any_stm32(runner_, locator, config_, addresses_);
  EXPECT_TRUE(any_stm32.applies_to(make_device("/dev/ttyACM1", 0x0483, 0x5740)));
  EXPECT_FALSE(any_stm32.applies_to(make_device("/dev/ttyUSB0", 0x1A86, 0x7523)));
}
