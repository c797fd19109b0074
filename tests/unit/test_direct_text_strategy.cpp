#include "MockSerialPort.hpp"
#include "TestFixtures.hpp"
#include "board-ident/acquisition/DirectTextStrategy.hpp"

#include <gtest/gtest.h>

using namespace boardident;
using namespace boardident::acquisition;
using namespace boardident::test;
using namespace std::chrono_literals;

TEST(DirectTextParsing, ExtractsAndNormalisesUid) {
  EXPECT_EQ(DirectTextStrategy::parse_uid_response(
                "UID: 0x0034001C3137470D32333333\r\n"),
            "0034001C3137470D32333333");
  EXPECT_EQ(DirectTextStrategy::parse_uid_response(
                "boot ok\nUID:00-34-00-1c-31-37-47-0d-32-33-33-33 rev B\n"),
            "0034001C3137470D32333333");
  EXPECT_EQ(DirectTextStrategy::parse_uid_response(
                "UID: 00:34:00:1C:31:37:47:0D:32:33:33:33"),
            "0034001C3137470D32333333");
}

TEST(DirectTextParsing, RejectsShortOrNonHexValues) {
  EXPECT_FALSE(DirectTextStrategy::parse_uid_response("UID: DEADBEEF\n"));
  EXPECT_FALSE(DirectTextStrategy::parse_uid_response(
      "UID: 0034001C3137470D3233333G\n"));
  EXPECT_FALSE(DirectTextStrategy::parse_uid_response("UID:\n"));
  EXPECT_FALSE(DirectTextStrategy::parse_uid_response("no identity here\n"));
}

TEST(DirectTextParsing, OnlyFirstUidLineCounts) {
  EXPECT_FALSE(DirectTextStrategy::parse_uid_response(
      "UID: short\nUID: 0034001C3137470D32333333\n"));
}

class DirectTextStrategyTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.retry_delay = 1ms;
    config_.read_window = 50ms;
    device_ = make_device("/dev/ttyACM0", 0x0483, 0x5740);
  }

  MockSerialPortFactory factory_;
  DirectTextConfig config_;
  Device device_;
};

TEST_F(DirectTextStrategyTest, WritesCommandAndReadsUid) {
  auto port = factory_.device("/dev/ttyACM0");
  port->reply_to("I", "FW 1.4\r\nUID: 0034001C3137470D32333333\r\n");

  DirectTextStrategy strategy(factory_, config_);
  EXPECT_EQ(strategy.attempt(device_), "0034001C3137470D32333333");

  auto writes = port->writes();
  ASSERT_EQ(writes.size(), 1u);
  EXPECT_EQ(writes[0], std::vector<uint8_t>{'I'});
  EXPECT_EQ(port->opened_bauds(), std::vector<uint32_t>{115200});
}

TEST_F(DirectTextStrategyTest, SimplifiedFirmwareCommand) {
  config_.command = 'i';
  factory_.device("/dev/ttyACM0")
      ->reply_to("i", "UID: 0034001C3137470D32333333\n");

  DirectTextStrategy strategy(factory_, config_);
  EXPECT_TRUE(strategy.attempt(device_));
}

TEST_F(DirectTextStrategyTest, RetriesTransientOpenFailures) {
  auto port = factory_.device("/dev/ttyACM0");
  port->reply_to("I", "UID: 0034001C3137470D32333333\n");
  port->fail_next_opens(4);

  DirectTextStrategy strategy(factory_, config_);
  EXPECT_EQ(strategy.attempt(device_), "0034001C3137470D32333333");
  EXPECT_EQ(port->open_count(), 1);
}

TEST_F(DirectTextStrategyTest, GivesUpAfterMaxAttempts) {
  auto port = factory_.device("/dev/ttyACM0");
  port->reply_to("I", "UID: 0034001C3137470D32333333\n");
  port->fail_next_opens(5);

  DirectTextStrategy strategy(factory_, config_);
  EXPECT_FALSE(strategy.attempt(device_));
  EXPECT_EQ(port->open_count(), 0);
}

TEST_F(DirectTextStrategyTest, SilentFirmwareIsNotRetried) {
  auto port = factory_.device("/dev/ttyACM0");

  DirectTextStrategy strategy(factory_, config_);
  EXPECT_FALSE(strategy.attempt(device_));
  EXPECT_EQ(port->open_count(), 1);
}

TEST_F(DirectTextStrategyTest, DisabledStrategyDoesNotApply) {
  config_.enabled = false;
  DirectTextStrategy strategy(factory_, config_);
  EXPECT_FALSE(strategy.applies_to(device_));
}
