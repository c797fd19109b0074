#include "MockSerialPort.hpp"
#include "TestFixtures.hpp"
#include "board-ident/acquisition/BootloaderStrategy.hpp"

#include <gtest/gtest.h>

using namespace boardident;
using namespace boardident::acquisition;
using namespace boardident::test;
using namespace std::chrono_literals;

namespace {

const std::vector<uint8_t> UID_BYTES = {0x38, 0x00, 0x35, 0x00, 0x0D, 0x47,
                                        0x37, 0x31, 0x33, 0x33, 0x33, 0x32};

std::vector<uint8_t> bytes(std::initializer_list<uint8_t> list) {
  return std::vector<uint8_t>(list);
}

std::vector<uint8_t> with_checksum(std::vector<uint8_t> data) {
  data.push_back(BootloaderStrategy::xor_checksum(data));
  return data;
}

} // namespace

TEST(BootloaderFrames, AddressFrameIsBigEndianPlusXor) {
  auto frame = BootloaderStrategy::address_frame(0x1FFF7A10);
  EXPECT_EQ(frame, (std::vector<uint8_t>{0x1F, 0xFF, 0x7A, 0x10,
                                         0x1F ^ 0xFF ^ 0x7A ^ 0x10}));
}

TEST(BootloaderFrames, LengthFrameIsCountMinusOneWithComplement) {
  EXPECT_EQ(BootloaderStrategy::length_frame(12),
            (std::vector<uint8_t>{0x0B, 0xF4}));
}

TEST(BootloaderFrames, ConfiguredEncoding) {
  BootloaderConfig config;
  EXPECT_EQ(BootloaderStrategy::length_frame(config),
            (std::vector<uint8_t>{0x0B, 0xF4}));

  config.length_encoding = LengthEncoding::SingleByte;
  EXPECT_EQ(BootloaderStrategy::length_frame(config),
            std::vector<uint8_t>{0xBC});
}

class BootloaderStrategyTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.ack_timeout = 10ms;
    config_.read_timeout = 10ms;
    device_ = make_device("/dev/ttyACM0", 0x0483, 0x5740);
    port_ = factory_.device("/dev/ttyACM0");
  }

  void script_handshake(const std::vector<uint8_t> &payload) {
    port_->reply_to(bytes({BootloaderStrategy::SYNC}),
                    bytes({BootloaderStrategy::ACK}));
    port_->reply_to(bytes({0x11, 0xEE}), bytes({BootloaderStrategy::ACK}));
    port_->reply_to(BootloaderStrategy::address_frame(0x1FFF7A10),
                    bytes({BootloaderStrategy::ACK}));
    std::vector<uint8_t> reply = {BootloaderStrategy::ACK};
    reply.insert(reply.end(), payload.begin(), payload.end());
    port_->reply_to(BootloaderStrategy::length_frame(12), reply);
  }

  MockSerialPortFactory factory_;
  std::shared_ptr<MockSerialDevice> port_;
  BootloaderConfig config_;
  UidAddressMap addresses_;
  Device device_;
};

TEST_F(BootloaderStrategyTest, ReadsUidWithValidChecksum) {
  script_handshake(with_checksum(UID_BYTES));

  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_EQ(strategy.attempt(device_), "380035000D47373133333332");
  EXPECT_EQ(port_->writes().size(), 4u);
}

TEST_F(BootloaderStrategyTest, ChecksumMismatchFailsWithoutRetry) {
  auto payload = with_checksum(UID_BYTES);
  payload.back() ^= 0x01;
  script_handshake(payload);

  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));
  EXPECT_EQ(port_->open_count(), 1);
  EXPECT_EQ(port_->writes().size(), 4u);
}

TEST_F(BootloaderStrategyTest, NackAbortsTheSequence) {
  port_->reply_to(bytes({BootloaderStrategy::SYNC}),
                  bytes({BootloaderStrategy::ACK}));
  port_->reply_to(bytes({0x11, 0xEE}), bytes({BootloaderStrategy::NACK}));

  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));

  // nothing is sent after the rejected command
  auto writes = port_->writes();
  ASSERT_EQ(writes.size(), 2u);
  EXPECT_EQ(writes[1], (std::vector<uint8_t>{0x11, 0xEE}));
}

TEST_F(BootloaderStrategyTest, SilenceAfterSyncAborts) {
  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));
  EXPECT_EQ(port_->writes().size(), 1u);
}

TEST_F(BootloaderStrategyTest, ShortPayloadFails) {
  script_handshake(bytes({0x38, 0x00, 0x35}));
  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));
}

TEST_F(BootloaderStrategyTest, UsesPerKindAddress) {
  addresses_.per_kind[BoardKind::Stm32] = 0x1FFF7590;
  port_->reply_to(bytes({BootloaderStrategy::SYNC}),
                  bytes({BootloaderStrategy::ACK}));
  port_->reply_to(bytes({0x11, 0xEE}), bytes({BootloaderStrategy::ACK}));

  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));

  auto writes = port_->writes();
  ASSERT_EQ(writes.size(), 3u);
  EXPECT_EQ(writes[2], BootloaderStrategy::address_frame(0x1FFF7590));
}

TEST_F(BootloaderStrategyTest, OpenFailureIsAPlainMiss) {
  port_->fail_all_opens();
  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_FALSE(strategy.attempt(device_));
}

TEST_F(BootloaderStrategyTest, AppliesToStm32AndUnknownBoards) {
  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_TRUE(strategy.applies_to(device_));
  EXPECT_TRUE(strategy.applies_to(make_device("/dev/ttyUSB0", 0x1234, 0x5678)));
  EXPECT_FALSE(strategy.applies_to(make_device("/dev/ttyUSB1", 0x303A, 0x1001)));
}

TEST_F(BootloaderStrategyTest, SingleByteLengthEncoding) {
  config_.length_encoding = LengthEncoding::SingleByte;
  port_->reply_to(bytes({BootloaderStrategy::SYNC}),
                  bytes({BootloaderStrategy::ACK}));
  port_->reply_to(bytes({0x11, 0xEE}), bytes({BootloaderStrategy::ACK}));
  port_->reply_to(BootloaderStrategy::address_frame(0x1FFF7A10),
                  bytes({BootloaderStrategy::ACK}));
  std::vector<uint8_t> reply = with_checksum(UID_BYTES);
  reply.insert(reply.begin(), BootloaderStrategy::ACK);
  port_->reply_to(bytes({0xBC}), reply);

  BootloaderStrategy strategy(factory_, config_, addresses_);
  EXPECT_EQ(strategy.attempt(device_), "380035000D47373133333332");

  auto writes = port_->writes();
  ASSERT_EQ(writes.size(), 4u);
  EXPECT_EQ(writes[0], bytes({0x7F}));
  EXPECT_EQ(writes[1], bytes({0x11, 0xEE}));
  EXPECT_EQ(writes[2], bytes({0x1F, 0xFF, 0x7A, 0x10, 0x1F ^ 0xFF ^ 0x7A ^ 0x10}));
  EXPECT_EQ(writes[3], bytes({0xBC}));
}
