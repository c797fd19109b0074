#include "TestFixtures.hpp"
#include "board-ident/acquisition/UidAcquisitionChain.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace boardident;
using namespace boardident::acquisition;
using namespace boardident::test;

namespace {

class StubStrategy : public UidStrategy {
public:
  StubStrategy(UidSource kind, std::vector<std::string> *log)
      : kind_(kind), log_(log) {}

  UidSource kind() const override { return kind_; }
  std::string name() const override { return to_string(kind_); }
  bool applies_to(const Device &) const override { return applies; }

  std::optional<std::string> attempt(const Device &) override {
    log_->push_back(name());
    ++attempts;
    if (throws)
      throw std::runtime_error("port vanished");
    if (attempts > fail_first)
      return uid;
    return std::nullopt;
  }

  bool applies{true};
  bool throws{false};
  int fail_first{0};
  int attempts{0};
  std::optional<std::string> uid;

private:
  UidSource kind_;
  std::vector<std::string> *log_;
};

class StubFlasher : public FirmwareFlasher {
public:
  bool flash(const Device &, const std::string &image) override {
    images.push_back(image);
    return result;
  }

  bool result{true};
  std::vector<std::string> images;
};

} // namespace

class UidAcquisitionChainTest : public ::testing::Test {
protected:
  void SetUp() override {
    device_ = make_device("/dev/ttyACM0", 0x0483, 0x5740);
    auto direct = std::make_unique<StubStrategy>(UidSource::DirectText, &log_);
    auto boot = std::make_unique<StubStrategy>(UidSource::Bootloader, &log_);
    auto cli = std::make_unique<StubStrategy>(UidSource::ProgrammerCli, &log_);
    direct_ = direct.get();
    boot_ = boot.get();
    cli_ = cli.get();
    chain_.add_strategy(std::move(direct));
    chain_.add_strategy(std::move(boot));
    chain_.add_strategy(std::move(cli));
  }

  Device device_;
  UidAcquisitionChain chain_;
  std::vector<std::string> log_;
  StubStrategy *direct_{nullptr};
  StubStrategy *boot_{nullptr};
  StubStrategy *cli_{nullptr};
};

TEST_F(UidAcquisitionChainTest, FirstSuccessWins) {
  boot_->uid = "AAAA";
  cli_->uid = "BBBB";

  auto result = chain_.acquire(device_);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->uid, "AAAA");
  EXPECT_EQ(result->source, UidSource::Bootloader);
  EXPECT_EQ(log_, (std::vector<std::string>{to_string(UidSource::DirectText),
                                            to_string(UidSource::Bootloader)}));
  EXPECT_EQ(cli_->attempts, 0);
}

TEST_F(UidAcquisitionChainTest, AllFailing) {
  EXPECT_FALSE(chain_.acquire(device_));
  EXPECT_EQ(log_.size(), 3u);
}

TEST_F(UidAcquisitionChainTest, NonApplicableStrategiesAreSkipped) {
  direct_->applies = false;
  direct_->uid = "AAAA";
  cli_->uid = "BBBB";

  auto result = chain_.acquire(device_);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->source, UidSource::ProgrammerCli);
  EXPECT_EQ(direct_->attempts, 0);
}

TEST_F(UidAcquisitionChainTest, ThrowingStrategyCountsAsFailure) {
  direct_->throws = true;
  boot_->uid = "AAAA";

  auto result = chain_.acquire(device_);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->source, UidSource::Bootloader);
}

TEST_F(UidAcquisitionChainTest, EmptyUidIsNotASuccess) {
  direct_->uid = "";
  cli_->uid = "CCCC";

  auto result = chain_.acquire(device_);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->uid, "CCCC");
}

TEST_F(UidAcquisitionChainTest, ProvisioningFlashesThenAsksFirmware) {
  direct_->uid = "0034001C3137470D32333333";
  direct_->fail_first = 1;
  StubFlasher flasher;

  auto result =
      chain_.acquire_with_provisioning(device_, &flasher, "uid_reporter.bin");
  ASSERT_TRUE(result);
  EXPECT_EQ(result->source, UidSource::DirectText);
  EXPECT_EQ(flasher.images, std::vector<std::string>{"uid_reporter.bin"});
  EXPECT_EQ(direct_->attempts, 2);
  EXPECT_EQ(boot_->attempts, 1);
}

TEST_F(UidAcquisitionChainTest, ProvisioningSkippedWhenUidKnown) {
  boot_->uid = "AAAA";
  StubFlasher flasher;

  auto result = chain_.acquire_with_provisioning(device_, &flasher, "fw.bin");
  ASSERT_TRUE(result);
  EXPECT_TRUE(flasher.images.empty());
}

TEST_F(UidAcquisitionChainTest, FailedFlashGivesUp) {
  direct_->uid = "AAAA";
  direct_->fail_first = 1;
  StubFlasher flasher;
  flasher.result = false;

  EXPECT_FALSE(chain_.acquire_with_provisioning(device_, &flasher, "fw.bin"));
  EXPECT_EQ(direct_->attempts, 1);
}

TEST_F(UidAcquisitionChainTest, NoFlasherNoProvisioning) {
  EXPECT_FALSE(chain_.acquire_with_provisioning(device_, nullptr, "fw.bin"));
}
