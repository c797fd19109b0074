#include "TestFixtures.hpp"
#include "board-ident/serial/PortEnumerator.hpp"

#include <gtest/gtest.h>

using namespace boardident;
using namespace boardident::test;
namespace fs = std::filesystem;

/// Builds a miniature /sys tree: a CDC-ACM board, an FTDI-style
/// usb-serial adapter, a legacy 8250 UART and a virtual console.
class SysfsEnumeratorTest : public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    sys_ = dir_ / "sys";
    fs::path usb = sys_ / "devices" / "pci0000:00" / "usb1";

    // ttyACM0 -> interface 1-1:1.0 of USB device 1-1
    fs::path acm_dev = usb / "1-1";
    write_file(acm_dev / "idVendor", "0483\n");
    write_file(acm_dev / "idProduct", "5740\n");
    write_file(acm_dev / "serial", "2061378B5241\n");
    write_file(acm_dev / "manufacturer", "STMicroelectronics\n");
    write_file(acm_dev / "product", "STM32 Virtual ComPort\n");
    fs::create_directories(acm_dev / "1-1:1.0");
    link_tty("ttyACM0", acm_dev / "1-1:1.0");

    // ttyUSB0 -> 1-2:1.0/ttyUSB0, no serial string
    fs::path ftdi_dev = usb / "1-2";
    write_file(ftdi_dev / "idVendor", "10c4\n");
    write_file(ftdi_dev / "idProduct", "ea60\n");
    write_file(ftdi_dev / "1-2:1.0" / "interface", "CP2102 USB to UART\n");
    fs::create_directories(ftdi_dev / "1-2:1.0" / "ttyUSB0");
    link_tty("ttyUSB0", ftdi_dev / "1-2:1.0" / "ttyUSB0");

    // ttyS0 on the platform bus
    fs::path platform = sys_ / "devices" / "platform" / "serial8250";
    fs::create_directories(platform);
    fs::create_directories(sys_ / "bus" / "platform");
    fs::create_directory_symlink(sys_ / "bus" / "platform",
                                 platform / "subsystem");
    link_tty("ttyS0", platform);

    // tty1 has no backing device
    fs::create_directories(sys_ / "class" / "tty" / "tty1");
  }

  void link_tty(const std::string &name, const fs::path &target) {
    fs::path entry = sys_ / "class" / "tty" / name;
    fs::create_directories(entry);
    fs::create_directory_symlink(target, entry / "device");
  }

  fs::path sys_;
};

TEST_F(SysfsEnumeratorTest, ListsUsbSerialPortsOnly) {
  serial::SysfsPortEnumerator enumerator(sys_, "/dev");
  auto ports = enumerator.list_ports();

  ASSERT_EQ(ports.size(), 2u);
  EXPECT_EQ(ports[0].device, "/dev/ttyACM0");
  EXPECT_EQ(ports[1].device, "/dev/ttyUSB0");
}

TEST_F(SysfsEnumeratorTest, ReadsUsbAttributesFromAncestor) {
  serial::SysfsPortEnumerator enumerator(sys_, "/dev");
  auto ports = enumerator.list_ports();
  ASSERT_EQ(ports.size(), 2u);

  const RawPort &acm = ports[0];
  EXPECT_EQ(acm.name, "ttyACM0");
  EXPECT_EQ(acm.vendor_id, 0x0483);
  EXPECT_EQ(acm.product_id, 0x5740);
  EXPECT_EQ(acm.serial_number, "2061378B5241");
  EXPECT_EQ(acm.manufacturer, "STMicroelectronics");
  EXPECT_EQ(acm.description, "STM32 Virtual ComPort");
  EXPECT_EQ(acm.location, "1-1:1.0");
  EXPECT_EQ(acm.hwid,
            "USB VID:PID=0483:5740 SER=2061378B5241 LOCATION=1-1:1.0");

  const RawPort &uart = ports[1];
  EXPECT_EQ(uart.vendor_id, 0x10C4);
  EXPECT_EQ(uart.product_id, 0xEA60);
  EXPECT_FALSE(uart.serial_number);
  EXPECT_EQ(uart.location, "1-2:1.0");
  EXPECT_EQ(uart.hwid, "USB VID:PID=10C4:EA60 LOCATION=1-2:1.0");
}

TEST_F(SysfsEnumeratorTest, MissingSysfsRootYieldsEmptyList) {
  serial::SysfsPortEnumerator enumerator(dir_ / "nowhere", "/dev");
  EXPECT_TRUE(enumerator.list_ports().empty());
}

TEST_F(SysfsEnumeratorTest, MalformedIdsBecomeUnset) {
  write_file(sys_ / "devices" / "pci0000:00" / "usb1" / "1-1" / "idVendor",
             "zz\n");
  serial::SysfsPortEnumerator enumerator(sys_, "/dev");
  auto ports = enumerator.list_ports();
  ASSERT_EQ(ports.size(), 2u);
  EXPECT_FALSE(ports[0].vendor_id);
  EXPECT_EQ(ports[0].product_id, 0x5740);
  EXPECT_EQ(ports[0].hwid, "n/a");
}
