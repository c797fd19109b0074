#include "board-ident/acquisition/BootloaderStrategy.hpp"
#include "board-ident/Logger.hpp"

namespace boardident {
namespace acquisition {

BootloaderStrategy::BootloaderStrategy(serial::SerialPortFactory &factory,
                                       const BootloaderConfig &config,
                                       const UidAddressMap &addresses)
    : factory_(factory), config_(config), addresses_(addresses) {}

bool BootloaderStrategy::applies_to(const Device &device) const {
  // The ROM bootloader only exists on ST parts; unknown boards get a chance
  return config_.enabled && !device.port.empty() &&
         (device.board_kind == BoardKind::Stm32 ||
          device.board_kind == BoardKind::Unknown);
}

uint8_t BootloaderStrategy::xor_checksum(const std::vector<uint8_t> &bytes) {
  uint8_t sum = 0;
  for (uint8_t b : bytes)
    sum ^= b;
  return sum;
}

std::vector<uint8_t> BootloaderStrategy::address_frame(uint32_t address) {
  std::vector<uint8_t> frame = {
      static_cast<uint8_t>(address >> 24), static_cast<uint8_t>(address >> 16),
      static_cast<uint8_t>(address >> 8), static_cast<uint8_t>(address)};
  frame.push_back(xor_checksum(frame));
  return frame;
}

std::vector<uint8_t> BootloaderStrategy::length_frame(uint8_t length) {
  uint8_t n = static_cast<uint8_t>(length - 1);
  return {n, static_cast<uint8_t>(n ^ 0xFF)};
}

std::vector<uint8_t>
BootloaderStrategy::length_frame(const BootloaderConfig &config) {
  if (config.length_encoding == LengthEncoding::SingleByte)
    return {config.length_byte};
  return length_frame(config.uid_length);
}

bool BootloaderStrategy::send_and_ack(serial::SerialPort &port,
                                      const std::vector<uint8_t> &frame,
                                      const char *step) {
  port.write(frame);
  int reply = port.read_byte(config_.ack_timeout);
  if (reply == ACK)
    return true;

  if (reply < 0) {
    LOG_DEBUG("BOOT", port.path(), "No reply to {}", step);
  } else {
    LOG_DEBUG("BOOT", port.path(), "Unexpected reply 0x{:02X} to {}", reply,
              step);
  }
  return false;
}

std::optional<std::string> BootloaderStrategy::attempt(const Device &device) {
  const uint32_t address = addresses_.address_for(device.board_kind);
  const size_t length = config_.uid_length;

  try {
    auto port = factory_.open(device.port, config_.baud);
    port->flush_input();

    if (!send_and_ack(*port, {SYNC}, "sync") ||
        !send_and_ack(*port, {READ_MEMORY, READ_MEMORY_COMPLEMENT},
                      "read command") ||
        !send_and_ack(*port, address_frame(address), "address") ||
        !send_and_ack(*port, length_frame(config_), "length")) {
      return std::nullopt;
    }

    auto frame = port->read_exact(length + 1, config_.read_timeout);
    if (frame.size() != length + 1) {
      LOG_DEBUG("BOOT", device.port, "Short read: {} of {} bytes",
                frame.size(), length + 1);
      return std::nullopt;
    }

    std::vector<uint8_t> data(frame.begin(), frame.begin() + length);
    if (xor_checksum(data) != frame.back()) {
      LOG_DEBUG("BOOT", device.port, "Checksum mismatch (0x{:02X} != 0x{:02X})",
                xor_checksum(data), frame.back());
      return std::nullopt;
    }

    std::string uid = hex_encode(data.data(), data.size());
    LOG_DEBUG("BOOT", device.port, "UID {} read from 0x{:08X}", uid, address);
    return uid;
  } catch (const serial::SerialError &ex) {
    LOG_DEBUG("BOOT", device.port, "Serial error: {}", ex.what());
    return std::nullopt;
  }
}

} // namespace acquisition
} // namespace boardident
