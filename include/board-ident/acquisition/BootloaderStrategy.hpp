#pragma once
#include "board-ident/EngineConfig.hpp"
#include "board-ident/acquisition/UidStrategy.hpp"
#include "board-ident/serial/SerialPort.hpp"

#include <vector>

namespace boardident {
namespace acquisition {

/// System-memory bootloader exchange (USART protocol): sync, Read Memory
/// command, address frame, length frame, then the UID bytes plus a trailing
/// XOR checksum. Any reply other than ACK aborts the whole sequence.
class BOARD_IDENT_API BootloaderStrategy : public UidStrategy {
public:
  static constexpr uint8_t SYNC = 0x7F;
  static constexpr uint8_t ACK = 0x79;
  static constexpr uint8_t NACK = 0x1F;
  static constexpr uint8_t READ_MEMORY = 0x11;
  static constexpr uint8_t READ_MEMORY_COMPLEMENT = 0xEE;

  BootloaderStrategy(serial::SerialPortFactory &factory,
                     const BootloaderConfig &config,
                     const UidAddressMap &addresses);

  UidSource kind() const override { return UidSource::Bootloader; }
  std::string name() const override { return "bootloader"; }
  bool applies_to(const Device &device) const override;
  std::optional<std::string> attempt(const Device &device) override;

  /// XOR of every byte
  static uint8_t xor_checksum(const std::vector<uint8_t> &bytes);

  /// Big-endian address followed by its XOR checksum
  static std::vector<uint8_t> address_frame(uint32_t address);

  /// N-1 followed by its complement
  static std::vector<uint8_t> length_frame(uint8_t length);

  /// Length frame as configured: the complement pair, or the single
  /// configured byte
  static std::vector<uint8_t> length_frame(const BootloaderConfig &config);

private:
  bool send_and_ack(serial::SerialPort &port, const std::vector<uint8_t> &frame,
                    const char *step);

  serial::SerialPortFactory &factory_;
  BootloaderConfig config_;
  UidAddressMap addresses_;
};

} // namespace acquisition
} // namespace boardident
