#include "board-ident/serial/BoardClassifier.hpp"

namespace boardident {
namespace serial {

const std::vector<KnownBoard> &known_boards() {
  static const std::vector<KnownBoard> table = {
      // STMicroelectronics
      {0x0483, 0x5740, BoardKind::Stm32, UsbInterface::VirtualComPort,
       "STM32 Virtual COM Port"},
      {0x0483, 0xDF11, BoardKind::Stm32, UsbInterface::Dfu,
       "STM32 in DFU mode"},
      {0x0483, 0x3748, BoardKind::Stm32, UsbInterface::DebugProbe,
       "ST-LINK/V2"},
      {0x0483, 0x374B, BoardKind::Stm32, UsbInterface::DebugProbe,
       "ST-LINK/V2-1"},
      {0x0483, 0x374E, BoardKind::Stm32, UsbInterface::DebugProbe,
       "STLINK-V3"},
      {0x0483, 0x374F, BoardKind::Stm32, UsbInterface::DebugProbe,
       "STLINK-V3"},

      // Espressif
      {0x303A, 0x0001, BoardKind::Esp32, UsbInterface::UsbUart,
       "ESP32-DevKitC"},
      {0x303A, 0x1001, BoardKind::Esp32, UsbInterface::UsbUart,
       "ESP32 USB JTAG/serial"},
      // CP210x bridges ship on NodeMCU boards
      {0x10C4, 0xEA60, BoardKind::Esp8266, UsbInterface::UsbUart,
       "CP210x UART Bridge"},

      // Arduino
      {0x2341, 0x0043, BoardKind::Arduino, UsbInterface::VirtualComPort,
       "Arduino Uno"},
      {0x2341, 0x0010, BoardKind::Arduino, UsbInterface::VirtualComPort,
       "Arduino Mega"},
      {0x2A03, 0x0043, BoardKind::Arduino, UsbInterface::VirtualComPort,
       "Arduino Uno (clone)"},
  };
  return table;
}

std::optional<KnownBoard> lookup_board(std::optional<uint16_t> vendor_id,
                                       std::optional<uint16_t> product_id) {
  if (!vendor_id || !product_id)
    return std::nullopt;
  for (const auto &entry : known_boards()) {
    if (entry.vendor_id == *vendor_id && entry.product_id == *product_id)
      return entry;
  }
  return std::nullopt;
}

BoardKind classify(std::optional<uint16_t> vendor_id,
                   std::optional<uint16_t> product_id) {
  auto entry = lookup_board(vendor_id, product_id);
  return entry ? entry->kind : BoardKind::Unknown;
}

bool is_debug_probe(std::optional<uint16_t> vendor_id,
                    std::optional<uint16_t> product_id) {
  auto entry = lookup_board(vendor_id, product_id);
  return entry && entry->interface == UsbInterface::DebugProbe;
}

} // namespace serial
} // namespace boardident
