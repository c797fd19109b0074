#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace boardident {

/// Board family derived from the USB vendor/product pair
enum class BoardKind { Stm32, Esp32, Esp8266, Arduino, Unknown };

enum class ConnectionStatus { Connected, Disconnected };

/// Which acquisition path produced a device's uid
enum class UidSource { None, DirectText, Bootloader, ProgrammerCli, Harvested };

std::string to_string(BoardKind kind);
std::string to_string(ConnectionStatus status);
std::string to_string(UidSource source);

/// Case-insensitive; unrecognised text maps to BoardKind::Unknown
BoardKind board_kind_from_string(const std::string &text);
/// Unrecognised text maps to ConnectionStatus::Disconnected
ConnectionStatus connection_status_from_string(const std::string &text);
UidSource uid_source_from_string(const std::string &text);

/// Normalise a USB id reported as decimal ("1155") or hex ("0x0483") text.
/// Returns nullopt for empty, malformed or out-of-range input; never throws.
std::optional<uint16_t> parse_usb_id(const std::string &text);

/// "0x%04X" rendering used in the registry files
std::string format_usb_id(uint16_t id);

/// One serial interface as reported by the operating system
struct RawPort {
  std::string device; // e.g. "/dev/ttyACM0"
  std::string name;   // e.g. "ttyACM0"
  std::optional<uint16_t> vendor_id;
  std::optional<uint16_t> product_id;
  std::optional<std::string> serial_number;
  std::optional<std::string> manufacturer;
  std::optional<std::string> description;
  std::string hwid;     // "USB VID:PID=0483:5740 SER=..." or "n/a"
  std::string location; // sysfs bus path, e.g. "1-1.2:1.0"
};

} // namespace boardident
