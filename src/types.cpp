#include "board-ident/types.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace boardident {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string to_string(BoardKind kind) {
  switch (kind) {
  case BoardKind::Stm32:
    return "STM32";
  case BoardKind::Esp32:
    return "ESP32";
  case BoardKind::Esp8266:
    return "ESP8266";
  case BoardKind::Arduino:
    return "Arduino";
  case BoardKind::Unknown:
    break;
  }
  return "Unknown";
}

std::string to_string(ConnectionStatus status) {
  return status == ConnectionStatus::Connected ? "connected" : "disconnected";
}

std::string to_string(UidSource source) {
  switch (source) {
  case UidSource::DirectText:
    return "direct_text";
  case UidSource::Bootloader:
    return "bootloader";
  case UidSource::ProgrammerCli:
    return "programmer_cli";
  case UidSource::Harvested:
    return "harvested";
  case UidSource::None:
    break;
  }
  return "none";
}

BoardKind board_kind_from_string(const std::string &text) {
  std::string t = lower(text);
  if (t == "stm32")
    return BoardKind::Stm32;
  if (t == "esp32")
    return BoardKind::Esp32;
  if (t == "esp8266")
    return BoardKind::Esp8266;
  if (t == "arduino")
    return BoardKind::Arduino;
  return BoardKind::Unknown;
}

ConnectionStatus connection_status_from_string(const std::string &text) {
  return lower(text) == "connected" ? ConnectionStatus::Connected
                                    : ConnectionStatus::Disconnected;
}

UidSource uid_source_from_string(const std::string &text) {
  std::string t = lower(text);
  if (t == "direct_text")
    return UidSource::DirectText;
  if (t == "bootloader")
    return UidSource::Bootloader;
  if (t == "programmer_cli")
    return UidSource::ProgrammerCli;
  if (t == "harvested")
    return UidSource::Harvested;
  return UidSource::None;
}

std::optional<uint16_t> parse_usb_id(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  if (begin == end)
    return std::nullopt;

  int base = 10;
  if (end - begin > 2 && text[begin] == '0' &&
      (text[begin + 1] == 'x' || text[begin + 1] == 'X')) {
    base = 16;
    begin += 2;
  }

  uint32_t value = 0;
  for (size_t i = begin; i < end; ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    uint32_t digit;
    if (std::isdigit(c)) {
      digit = c - '0';
    } else if (base == 16 && std::isxdigit(c)) {
      digit = std::tolower(c) - 'a' + 10;
    } else {
      return std::nullopt;
    }
    value = value * base + digit;
    if (value > 0xFFFF)
      return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

std::string format_usb_id(uint16_t id) { return fmt::format("0x{:04X}", id); }

} // namespace boardident
