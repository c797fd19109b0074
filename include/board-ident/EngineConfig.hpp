#pragma once
#include "board-ident/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace boardident {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Silicon UID base address per board family
struct UidAddressMap {
  uint32_t default_address{0x1FFF7A10}; // STM32F2/F4 unique device ID
  std::map<BoardKind, uint32_t> per_kind;

  uint32_t address_for(BoardKind kind) const;
};

struct ScanConfig {
  size_t max_workers{10};
  std::chrono::milliseconds monitor_interval{5000};
  std::chrono::milliseconds stop_timeout{10000};
  bool harvest_metadata{true};
};

struct DirectTextConfig {
  bool enabled{true};
  uint32_t baud{115200};
  char command{'I'};
  std::chrono::milliseconds read_window{3000};
  int max_attempts{5};
  std::chrono::milliseconds retry_delay{500};
  size_t min_uid_hex_digits{24};
};

/// How the Read Memory byte count is framed
enum class LengthEncoding {
  Complement, // N-1 followed by its complement
  SingleByte  // one fixed byte, `length_byte`
};

struct BootloaderConfig {
  bool enabled{true};
  uint32_t baud{115200};
  std::chrono::milliseconds ack_timeout{1000};
  std::chrono::milliseconds read_timeout{2000};
  uint8_t uid_length{12};
  LengthEncoding length_encoding{LengthEncoding::Complement};
  uint8_t length_byte{0xBC};
};

struct ProgrammerConfig {
  bool enabled{true};
  std::chrono::milliseconds timeout{15000};
  bool debug_probes_only{true};
  std::map<std::string, std::string> tool_paths; // tool id -> executable
  std::string openocd_interface{"interface/stlink.cfg"};
  std::string openocd_target{"target/stm32f4x.cfg"};
  std::string jlink_device{"STM32F407VG"};
};

struct HarvestConfig {
  std::vector<uint32_t> bauds{115200, 9600};
  size_t max_bytes{768};
  std::chrono::milliseconds read_window{2000};
};

struct LoggingConfig {
  std::string file{"board_ident.log"};
  std::string level{"info"};
};

struct EngineConfig {
  std::filesystem::path data_dir;
  LoggingConfig logging;
  ScanConfig scan;
  DirectTextConfig direct_text;
  BootloaderConfig bootloader;
  UidAddressMap uid_addresses;
  ProgrammerConfig programmer;
  HarvestConfig harvest;

  EngineConfig();

  /// Throws ConfigError describing the first invalid value
  void validate() const;

  std::filesystem::path devices_file() const {
    return data_dir / "devices.json";
  }
  std::filesystem::path templates_file() const {
    return data_dir / "templates.json";
  }
};

/// $XDG_DATA_HOME/board-ident, else ~/.local/share/board-ident
std::filesystem::path default_data_dir();

/// Build a config from a parsed YAML document. Missing keys keep defaults.
EngineConfig config_from_yaml(const YAML::Node &root);

/// Load and validate a YAML config file. A missing file yields defaults;
/// unreadable or invalid content throws ConfigError.
EngineConfig load_config(const std::string &path);

} // namespace boardident
