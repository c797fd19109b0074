#include "board-ident/EngineConfig.hpp"
#include "board-ident/Logger.hpp"

#include <cstdlib>

namespace boardident {

namespace fs = std::filesystem;

uint32_t UidAddressMap::address_for(BoardKind kind) const {
  auto it = per_kind.find(kind);
  if (it != per_kind.end())
    return it->second;
  return default_address;
}

EngineConfig::EngineConfig() : data_dir(default_data_dir()) {
  uid_addresses.per_kind[BoardKind::Stm32] = 0x1FFF7A10;
}

fs::path default_data_dir() {
  if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "board-ident";
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / ".local" / "share" / "board-ident";
  }
  return fs::path(".board-ident");
}

void EngineConfig::validate() const {
  if (data_dir.empty())
    throw ConfigError("data_dir must not be empty");
  if (scan.max_workers == 0)
    throw ConfigError("scan.max_workers must be at least 1");
  if (scan.monitor_interval.count() <= 0)
    throw ConfigError("scan.monitor_interval_ms must be positive");
  if (direct_text.max_attempts < 1)
    throw ConfigError("direct_text.max_attempts must be at least 1");
  if (direct_text.read_window.count() <= 0)
    throw ConfigError("direct_text.read_window_ms must be positive");
  if (direct_text.min_uid_hex_digits == 0)
    throw ConfigError("direct_text.min_uid_hex_digits must be positive");
  if (bootloader.uid_length == 0)
    throw ConfigError("bootloader.uid_length must be positive");
  if (programmer.timeout.count() <= 0)
    throw ConfigError("programmer.timeout_ms must be positive");
  if (harvest.bauds.empty())
    throw ConfigError("harvest.bauds must list at least one baud rate");
  if (harvest.max_bytes == 0)
    throw ConfigError("harvest.max_bytes must be positive");
}

static std::chrono::milliseconds read_ms(const YAML::Node &node,
                                         const char *key,
                                         std::chrono::milliseconds fallback) {
  if (!node[key])
    return fallback;
  return std::chrono::milliseconds(node[key].as<int64_t>());
}

template <typename T>
static T read_or(const YAML::Node &node, const char *key, T fallback) {
  if (!node[key])
    return fallback;
  return node[key].as<T>();
}

// Addresses are written either as integers or as "0x..." strings
static uint32_t read_address(const YAML::Node &node) {
  std::string text = node.as<std::string>();
  try {
    size_t pos = 0;
    unsigned long value = std::stoul(text, &pos, 0);
    if (pos != text.size() || value > 0xFFFFFFFFul)
      throw ConfigError("invalid address: " + text);
    return static_cast<uint32_t>(value);
  } catch (const std::logic_error &) {
    throw ConfigError("invalid address: " + text);
  }
}

EngineConfig config_from_yaml(const YAML::Node &root) {
  EngineConfig cfg;
  if (!root || root.IsNull())
    return cfg;

  try {
    if (root["data_dir"])
      cfg.data_dir = root["data_dir"].as<std::string>();

    if (auto n = root["logging"]) {
      cfg.logging.file = read_or<std::string>(n, "file", cfg.logging.file);
      cfg.logging.level = read_or<std::string>(n, "level", cfg.logging.level);
    }

    if (auto n = root["scan"]) {
      cfg.scan.max_workers =
          read_or<size_t>(n, "max_workers", cfg.scan.max_workers);
      cfg.scan.monitor_interval =
          read_ms(n, "monitor_interval_ms", cfg.scan.monitor_interval);
      cfg.scan.stop_timeout =
          read_ms(n, "stop_timeout_ms", cfg.scan.stop_timeout);
      cfg.scan.harvest_metadata =
          read_or<bool>(n, "harvest_metadata", cfg.scan.harvest_metadata);
    }

    if (auto n = root["direct_text"]) {
      auto &dt = cfg.direct_text;
      dt.enabled = read_or<bool>(n, "enabled", dt.enabled);
      dt.baud = read_or<uint32_t>(n, "baud", dt.baud);
      if (n["command"]) {
        std::string cmd = n["command"].as<std::string>();
        if (cmd.size() != 1)
          throw ConfigError("direct_text.command must be a single character");
        dt.command = cmd[0];
      }
      dt.read_window = read_ms(n, "read_window_ms", dt.read_window);
      dt.max_attempts = read_or<int>(n, "max_attempts", dt.max_attempts);
      dt.retry_delay = read_ms(n, "retry_delay_ms", dt.retry_delay);
      dt.min_uid_hex_digits =
          read_or<size_t>(n, "min_uid_hex_digits", dt.min_uid_hex_digits);
    }

    if (auto n = root["bootloader"]) {
      auto &bl = cfg.bootloader;
      bl.enabled = read_or<bool>(n, "enabled", bl.enabled);
      bl.baud = read_or<uint32_t>(n, "baud", bl.baud);
      bl.ack_timeout = read_ms(n, "ack_timeout_ms", bl.ack_timeout);
      bl.read_timeout = read_ms(n, "read_timeout_ms", bl.read_timeout);
      if (n["uid_length"]) {
        int len = n["uid_length"].as<int>();
        if (len <= 0 || len > 255)
          throw ConfigError("bootloader.uid_length must be in 1..255");
        bl.uid_length = static_cast<uint8_t>(len);
      }
      if (n["length_encoding"]) {
        std::string enc = n["length_encoding"].as<std::string>();
        if (enc == "complement")
          bl.length_encoding = LengthEncoding::Complement;
        else if (enc == "single_byte")
          bl.length_encoding = LengthEncoding::SingleByte;
        else
          throw ConfigError("bootloader.length_encoding must be "
                            "'complement' or 'single_byte', got '" +
                            enc + "'");
      }
      if (n["length_byte"]) {
        uint32_t value = read_address(n["length_byte"]);
        if (value > 0xFF)
          throw ConfigError("bootloader.length_byte must fit in one byte");
        bl.length_byte = static_cast<uint8_t>(value);
      }
    }

    if (auto n = root["uid_addresses"]) {
      for (const auto &kv : n) {
        std::string key = kv.first.as<std::string>();
        uint32_t address = read_address(kv.second);
        if (key == "default") {
          cfg.uid_addresses.default_address = address;
          continue;
        }
        BoardKind kind = board_kind_from_string(key);
        if (kind == BoardKind::Unknown && key != "Unknown")
          throw ConfigError("uid_addresses: unknown board kind '" + key + "'");
        cfg.uid_addresses.per_kind[kind] = address;
      }
    }

    if (auto n = root["programmer"]) {
      auto &pg = cfg.programmer;
      pg.enabled = read_or<bool>(n, "enabled", pg.enabled);
      pg.timeout = read_ms(n, "timeout_ms", pg.timeout);
      pg.debug_probes_only =
          read_or<bool>(n, "debug_probes_only", pg.debug_probes_only);
      pg.openocd_interface =
          read_or<std::string>(n, "openocd_interface", pg.openocd_interface);
      pg.openocd_target =
          read_or<std::string>(n, "openocd_target", pg.openocd_target);
      pg.jlink_device = read_or<std::string>(n, "jlink_device", pg.jlink_device);
      if (auto tools = n["tools"]) {
        for (const auto &kv : tools) {
          pg.tool_paths[kv.first.as<std::string>()] =
              kv.second.as<std::string>();
        }
      }
    }

    if (auto n = root["harvest"]) {
      auto &hv = cfg.harvest;
      if (n["bauds"]) {
        hv.bauds = n["bauds"].as<std::vector<uint32_t>>();
      }
      hv.max_bytes = read_or<size_t>(n, "max_bytes", hv.max_bytes);
      hv.read_window = read_ms(n, "read_window_ms", hv.read_window);
    }
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("invalid configuration: ") + ex.what());
  }

  cfg.validate();
  return cfg;
}

EngineConfig load_config(const std::string &path) {
  if (path.empty() || !fs::exists(path)) {
    LOG_DEBUG("CONFIG", "LOAD", "No config file at '{}', using defaults",
              path);
    EngineConfig cfg;
    cfg.validate();
    return cfg;
  }

  LOG_INFO("CONFIG", "LOAD", "Loading configuration from: {}", path);
  try {
    return config_from_yaml(YAML::LoadFile(path));
  } catch (const YAML::Exception &ex) {
    throw ConfigError("failed to parse " + path + ": " + ex.what());
  }
}

} // namespace boardident
