#pragma once
#include "board-ident/types.hpp"

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace boardident {

using Timestamp = std::chrono::system_clock::time_point;

/// A board observed on a serial port, plus everything learned about it
struct Device {
  // Identity
  std::string port;
  std::optional<uint16_t> vendor_id;
  std::optional<uint16_t> product_id;
  std::optional<std::string> serial_number;
  std::optional<std::string> uid;
  UidSource uid_source{UidSource::None};

  // Classification
  BoardKind board_kind{BoardKind::Unknown};

  // Descriptive, filled opportunistically
  std::optional<std::string> manufacturer;
  std::optional<std::string> description;
  std::optional<std::string> firmware_version;
  std::optional<std::string> hardware_version;
  std::optional<std::string> flash_size;
  std::optional<std::string> cpu_frequency;
  std::optional<std::string> mac_address;
  std::optional<std::string> chip_id;

  // Lifecycle
  Timestamp first_detected{};
  Timestamp last_seen{};
  uint64_t connection_count{0};
  ConnectionStatus status{ConnectionStatus::Connected};
  int health_score{100};

  // User annotations
  std::optional<std::string> custom_name;
  std::set<std::string> tags;
  std::optional<std::string> notes;
  std::map<std::string, std::string> extra_info;

  /// Registry key: uid > serial_number > "VVVV:PPPP" > "{port}_{kind}"
  std::string get_unique_id() const;

  /// Every key this device could be stored under, strongest first
  std::vector<std::string> candidate_ids() const;

  /// Heuristic completeness signal in [0, 100], not a diagnostic
  int compute_health_score() const;

  nlohmann::json to_json() const;
  static Device from_json(const nlohmann::json &j);

  bool operator==(const Device &other) const;
  bool operator!=(const Device &other) const { return !(*this == other); }
};

/// Reusable snapshot of a device's classification and metadata.
/// Carries no port, uid or serial number.
struct DeviceTemplate {
  std::string name;
  std::string description;
  BoardKind board_kind{BoardKind::Unknown};
  std::optional<uint16_t> vendor_id;
  std::optional<uint16_t> product_id;
  std::optional<std::string> manufacturer;
  std::optional<std::string> device_description;
  std::optional<std::string> firmware_version;
  std::optional<std::string> hardware_version;
  std::optional<std::string> flash_size;
  std::optional<std::string> cpu_frequency;
  std::set<std::string> tags;
  std::optional<std::string> notes;
  std::map<std::string, std::string> extra_info;
  Timestamp created_at{};

  static DeviceTemplate from_device(const std::string &name,
                                    const Device &device,
                                    const std::string &description);

  /// Fresh device anchored at `port` with bookkeeping reset
  Device instantiate(const std::string &port) const;

  nlohmann::json to_json() const;
  static DeviceTemplate from_json(const nlohmann::json &j);
};

/// True for empty strings and "N/A", "Unknown", "None" (any case)
bool is_placeholder(const std::optional<std::string> &value);

/// Current time truncated to the precision the registry files keep
Timestamp current_timestamp();

/// ISO-8601 UTC with milliseconds, e.g. "2024-05-01T10:22:03.120Z"
std::string format_timestamp(Timestamp ts);
/// Inverse of format_timestamp; also accepts values without milliseconds
std::optional<Timestamp> parse_timestamp(const std::string &text);

} // namespace boardident
