#include "board-ident/Device.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>

namespace boardident {

namespace {

using json = nlohmann::json;

json opt_to_json(const std::optional<std::string> &value) {
  if (value)
    return *value;
  return nullptr;
}

json id_to_json(const std::optional<uint16_t> &id) {
  if (id)
    return format_usb_id(*id);
  return nullptr;
}

std::optional<std::string> opt_string(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return std::nullopt;
  if (j[key].is_string())
    return j[key].get<std::string>();
  return j[key].dump();
}

// Accepts integers as well as decimal or 0x-prefixed hex text
std::optional<uint16_t> usb_id_from_json(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return std::nullopt;
  const json &v = j[key];
  if (v.is_number_unsigned() || v.is_number_integer()) {
    int64_t n = v.get<int64_t>();
    if (n < 0 || n > 0xFFFF)
      return std::nullopt;
    return static_cast<uint16_t>(n);
  }
  if (v.is_string())
    return parse_usb_id(v.get<std::string>());
  return std::nullopt;
}

Timestamp timestamp_from_json(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_string()) {
    if (auto ts = parse_timestamp(j[key].get<std::string>()))
      return *ts;
  }
  return Timestamp{};
}

std::set<std::string> tags_from_json(const json &j) {
  std::set<std::string> tags;
  if (j.contains("tags") && j["tags"].is_array()) {
    for (const auto &t : j["tags"]) {
      if (t.is_string())
        tags.insert(t.get<std::string>());
    }
  }
  return tags;
}

std::map<std::string, std::string> extra_from_json(const json &j) {
  std::map<std::string, std::string> extra;
  if (j.contains("extra_info") && j["extra_info"].is_object()) {
    for (auto &[key, val] : j["extra_info"].items()) {
      extra[key] = val.is_string() ? val.get<std::string>() : val.dump();
    }
  }
  return extra;
}

} // namespace

std::string Device::get_unique_id() const {
  if (uid && !uid->empty())
    return *uid;
  if (serial_number && !serial_number->empty())
    return *serial_number;
  if (vendor_id && product_id)
    return fmt::format("{:04X}:{:04X}", *vendor_id, *product_id);
  return port + "_" + to_string(board_kind);
}

std::vector<std::string> Device::candidate_ids() const {
  std::vector<std::string> ids;
  auto add = [&ids](const std::string &id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end())
      ids.push_back(id);
  };
  if (uid && !uid->empty())
    add(*uid);
  if (serial_number && !serial_number->empty())
    add(*serial_number);
  if (vendor_id && product_id)
    add(fmt::format("{:04X}:{:04X}", *vendor_id, *product_id));
  add(port + "_" + to_string(board_kind));
  return ids;
}

int Device::compute_health_score() const {
  int score = 100;
  if (status == ConnectionStatus::Disconnected)
    score -= 20;
  for (const auto *field :
       {&firmware_version, &uid, &chip_id, &mac_address, &manufacturer}) {
    if (!is_placeholder(*field))
      score += 5;
  }
  return std::clamp(score, 0, 100);
}

nlohmann::json Device::to_json() const {
  json j;
  j["port"] = port;
  j["vendor_id"] = id_to_json(vendor_id);
  j["product_id"] = id_to_json(product_id);
  j["serial_number"] = opt_to_json(serial_number);
  j["uid"] = opt_to_json(uid);
  j["uid_source"] = to_string(uid_source);
  j["board_kind"] = to_string(board_kind);

  j["manufacturer"] = opt_to_json(manufacturer);
  j["description"] = opt_to_json(description);
  j["firmware_version"] = opt_to_json(firmware_version);
  j["hardware_version"] = opt_to_json(hardware_version);
  j["flash_size"] = opt_to_json(flash_size);
  j["cpu_frequency"] = opt_to_json(cpu_frequency);
  j["mac_address"] = opt_to_json(mac_address);
  j["chip_id"] = opt_to_json(chip_id);

  j["first_detected"] = format_timestamp(first_detected);
  j["last_seen"] = format_timestamp(last_seen);
  j["connection_count"] = connection_count;
  j["status"] = to_string(status);
  j["health_score"] = health_score;

  j["custom_name"] = opt_to_json(custom_name);
  j["tags"] = tags;
  j["notes"] = opt_to_json(notes);
  j["extra_info"] = extra_info;
  return j;
}

Device Device::from_json(const nlohmann::json &j) {
  Device d;
  d.port = j.value("port", "");
  d.vendor_id = usb_id_from_json(j, "vendor_id");
  d.product_id = usb_id_from_json(j, "product_id");
  d.serial_number = opt_string(j, "serial_number");
  d.uid = opt_string(j, "uid");
  d.uid_source = uid_source_from_string(j.value("uid_source", "none"));
  d.board_kind = board_kind_from_string(j.value("board_kind", "Unknown"));

  d.manufacturer = opt_string(j, "manufacturer");
  d.description = opt_string(j, "description");
  d.firmware_version = opt_string(j, "firmware_version");
  d.hardware_version = opt_string(j, "hardware_version");
  d.flash_size = opt_string(j, "flash_size");
  d.cpu_frequency = opt_string(j, "cpu_frequency");
  d.mac_address = opt_string(j, "mac_address");
  d.chip_id = opt_string(j, "chip_id");

  d.first_detected = timestamp_from_json(j, "first_detected");
  d.last_seen = timestamp_from_json(j, "last_seen");
  d.connection_count = j.value("connection_count", uint64_t{0});
  d.status =
      connection_status_from_string(j.value("status", "disconnected"));
  d.health_score = j.value("health_score", 100);

  d.custom_name = opt_string(j, "custom_name");
  d.tags = tags_from_json(j);
  d.notes = opt_string(j, "notes");
  d.extra_info = extra_from_json(j);
  return d;
}

bool Device::operator==(const Device &other) const {
  return port == other.port && vendor_id == other.vendor_id &&
         product_id == other.product_id &&
         serial_number == other.serial_number && uid == other.uid &&
         uid_source == other.uid_source && board_kind == other.board_kind &&
         manufacturer == other.manufacturer &&
         description == other.description &&
         firmware_version == other.firmware_version &&
         hardware_version == other.hardware_version &&
         flash_size == other.flash_size &&
         cpu_frequency == other.cpu_frequency &&
         mac_address == other.mac_address && chip_id == other.chip_id &&
         first_detected == other.first_detected &&
         last_seen == other.last_seen &&
         connection_count == other.connection_count &&
         status == other.status && health_score == other.health_score &&
         custom_name == other.custom_name && tags == other.tags &&
         notes == other.notes && extra_info == other.extra_info;
}

DeviceTemplate DeviceTemplate::from_device(const std::string &name,
                                           const Device &device,
                                           const std::string &description) {
  DeviceTemplate t;
  t.name = name;
  t.description = description;
  t.board_kind = device.board_kind;
  t.vendor_id = device.vendor_id;
  t.product_id = device.product_id;
  t.manufacturer = device.manufacturer;
  t.device_description = device.description;
  t.firmware_version = device.firmware_version;
  t.hardware_version = device.hardware_version;
  t.flash_size = device.flash_size;
  t.cpu_frequency = device.cpu_frequency;
  t.tags = device.tags;
  t.notes = device.notes;
  t.extra_info = device.extra_info;
  // Diagnostics captured from one specific board do not belong to the type
  t.extra_info.erase("raw_output");
  t.created_at = current_timestamp();
  return t;
}

Device DeviceTemplate::instantiate(const std::string &port) const {
  Device d;
  d.port = port;
  d.board_kind = board_kind;
  d.vendor_id = vendor_id;
  d.product_id = product_id;
  d.manufacturer = manufacturer;
  d.description = device_description;
  d.firmware_version = firmware_version;
  d.hardware_version = hardware_version;
  d.flash_size = flash_size;
  d.cpu_frequency = cpu_frequency;
  d.tags = tags;
  d.notes = notes;
  d.extra_info = extra_info;
  d.extra_info["template"] = name;

  auto now = current_timestamp();
  d.first_detected = now;
  d.last_seen = now;
  d.connection_count = 0;
  d.status = ConnectionStatus::Connected;
  d.health_score = d.compute_health_score();
  return d;
}

nlohmann::json DeviceTemplate::to_json() const {
  json j;
  j["name"] = name;
  j["description"] = description;
  j["board_kind"] = to_string(board_kind);
  j["vendor_id"] = id_to_json(vendor_id);
  j["product_id"] = id_to_json(product_id);
  j["manufacturer"] = opt_to_json(manufacturer);
  j["device_description"] = opt_to_json(device_description);
  j["firmware_version"] = opt_to_json(firmware_version);
  j["hardware_version"] = opt_to_json(hardware_version);
  j["flash_size"] = opt_to_json(flash_size);
  j["cpu_frequency"] = opt_to_json(cpu_frequency);
  j["tags"] = tags;
  j["notes"] = opt_to_json(notes);
  j["extra_info"] = extra_info;
  j["created_at"] = format_timestamp(created_at);
  return j;
}

DeviceTemplate DeviceTemplate::from_json(const nlohmann::json &j) {
  DeviceTemplate t;
  t.name = j.value("name", "");
  t.description = j.value("description", "");
  t.board_kind = board_kind_from_string(j.value("board_kind", "Unknown"));
  t.vendor_id = usb_id_from_json(j, "vendor_id");
  t.product_id = usb_id_from_json(j, "product_id");
  t.manufacturer = opt_string(j, "manufacturer");
  t.device_description = opt_string(j, "device_description");
  t.firmware_version = opt_string(j, "firmware_version");
  t.hardware_version = opt_string(j, "hardware_version");
  t.flash_size = opt_string(j, "flash_size");
  t.cpu_frequency = opt_string(j, "cpu_frequency");
  t.tags = tags_from_json(j);
  t.notes = opt_string(j, "notes");
  t.extra_info = extra_from_json(j);
  t.created_at = timestamp_from_json(j, "created_at");
  return t;
}

bool is_placeholder(const std::optional<std::string> &value) {
  if (!value)
    return true;
  std::string v;
  for (char c : *value) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return v.empty() || v == "n/a" || v == "unknown" || v == "none";
}

Timestamp current_timestamp() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

std::string format_timestamp(Timestamp ts) {
  auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
                      ts.time_since_epoch())
                      .count();
  auto secs = ms_total / 1000;
  auto ms = ms_total % 1000;
  if (ms < 0) {
    ms += 1000;
    --secs;
  }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, ms);
}

std::optional<Timestamp> parse_timestamp(const std::string &text) {
  std::tm tm{};
  int ms = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec,
                  &consumed) != 6) {
    return std::nullopt;
  }
  if (static_cast<size_t>(consumed) < text.size() && text[consumed] == '.') {
    // Fraction of a second: ".5" is 500 ms, digits past the third are dropped
    size_t i = static_cast<size_t>(consumed) + 1;
    int digits = 0;
    for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]));
         ++i, ++digits) {
      if (digits < 3)
        ms = ms * 10 + (text[i] - '0');
    }
    if (digits == 0)
      return std::nullopt;
    for (int d = digits; d < 3; ++d)
      ms *= 10;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  std::time_t t = timegm(&tm);
  return std::chrono::system_clock::from_time_t(t) +
         std::chrono::milliseconds(ms);
}

} // namespace boardident
