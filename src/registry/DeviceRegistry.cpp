#include "board-ident/registry/DeviceRegistry.hpp"
#include "board-ident/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace boardident {
namespace registry {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool contains_ci(const std::optional<std::string> &haystack,
                 const std::string &needle) {
  return haystack && lower(*haystack).find(needle) != std::string::npos;
}

bool matches(const Device &device, SearchField field,
             const std::string &needle) {
  switch (field) {
  case SearchField::Name:
    return contains_ci(device.custom_name, needle);
  case SearchField::Manufacturer:
    return contains_ci(device.manufacturer, needle);
  case SearchField::Description:
    return contains_ci(device.description, needle);
  case SearchField::Tags:
    return std::any_of(device.tags.begin(), device.tags.end(),
                       [&needle](const std::string &tag) {
                         return contains_ci(tag, needle);
                       });
  case SearchField::Notes:
    return contains_ci(device.notes, needle);
  case SearchField::Uid:
    return contains_ci(device.uid, needle);
  case SearchField::SerialNumber:
    return contains_ci(device.serial_number, needle);
  case SearchField::Port:
    return contains_ci(device.port, needle);
  case SearchField::BoardKind:
    return contains_ci(to_string(device.board_kind), needle);
  }
  return false;
}

// Unreadable stores are moved aside rather than overwritten
void back_up_corrupt(const fs::path &path, const std::string &reason) {
  fs::path backup = path;
  backup += ".backup";
  LOG_WARN("REGISTRY", "LOAD", "{} is corrupt ({}), moving to {}",
           path.string(), reason, backup.string());
  std::error_code ec;
  fs::rename(path, backup, ec);
  if (ec) {
    LOG_ERROR("REGISTRY", "LOAD", "Could not back up {}: {}", path.string(),
              ec.message());
  }
}

std::optional<json> read_store(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec))
    return std::nullopt;

  std::ifstream ifs(path);
  if (!ifs) {
    LOG_ERROR("REGISTRY", "LOAD", "Cannot open {}", path.string());
    return std::nullopt;
  }

  json j = json::parse(ifs, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    back_up_corrupt(path, "not a JSON object");
    return std::nullopt;
  }
  return j;
}

} // namespace

std::optional<SearchField> search_field_from_string(const std::string &text) {
  static const std::map<std::string, SearchField> names = {
      {"name", SearchField::Name},
      {"custom_name", SearchField::Name},
      {"manufacturer", SearchField::Manufacturer},
      {"description", SearchField::Description},
      {"tags", SearchField::Tags},
      {"notes", SearchField::Notes},
      {"uid", SearchField::Uid},
      {"serial", SearchField::SerialNumber},
      {"serial_number", SearchField::SerialNumber},
      {"port", SearchField::Port},
      {"board", SearchField::BoardKind},
      {"board_kind", SearchField::BoardKind},
  };
  auto it = names.find(lower(text));
  if (it == names.end())
    return std::nullopt;
  return it->second;
}

const std::vector<SearchField> &default_search_fields() {
  static const std::vector<SearchField> fields = {
      SearchField::Name, SearchField::Manufacturer, SearchField::Description,
      SearchField::Tags, SearchField::Notes};
  return fields;
}

DeviceRegistry::DeviceRegistry(fs::path devices_file, fs::path templates_file)
    : devices_file_(std::move(devices_file)),
      templates_file_(std::move(templates_file)) {
  load_devices();
  load_templates();
}

void DeviceRegistry::load_devices() {
  auto store = read_store(devices_file_);
  if (!store)
    return;

  try {
    for (const auto &[id, entry] : store->items()) {
      devices_[id] = Device::from_json(entry);
    }
    LOG_INFO("REGISTRY", "LOAD", "Loaded {} devices from {}", devices_.size(),
             devices_file_.string());
  } catch (const std::exception &ex) {
    devices_.clear();
    back_up_corrupt(devices_file_, ex.what());
  }
}

void DeviceRegistry::load_templates() {
  auto store = read_store(templates_file_);
  if (!store)
    return;

  try {
    for (const auto &[name, entry] : store->items()) {
      auto tmpl = DeviceTemplate::from_json(entry);
      tmpl.name = name;
      templates_[name] = std::move(tmpl);
    }
    LOG_DEBUG("REGISTRY", "LOAD", "Loaded {} templates", templates_.size());
  } catch (const std::exception &ex) {
    templates_.clear();
    back_up_corrupt(templates_file_, ex.what());
  }
}

bool DeviceRegistry::write_file(const fs::path &path, const json &content) {
  fs::path tmp = path;
  tmp += ".tmp";

  try {
    if (path.has_parent_path())
      fs::create_directories(path.parent_path());

    {
      std::ofstream ofs(tmp, std::ios::trunc);
      if (!ofs)
        throw std::runtime_error("cannot open " + tmp.string());
      ofs << content.dump(2);
      if (!ofs)
        throw std::runtime_error("write to " + tmp.string() + " failed");
    }
    fs::rename(tmp, path);
    ++stats_.writes;
    return true;
  } catch (const std::exception &ex) {
    ++stats_.write_failures;
    LOG_ERROR("REGISTRY", "SAVE", "Failed to write {}: {}", path.string(),
              ex.what());
    std::error_code ec;
    fs::remove(tmp, ec);
    return false;
  }
}

void DeviceRegistry::save_devices() {
  json j = json::object();
  for (const auto &[id, device] : devices_) {
    j[id] = device.to_json();
  }
  write_file(devices_file_, j);
}

void DeviceRegistry::save_templates() {
  json j = json::object();
  for (const auto &[name, tmpl] : templates_) {
    j[name] = tmpl.to_json();
  }
  write_file(templates_file_, j);
}

std::map<std::string, Device>::iterator
DeviceRegistry::find_existing(const Device &device) {
  for (const auto &id : device.candidate_ids()) {
    auto it = devices_.find(id);
    if (it != devices_.end())
      return it;
  }

  // Stored under a stronger key the current detection did not reproduce
  if (device.serial_number && !device.serial_number->empty()) {
    return std::find_if(devices_.begin(), devices_.end(), [&](const auto &kv) {
      const Device &stored = kv.second;
      return stored.serial_number == device.serial_number &&
             stored.vendor_id == device.vendor_id &&
             stored.product_id == device.product_id;
    });
  }
  return devices_.end();
}

Device DeviceRegistry::upsert(const Device &device) {
  std::lock_guard lock(mutex_);
  const Timestamp now = current_timestamp();

  Device merged = device;
  auto existing = find_existing(device);

  if (existing != devices_.end()) {
    const Device &prior = existing->second;

    merged.first_detected = prior.first_detected;
    merged.connection_count = prior.connection_count + 1;
    if (!merged.custom_name)
      merged.custom_name = prior.custom_name;
    if (!merged.notes)
      merged.notes = prior.notes;
    merged.tags.insert(prior.tags.begin(), prior.tags.end());
    for (const auto &[key, value] : prior.extra_info) {
      merged.extra_info.emplace(key, value);
    }

    // Opportunistic fields this detection did not learn
    if (!merged.uid && prior.uid) {
      merged.uid = prior.uid;
      merged.uid_source = prior.uid_source;
    }
    for (auto field :
         {&Device::serial_number, &Device::manufacturer, &Device::description,
          &Device::firmware_version, &Device::hardware_version,
          &Device::flash_size, &Device::cpu_frequency, &Device::mac_address,
          &Device::chip_id}) {
      if (!(merged.*field))
        merged.*field = prior.*field;
    }

    if (existing->first != merged.get_unique_id()) {
      LOG_INFO("REGISTRY", "UPSERT", "Re-keying {} -> {}", existing->first,
               merged.get_unique_id());
    }
    devices_.erase(existing);
  } else {
    if (merged.first_detected == Timestamp{})
      merged.first_detected = now;
    merged.connection_count = 1;
    LOG_INFO("REGISTRY", "UPSERT", "New device {} on {}",
             merged.get_unique_id(), merged.port);
  }

  merged.last_seen = now;
  merged.health_score = merged.compute_health_score();
  devices_[merged.get_unique_id()] = merged;
  save_devices();
  return merged;
}

std::optional<Device> DeviceRegistry::get(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(id);
  if (it == devices_.end())
    return std::nullopt;
  return it->second;
}

bool DeviceRegistry::contains(const std::string &id) const {
  std::lock_guard lock(mutex_);
  return devices_.count(id) > 0;
}

bool DeviceRegistry::remove(const std::string &id) {
  std::lock_guard lock(mutex_);
  if (devices_.erase(id) == 0)
    return false;
  LOG_INFO("REGISTRY", "REMOVE", "Removed device {}", id);
  save_devices();
  return true;
}

std::vector<Device> DeviceRegistry::list() const {
  std::lock_guard lock(mutex_);
  std::vector<Device> out;
  out.reserve(devices_.size());
  for (const auto &[id, device] : devices_) {
    out.push_back(device);
  }
  return out;
}

size_t DeviceRegistry::size() const {
  std::lock_guard lock(mutex_);
  return devices_.size();
}

std::vector<Device>
DeviceRegistry::search(const std::string &query,
                       const std::vector<SearchField> &fields) const {
  const std::string needle = lower(query);
  std::lock_guard lock(mutex_);

  std::vector<Device> out;
  for (const auto &[id, device] : devices_) {
    bool hit = needle.empty() ||
               std::any_of(fields.begin(), fields.end(), [&](SearchField f) {
                 return matches(device, f, needle);
               });
    if (hit)
      out.push_back(device);
  }
  return out;
}

bool DeviceRegistry::mark_disconnected(const std::string &id) {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(id);
  if (it == devices_.end() ||
      it->second.status == ConnectionStatus::Disconnected)
    return false;

  it->second.status = ConnectionStatus::Disconnected;
  it->second.health_score = it->second.compute_health_score();
  LOG_INFO("REGISTRY", "DISCONNECT", "{} disconnected from {}", id,
           it->second.port);
  save_devices();
  return true;
}

size_t DeviceRegistry::add_tags(const std::vector<std::string> &ids,
                                const std::set<std::string> &tags) {
  std::lock_guard lock(mutex_);
  size_t changed = 0;
  for (const auto &id : ids) {
    auto it = devices_.find(id);
    if (it == devices_.end())
      continue;
    size_t before = it->second.tags.size();
    it->second.tags.insert(tags.begin(), tags.end());
    if (it->second.tags.size() != before)
      ++changed;
  }
  if (changed > 0)
    save_devices();
  return changed;
}

size_t DeviceRegistry::remove_tags(const std::vector<std::string> &ids,
                                   const std::set<std::string> &tags) {
  std::lock_guard lock(mutex_);
  size_t changed = 0;
  for (const auto &id : ids) {
    auto it = devices_.find(id);
    if (it == devices_.end())
      continue;
    size_t erased = 0;
    for (const auto &tag : tags) {
      erased += it->second.tags.erase(tag);
    }
    if (erased > 0)
      ++changed;
  }
  if (changed > 0)
    save_devices();
  return changed;
}

size_t DeviceRegistry::set_notes(const std::vector<std::string> &ids,
                                 const std::string &notes) {
  std::lock_guard lock(mutex_);
  size_t changed = 0;
  for (const auto &id : ids) {
    auto it = devices_.find(id);
    if (it == devices_.end())
      continue;
    it->second.notes = notes;
    ++changed;
  }
  if (changed > 0)
    save_devices();
  return changed;
}

bool DeviceRegistry::set_custom_name(const std::string &id,
                                     const std::string &name) {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(id);
  if (it == devices_.end())
    return false;
  if (name.empty())
    it->second.custom_name.reset();
  else
    it->second.custom_name = name;
  save_devices();
  return true;
}

bool DeviceRegistry::save_template(const std::string &name,
                                   const Device &device,
                                   const std::string &description) {
  if (name.empty()) {
    LOG_WARN("REGISTRY", "TEMPLATE", "Refusing template with empty name");
    return false;
  }

  std::lock_guard lock(mutex_);
  templates_[name] = DeviceTemplate::from_device(name, device, description);
  LOG_INFO("REGISTRY", "TEMPLATE", "Saved template '{}'", name);
  save_templates();
  return true;
}

std::optional<Device>
DeviceRegistry::apply_template(const std::string &name,
                               const std::string &port) const {
  std::lock_guard lock(mutex_);
  auto it = templates_.find(name);
  if (it == templates_.end()) {
    LOG_WARN("REGISTRY", "TEMPLATE", "No template named '{}'", name);
    return std::nullopt;
  }
  return it->second.instantiate(port);
}

std::optional<DeviceTemplate>
DeviceRegistry::get_template(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = templates_.find(name);
  if (it == templates_.end())
    return std::nullopt;
  return it->second;
}

std::vector<DeviceTemplate> DeviceRegistry::list_templates() const {
  std::lock_guard lock(mutex_);
  std::vector<DeviceTemplate> out;
  for (const auto &[name, tmpl] : templates_) {
    out.push_back(tmpl);
  }
  return out;
}

bool DeviceRegistry::delete_template(const std::string &name) {
  std::lock_guard lock(mutex_);
  if (templates_.erase(name) == 0)
    return false;
  save_templates();
  return true;
}

RegistryStatistics DeviceRegistry::statistics() const {
  std::lock_guard lock(mutex_);
  RegistryStatistics stats;
  stats.total = devices_.size();
  for (const auto &[id, device] : devices_) {
    if (device.status == ConnectionStatus::Connected)
      ++stats.connected;
    else
      ++stats.disconnected;
    ++stats.by_kind[device.board_kind];
  }
  return stats;
}

PersistenceStats DeviceRegistry::stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

} // namespace registry
} // namespace boardident
