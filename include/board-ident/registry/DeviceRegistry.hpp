#pragma once
#include "board-ident/Device.hpp"
#include "board-ident/export.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace boardident {
namespace registry {

enum class SearchField {
  Name,
  Manufacturer,
  Description,
  Tags,
  Notes,
  Uid,
  SerialNumber,
  Port,
  BoardKind
};

std::optional<SearchField> search_field_from_string(const std::string &text);

/// name, manufacturer, description, tags, notes
const std::vector<SearchField> &default_search_fields();

struct RegistryStatistics {
  size_t total{0};
  size_t connected{0};
  size_t disconnected{0};
  std::map<BoardKind, size_t> by_kind;
};

struct PersistenceStats {
  uint64_t writes{0};
  uint64_t write_failures{0};
};

/// Every device ever seen, keyed by Device::get_unique_id(), plus named
/// templates. Both maps are mirrored to JSON files after each mutation.
/// All access is serialised on one mutex.
class BOARD_IDENT_API DeviceRegistry {
public:
  DeviceRegistry(std::filesystem::path devices_file,
                 std::filesystem::path templates_file);

  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  /// Insert or refresh a detection. A record stored under any of the
  /// device's candidate ids is moved to the current key; annotations and
  /// first_detected survive, connection_count is incremented.
  Device upsert(const Device &device);

  std::optional<Device> get(const std::string &id) const;
  bool contains(const std::string &id) const;
  bool remove(const std::string &id);
  std::vector<Device> list() const;
  size_t size() const;

  /// Case-insensitive substring match over the chosen fields
  std::vector<Device>
  search(const std::string &query,
         const std::vector<SearchField> &fields = default_search_fields()) const;

  /// Flag as gone without deleting. False when unknown or already marked.
  bool mark_disconnected(const std::string &id);

  // Bulk annotation; each returns the number of devices changed
  size_t add_tags(const std::vector<std::string> &ids,
                  const std::set<std::string> &tags);
  size_t remove_tags(const std::vector<std::string> &ids,
                     const std::set<std::string> &tags);
  size_t set_notes(const std::vector<std::string> &ids,
                   const std::string &notes);
  bool set_custom_name(const std::string &id, const std::string &name);

  bool save_template(const std::string &name, const Device &device,
                     const std::string &description = "");
  std::optional<Device> apply_template(const std::string &name,
                                       const std::string &port) const;
  std::optional<DeviceTemplate> get_template(const std::string &name) const;
  std::vector<DeviceTemplate> list_templates() const;
  bool delete_template(const std::string &name);

  RegistryStatistics statistics() const;
  PersistenceStats stats() const;

private:
  void load_devices();
  void load_templates();
  void save_devices();
  void save_templates();

  std::map<std::string, Device>::iterator find_existing(const Device &device);
  bool write_file(const std::filesystem::path &path,
                  const nlohmann::json &content);

  std::filesystem::path devices_file_;
  std::filesystem::path templates_file_;

  mutable std::mutex mutex_;
  std::map<std::string, Device> devices_;
  std::map<std::string, DeviceTemplate> templates_;
  PersistenceStats stats_;
};

} // namespace registry
} // namespace boardident
