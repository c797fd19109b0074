#pragma once
#include "board-ident/export.h"
#include "board-ident/types.hpp"

#include <filesystem>
#include <vector>

namespace boardident {
namespace serial {

class BOARD_IDENT_API PortEnumerator {
public:
  virtual ~PortEnumerator() = default;

  /// One OS query. Never throws; failures yield an empty list.
  virtual std::vector<RawPort> list_ports() = 0;
};

/// Linux enumeration through /sys/class/tty. Legacy platform UARTs and
/// ttys without a backing device are skipped. USB attributes come from the
/// closest ancestor carrying idVendor/idProduct.
class BOARD_IDENT_API SysfsPortEnumerator : public PortEnumerator {
public:
  explicit SysfsPortEnumerator(std::filesystem::path sysfs_root = "/sys",
                               std::filesystem::path dev_root = "/dev");

  std::vector<RawPort> list_ports() override;

private:
  std::optional<RawPort> read_port(const std::filesystem::path &tty_entry);

  std::filesystem::path sysfs_root_;
  std::filesystem::path dev_root_;
};

} // namespace serial
} // namespace boardident
