#pragma once
#include "board-ident/Device.hpp"
#include "board-ident/export.h"

#include <optional>
#include <string>

namespace boardident {
namespace acquisition {

/// One way of reading a board's unique identifier
class BOARD_IDENT_API UidStrategy {
public:
  virtual ~UidStrategy() = default;

  virtual UidSource kind() const = 0;
  virtual std::string name() const = 0;

  /// Cheap pre-check on classification only; no I/O
  virtual bool applies_to(const Device &device) const = 0;

  /// Canonical uppercase hex uid, or nullopt. Must stay within its own
  /// timeouts.
  virtual std::optional<std::string> attempt(const Device &device) = 0;
};

/// Strip a 0x prefix and ':' / '-' separators, uppercase. Returns an empty
/// string when anything other than hex digits remains.
std::string normalize_uid(const std::string &token);

/// Uppercase hex rendering of raw bytes
std::string hex_encode(const uint8_t *data, size_t size);

} // namespace acquisition
} // namespace boardident
