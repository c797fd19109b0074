#pragma once
#include "board-ident/Device.hpp"
#include "board-ident/EngineConfig.hpp"
#include "board-ident/export.h"
#include "board-ident/serial/SerialPort.hpp"

#include <map>
#include <optional>
#include <string>

namespace boardident {
namespace harvest {

using Attributes = std::map<std::string, std::string>;

/// Listens to whatever a board prints on its serial port and turns it into
/// device attributes. Runs whether or not a uid was acquired.
class BOARD_IDENT_API MetadataHarvester {
public:
  MetadataHarvester(serial::SerialPortFactory &factory,
                    const HarvestConfig &config);

  /// Capture text at each configured baud until one yields output, then
  /// merge it into `device`. Returns false when nothing was captured.
  bool harvest(Device &device, bool silent = false);

  /// JSON object, then key:value / key=value lines, then a bare hex uid
  static Attributes parse(const std::string &text);

  /// Known keys go to typed fields, the rest to extra_info. An existing uid
  /// is never replaced.
  static void apply(const Attributes &attributes, const std::string &raw,
                    Device &device);

  /// Lower-case, trim and join inner whitespace with '_'
  static std::string normalize_key(const std::string &key);

private:
  std::optional<std::string> capture(const std::string &port, uint32_t baud,
                                     bool silent);

  serial::SerialPortFactory &factory_;
  HarvestConfig config_;
};

} // namespace harvest
} // namespace boardident
