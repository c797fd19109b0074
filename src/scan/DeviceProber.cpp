#include "board-ident/scan/DeviceProber.hpp"
#include "board-ident/Logger.hpp"
#include "board-ident/serial/BoardClassifier.hpp"

namespace boardident {
namespace scan {

DeviceProber::DeviceProber(acquisition::UidAcquisitionChain &chain,
                           harvest::MetadataHarvester *harvester)
    : chain_(chain), harvester_(harvester) {}

Device DeviceProber::from_raw_port(const RawPort &port) {
  Device device;
  device.port = port.device;
  device.vendor_id = port.vendor_id;
  device.product_id = port.product_id;
  device.serial_number = port.serial_number;
  device.manufacturer = port.manufacturer;
  device.description = port.description;
  device.board_kind = serial::classify(port.vendor_id, port.product_id);

  if (!port.hwid.empty())
    device.extra_info["hwid"] = port.hwid;
  if (!port.location.empty())
    device.extra_info["location"] = port.location;

  auto now = current_timestamp();
  device.first_detected = now;
  device.last_seen = now;
  device.status = ConnectionStatus::Connected;
  return device;
}

Device DeviceProber::probe(const RawPort &port, bool silent) {
  Device device = from_raw_port(port);

  if (auto result = chain_.acquire(device)) {
    device.uid = result->uid;
    device.uid_source = result->source;
  }

  if (harvester_)
    harvester_->harvest(device, silent);

  device.health_score = device.compute_health_score();
  if (!silent) {
    LOG_DEBUG("PROBE", port.device, "{} board, id {}",
              to_string(device.board_kind), device.get_unique_id());
  }
  return device;
}

} // namespace scan
} // namespace boardident
