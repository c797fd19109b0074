#pragma once
#include "board-ident/Device.hpp"
#include "board-ident/acquisition/UidAcquisitionChain.hpp"
#include "board-ident/harvest/MetadataHarvester.hpp"

namespace boardident {
namespace scan {

/// Everything done to one port during a scan
class BOARD_IDENT_API PortProber {
public:
  virtual ~PortProber() = default;
  virtual Device probe(const RawPort &port, bool silent) = 0;
};

/// classify, acquire uid, harvest metadata
class BOARD_IDENT_API DeviceProber : public PortProber {
public:
  /// `harvester` may be null to skip metadata harvesting
  DeviceProber(acquisition::UidAcquisitionChain &chain,
               harvest::MetadataHarvester *harvester);

  Device probe(const RawPort &port, bool silent) override;

  /// Classified device carrying the OS-reported attributes only
  static Device from_raw_port(const RawPort &port);

private:
  acquisition::UidAcquisitionChain &chain_;
  harvest::MetadataHarvester *harvester_;
};

} // namespace scan
} // namespace boardident
