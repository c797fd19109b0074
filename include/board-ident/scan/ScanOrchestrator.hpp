#pragma once
#include "board-ident/Device.hpp"
#include "board-ident/scan/DeviceProber.hpp"
#include "board-ident/serial/PortEnumerator.hpp"

#include <vector>

namespace boardident {
namespace scan {

/// One-shot scans over every enumerated port. Ports are probed in
/// parallel, one port per worker, at most `max_workers` at a time.
class BOARD_IDENT_API ScanOrchestrator {
public:
  ScanOrchestrator(serial::PortEnumerator &enumerator, PortProber &prober,
                   size_t max_workers = 10);

  /// Results in completion order. Ports whose probe throws are left out.
  std::vector<Device> scan_once();

  /// Same, without per-port diagnostics (used by the monitor)
  std::vector<Device> scan_once_silent();

  size_t max_workers() const { return max_workers_; }

private:
  std::vector<Device> run(bool silent);

  serial::PortEnumerator &enumerator_;
  PortProber &prober_;
  size_t max_workers_;
};

} // namespace scan
} // namespace boardident
