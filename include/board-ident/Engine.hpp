#pragma once
#include "board-ident/EngineConfig.hpp"
#include "board-ident/acquisition/ToolLocator.hpp"
#include "board-ident/acquisition/UidAcquisitionChain.hpp"
#include "board-ident/harvest/MetadataHarvester.hpp"
#include "board-ident/process/ProcessRunner.hpp"
#include "board-ident/registry/DeviceRegistry.hpp"
#include "board-ident/scan/DeviceMonitor.hpp"
#include "board-ident/scan/DeviceProber.hpp"
#include "board-ident/scan/ScanOrchestrator.hpp"
#include "board-ident/serial/PortEnumerator.hpp"
#include "board-ident/serial/SerialPort.hpp"

#include <memory>

namespace boardident {

/// Owns the configuration and every component built from it. Components
/// receive their collaborators by reference, so the engine must outlive
/// any monitor it starts.
class BOARD_IDENT_API Engine {
public:
  /// Production wiring: termios ports, sysfs enumeration, posix_spawn
  explicit Engine(EngineConfig config);

  /// Injected transport, tool runner and enumerator (tests, simulators)
  Engine(EngineConfig config,
         std::unique_ptr<serial::SerialPortFactory> port_factory,
         std::unique_ptr<process::CommandRunner> runner,
         std::unique_ptr<serial::PortEnumerator> enumerator);

  ~Engine();

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  const EngineConfig &config() const { return config_; }

  registry::DeviceRegistry &registry() { return *registry_; }
  scan::ScanOrchestrator &orchestrator() { return *orchestrator_; }
  scan::DeviceMonitor &monitor() { return *monitor_; }
  acquisition::UidAcquisitionChain &chain() { return *chain_; }
  const acquisition::ToolLocator &tool_locator() const { return *locator_; }
  serial::PortEnumerator &enumerator() { return *enumerator_; }
  scan::PortProber &prober() { return *prober_; }

  /// scan_once() followed by an upsert of every result
  std::vector<Device> scan_and_record();

  /// Probe a single port path outside a full scan
  std::optional<Device> probe_port(const std::string &device_path);

private:
  void build();

  EngineConfig config_;
  std::unique_ptr<serial::SerialPortFactory> port_factory_;
  std::unique_ptr<process::CommandRunner> runner_;
  std::unique_ptr<serial::PortEnumerator> enumerator_;
  std::unique_ptr<acquisition::ToolLocator> locator_;
  std::unique_ptr<acquisition::UidAcquisitionChain> chain_;
  std::unique_ptr<harvest::MetadataHarvester> harvester_;
  std::unique_ptr<scan::DeviceProber> prober_;
  std::unique_ptr<registry::DeviceRegistry> registry_;
  std::unique_ptr<scan::ScanOrchestrator> orchestrator_;
  std::unique_ptr<scan::DeviceMonitor> monitor_;
};

} // namespace boardident
