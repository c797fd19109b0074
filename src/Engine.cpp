#include "board-ident/Engine.hpp"
#include "board-ident/Logger.hpp"
#include "board-ident/acquisition/BootloaderStrategy.hpp"
#include "board-ident/acquisition/DirectTextStrategy.hpp"
#include "board-ident/acquisition/ProgrammerCliStrategy.hpp"

namespace boardident {

Engine::Engine(EngineConfig config)
    : Engine(std::move(config),
             std::make_unique<serial::PosixSerialPortFactory>(),
             std::make_unique<process::ProcessRunner>(),
             std::make_unique<serial::SysfsPortEnumerator>()) {}

Engine::Engine(EngineConfig config,
               std::unique_ptr<serial::SerialPortFactory> port_factory,
               std::unique_ptr<process::CommandRunner> runner,
               std::unique_ptr<serial::PortEnumerator> enumerator)
    : config_(std::move(config)), port_factory_(std::move(port_factory)),
      runner_(std::move(runner)), enumerator_(std::move(enumerator)) {
  config_.validate();
  build();
}

Engine::~Engine() {
  // The monitor loop uses the other components, so it goes first
  monitor_.reset();
}

void Engine::build() {
  locator_ = std::make_unique<acquisition::ToolLocator>(
      config_.programmer.tool_paths, config_.data_dir / "tools");

  chain_ = std::make_unique<acquisition::UidAcquisitionChain>();
  chain_->add_strategy(std::make_unique<acquisition::DirectTextStrategy>(
      *port_factory_, config_.direct_text));
  chain_->add_strategy(std::make_unique<acquisition::BootloaderStrategy>(
      *port_factory_, config_.bootloader, config_.uid_addresses));
  chain_->add_strategy(std::make_unique<acquisition::ProgrammerCliStrategy>(
      *runner_, *locator_, config_.programmer, config_.uid_addresses));

  if (config_.scan.harvest_metadata) {
    harvester_ = std::make_unique<harvest::MetadataHarvester>(*port_factory_,
                                                              config_.harvest);
  }
  prober_ = std::make_unique<scan::DeviceProber>(*chain_, harvester_.get());

  registry_ = std::make_unique<registry::DeviceRegistry>(
      config_.devices_file(), config_.templates_file());
  orchestrator_ = std::make_unique<scan::ScanOrchestrator>(
      *enumerator_, *prober_, config_.scan.max_workers);
  monitor_ = std::make_unique<scan::DeviceMonitor>(
      *orchestrator_, *registry_, config_.scan.monitor_interval,
      config_.scan.stop_timeout);

  LOG_DEBUG("ENGINE", "INIT", "Data directory {}", config_.data_dir.string());
}

std::vector<Device> Engine::scan_and_record() {
  std::vector<Device> recorded;
  for (const auto &device : orchestrator_->scan_once()) {
    recorded.push_back(registry_->upsert(device));
  }
  return recorded;
}

std::optional<Device> Engine::probe_port(const std::string &device_path) {
  RawPort port;
  for (const auto &candidate : enumerator_->list_ports()) {
    if (candidate.device == device_path) {
      port = candidate;
      break;
    }
  }
  if (port.device.empty()) {
    LOG_WARN("ENGINE", device_path, "Port not enumerated, probing without USB ids");
    port.device = device_path;
    port.name = device_path;
  }

  try {
    return prober_->probe(port, false);
  } catch (const std::exception &ex) {
    LOG_ERROR("ENGINE", device_path, "Probe failed: {}", ex.what());
    return std::nullopt;
  }
}

} // namespace boardident
