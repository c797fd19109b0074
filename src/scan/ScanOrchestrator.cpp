#include "board-ident/scan/ScanOrchestrator.hpp"
#include "board-ident/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

namespace boardident {
namespace scan {

ScanOrchestrator::ScanOrchestrator(serial::PortEnumerator &enumerator,
                                   PortProber &prober, size_t max_workers)
    : enumerator_(enumerator), prober_(prober),
      max_workers_(std::max<size_t>(1, max_workers)) {}

std::vector<Device> ScanOrchestrator::scan_once() { return run(false); }

std::vector<Device> ScanOrchestrator::scan_once_silent() { return run(true); }

std::vector<Device> ScanOrchestrator::run(bool silent) {
  std::vector<RawPort> ports;
  try {
    ports = enumerator_.list_ports();
  } catch (const std::exception &ex) {
    LOG_ERROR("SCAN", "ENUM", "Enumeration failed: {}", ex.what());
    return {};
  } catch (...) {
    LOG_ERROR("SCAN", "ENUM", "Enumeration failed: unknown exception");
    return {};
  }

  std::vector<Device> results;
  if (ports.empty())
    return results;

  std::mutex results_mutex;
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next++; i < ports.size(); i = next++) {
      try {
        Device device = prober_.probe(ports[i], silent);
        std::lock_guard lock(results_mutex);
        results.push_back(std::move(device));
      } catch (const std::exception &ex) {
        if (!silent) {
          LOG_DEBUG("SCAN", ports[i].device, "Probe failed: {}", ex.what());
        }
      } catch (...) {
        if (!silent) {
          LOG_DEBUG("SCAN", ports[i].device, "Probe failed: unknown exception");
        }
      }
    }
  };

  const size_t worker_count = std::min(max_workers_, ports.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    try {
      workers.emplace_back(worker);
    } catch (const std::system_error &ex) {
      LOG_WARN("SCAN", "POOL", "Started {} of {} workers: {}", workers.size(),
               worker_count, ex.what());
      break;
    }
  }

  // No thread could be started: probe on the calling thread
  if (workers.empty())
    worker();

  for (auto &t : workers) {
    t.join();
  }

  if (!silent) {
    LOG_INFO("SCAN", "DONE", "{} of {} ports identified", results.size(),
             ports.size());
  }
  return results;
}

} // namespace scan
} // namespace boardident
