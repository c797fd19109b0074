#pragma once
#include "board-ident/scan/DeviceProber.hpp"
#include "board-ident/serial/PortEnumerator.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace boardident {
namespace test {

class FakePortEnumerator : public serial::PortEnumerator {
public:
  void set_ports(std::vector<RawPort> ports) {
    std::lock_guard lock(mutex_);
    ports_ = std::move(ports);
  }

  std::vector<RawPort> list_ports() override {
    std::lock_guard lock(mutex_);
    ++calls_;
    return ports_;
  }

  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<RawPort> ports_;
  int calls_{0};
};

/// Builds devices straight from the raw port; selected ports throw.
/// Tracks how many probes run at once.
class ScriptedProber : public scan::PortProber {
public:
  void fail_port(const std::string &device) {
    std::lock_guard lock(mutex_);
    failing_.insert(device);
  }

  /// Throw something that is not a std::exception
  void fail_port_with_code(const std::string &device) {
    std::lock_guard lock(mutex_);
    failing_with_code_.insert(device);
  }

  void set_uid(const std::string &device, const std::string &uid) {
    std::lock_guard lock(mutex_);
    uids_[device] = uid;
  }

  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  Device probe(const RawPort &port, bool silent) override {
    (void)silent;
    int now = ++in_flight_;
    int seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }

    std::this_thread::sleep_for(delay_);

    Device device = scan::DeviceProber::from_raw_port(port);
    bool fail = false;
    bool fail_with_code = false;
    {
      std::lock_guard lock(mutex_);
      fail = failing_.count(port.device) > 0;
      fail_with_code = failing_with_code_.count(port.device) > 0;
      if (auto it = uids_.find(port.device); it != uids_.end()) {
        device.uid = it->second;
        device.uid_source = UidSource::DirectText;
      }
      ++probes_;
    }
    --in_flight_;

    if (fail)
      throw std::runtime_error("Permission denied: " + port.device);
    if (fail_with_code)
      throw 13;
    return device;
  }

  int peak_concurrency() const { return peak_.load(); }
  int in_flight() const { return in_flight_.load(); }
  int probes() const {
    std::lock_guard lock(mutex_);
    return probes_;
  }

private:
  mutable std::mutex mutex_;
  std::set<std::string> failing_;
  std::set<std::string> failing_with_code_;
  std::map<std::string, std::string> uids_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> peak_{0};
  int probes_{0};
};

} // namespace test
} // namespace boardident
