#pragma once
#include "board-ident/registry/DeviceRegistry.hpp"
#include "board-ident/scan/ScanOrchestrator.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace boardident {
namespace scan {

enum class DeviceEventKind { Connected, Disconnected };

std::string to_string(DeviceEventKind kind);

using DeviceCallback = std::function<void(DeviceEventKind, const Device &)>;

/// Background loop that rescans on an interval and reports only the
/// differences between consecutive scans. Vanished devices are reported
/// (and marked in the registry) before new ones.
class BOARD_IDENT_API DeviceMonitor {
public:
  DeviceMonitor(ScanOrchestrator &orchestrator,
                registry::DeviceRegistry &registry,
                std::chrono::milliseconds interval = std::chrono::seconds(5),
                std::chrono::milliseconds stop_timeout = std::chrono::seconds(10));
  ~DeviceMonitor();

  DeviceMonitor(const DeviceMonitor &) = delete;
  DeviceMonitor &operator=(const DeviceMonitor &) = delete;

  /// False if already running
  bool start(DeviceCallback callback);
  void pause();
  void resume();

  /// Wake the loop and wait up to stop_timeout for it to finish. Returns
  /// false when a probe is still running; the loop then exits once that
  /// probe's own timeout expires, and the destructor waits for it.
  bool stop();

  bool is_running() const;
  bool is_paused() const;

  /// Run one scan-and-diff on the calling thread; returns the number of
  /// events emitted
  size_t poll_once();

  void set_callback(DeviceCallback callback);

private:
  struct LoopState {
    std::mutex mutex;
    std::condition_variable cv;
    bool running{false};
    bool paused{false};
    bool stop_requested{false};
  };

  void loop(std::shared_ptr<LoopState> state);
  void emit(DeviceEventKind kind, const Device &device);

  ScanOrchestrator &orchestrator_;
  registry::DeviceRegistry &registry_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds stop_timeout_;

  std::shared_ptr<LoopState> state_;
  std::thread thread_;
  std::future<void> finished_;

  std::mutex tick_mutex_;
  std::mutex callback_mutex_;
  DeviceCallback callback_;
  // scan id -> the record as the registry stored it
  std::map<std::string, Device> previous_;
};

} // namespace scan
} // namespace boardident
