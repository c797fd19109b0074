#include "board-ident/scan/DeviceMonitor.hpp"
#include "board-ident/Logger.hpp"

#include <vector>

namespace boardident {
namespace scan {

std::string to_string(DeviceEventKind kind) {
  return kind == DeviceEventKind::Connected ? "connected" : "disconnected";
}

DeviceMonitor::DeviceMonitor(ScanOrchestrator &orchestrator,
                             registry::DeviceRegistry &registry,
                             std::chrono::milliseconds interval,
                             std::chrono::milliseconds stop_timeout)
    : orchestrator_(orchestrator), registry_(registry), interval_(interval),
      stop_timeout_(stop_timeout) {}

DeviceMonitor::~DeviceMonitor() {
  // The loop references this monitor, so a tick still inside a probe is
  // waited out rather than abandoned
  if (!stop() && thread_.joinable()) {
    thread_.join();
    LOG_INFO("MONITOR", "STOP", "Monitor stopped");
  }
}

void DeviceMonitor::set_callback(DeviceCallback callback) {
  std::lock_guard lock(callback_mutex_);
  callback_ = std::move(callback);
}

bool DeviceMonitor::start(DeviceCallback callback) {
  if (is_running()) {
    LOG_WARN("MONITOR", "START", "Monitor already running");
    return false;
  }

  // Reap a loop whose earlier stop() timed out
  if (thread_.joinable())
    thread_.join();

  set_callback(std::move(callback));

  state_ = std::make_shared<LoopState>();
  state_->running = true;

  std::promise<void> done;
  finished_ = done.get_future();
  thread_ = std::thread(
      [this, state = state_, done = std::move(done)]() mutable {
        loop(state);
        done.set_value();
      });

  LOG_INFO("MONITOR", "START", "Monitoring every {}ms", interval_.count());
  return true;
}

void DeviceMonitor::pause() {
  if (!state_)
    return;
  std::lock_guard lock(state_->mutex);
  state_->paused = true;
  LOG_INFO("MONITOR", "PAUSE", "Monitor paused");
}

void DeviceMonitor::resume() {
  if (!state_)
    return;
  {
    std::lock_guard lock(state_->mutex);
    state_->paused = false;
  }
  state_->cv.notify_all();
  LOG_INFO("MONITOR", "RESUME", "Monitor resumed");
}

bool DeviceMonitor::stop() {
  if (!state_ || !thread_.joinable())
    return true;

  {
    std::lock_guard lock(state_->mutex);
    state_->stop_requested = true;
  }
  state_->cv.notify_all();

  if (finished_.wait_for(stop_timeout_) != std::future_status::ready) {
    LOG_WARN("MONITOR", "STOP",
             "Monitor still inside a probe after {}ms, it will stop once the "
             "probe times out",
             stop_timeout_.count());
    return false;
  }

  thread_.join();
  LOG_INFO("MONITOR", "STOP", "Monitor stopped");
  return true;
}

bool DeviceMonitor::is_running() const {
  if (!state_)
    return false;
  std::lock_guard lock(state_->mutex);
  return state_->running;
}

bool DeviceMonitor::is_paused() const {
  if (!state_)
    return false;
  std::lock_guard lock(state_->mutex);
  return state_->paused;
}

void DeviceMonitor::loop(std::shared_ptr<LoopState> state) {
  while (true) {
    {
      std::unique_lock lk(state->mutex);
      if (state->stop_requested)
        break;
      if (state->paused) {
        state->cv.wait(lk,
                       [&] { return !state->paused || state->stop_requested; });
        continue;
      }
    }

    try {
      poll_once();
    } catch (const std::exception &ex) {
      LOG_ERROR("MONITOR", "TICK", "Monitor tick failed: {}", ex.what());
    } catch (...) {
      LOG_ERROR("MONITOR", "TICK", "Monitor tick failed: unknown exception");
    }

    std::unique_lock lk(state->mutex);
    state->cv.wait_for(lk, interval_, [&] { return state->stop_requested; });
  }

  std::lock_guard lock(state->mutex);
  state->running = false;
}

void DeviceMonitor::emit(DeviceEventKind kind, const Device &device) {
  DeviceCallback callback;
  {
    std::lock_guard lock(callback_mutex_);
    callback = callback_;
  }
  if (!callback)
    return;

  try {
    callback(kind, device);
  } catch (const std::exception &ex) {
    LOG_ERROR("MONITOR", device.port, "Event callback threw: {}", ex.what());
  } catch (...) {
    LOG_ERROR("MONITOR", device.port, "Event callback threw a non-standard "
                                      "exception");
  }
}

size_t DeviceMonitor::poll_once() {
  std::lock_guard tick(tick_mutex_);

  std::map<std::string, Device> current;
  for (auto &device : orchestrator_.scan_once_silent()) {
    std::string id = device.get_unique_id();
    current[id] = std::move(device);
  }

  std::vector<std::string> gone;
  for (const auto &[id, stored] : previous_) {
    if (current.count(id) == 0)
      gone.push_back(id);
  }
  std::vector<std::string> arrived;
  for (const auto &[id, device] : current) {
    if (previous_.count(id) == 0)
      arrived.push_back(id);
  }

  if (gone.empty() && arrived.empty())
    return 0;

  std::map<std::string, Device> next;
  for (const auto &[id, device] : current) {
    if (auto it = previous_.find(id); it != previous_.end())
      next[id] = it->second;
  }

  for (const auto &id : gone) {
    // The registry may hold the record under a stronger key than the scan saw
    const Device &last = previous_[id];
    const std::string stored_id = last.get_unique_id();
    registry_.mark_disconnected(stored_id);
    Device device = registry_.get(stored_id).value_or(last);
    device.status = ConnectionStatus::Disconnected;
    LOG_INFO("MONITOR", device.port, "Disconnected: {}", stored_id);
    emit(DeviceEventKind::Disconnected, device);
  }

  for (const auto &id : arrived) {
    Device stored = registry_.upsert(current[id]);
    LOG_INFO("MONITOR", stored.port, "Connected: {}", stored.get_unique_id());
    emit(DeviceEventKind::Connected, stored);
    next[id] = std::move(stored);
  }

  previous_ = std::move(next);
  return gone.size() + arrived.size();
}

} // namespace scan
} // namespace boardident
