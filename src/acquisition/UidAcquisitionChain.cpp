#include "board-ident/acquisition/UidAcquisitionChain.hpp"
#include "board-ident/Logger.hpp"

namespace boardident {
namespace acquisition {

void UidAcquisitionChain::add_strategy(std::unique_ptr<UidStrategy> strategy) {
  strategies_.push_back(std::move(strategy));
}

std::optional<UidResult>
UidAcquisitionChain::run_strategy(UidStrategy &strategy, const Device &device) {
  try {
    if (!strategy.applies_to(device))
      return std::nullopt;

    LOG_TRACE("CHAIN", device.port, "Trying {}", strategy.name());
    auto uid = strategy.attempt(device);
    if (!uid || uid->empty())
      return std::nullopt;

    return UidResult{*uid, strategy.kind()};
  } catch (const std::exception &ex) {
    LOG_WARN("CHAIN", device.port, "{} failed: {}", strategy.name(), ex.what());
    return std::nullopt;
  }
}

std::optional<UidResult> UidAcquisitionChain::acquire(const Device &device) {
  for (auto &strategy : strategies_) {
    if (auto result = run_strategy(*strategy, device)) {
      LOG_INFO("CHAIN", device.port, "UID {} via {}", result->uid,
               strategy->name());
      return result;
    }
  }
  LOG_DEBUG("CHAIN", device.port, "No strategy produced a UID");
  return std::nullopt;
}

std::optional<UidResult>
UidAcquisitionChain::acquire_with_provisioning(const Device &device,
                                               FirmwareFlasher *flasher,
                                               const std::string &image) {
  if (auto result = acquire(device))
    return result;
  if (!flasher)
    return std::nullopt;

  LOG_INFO("CHAIN", device.port, "Flashing UID firmware {}", image);
  try {
    if (!flasher->flash(device, image)) {
      LOG_ERROR("CHAIN", device.port, "Flashing {} failed", image);
      return std::nullopt;
    }
  } catch (const std::exception &ex) {
    LOG_ERROR("CHAIN", device.port, "Flashing {} failed: {}", image, ex.what());
    return std::nullopt;
  }

  for (auto &strategy : strategies_) {
    if (strategy->kind() == UidSource::DirectText)
      return run_strategy(*strategy, device);
  }
  return std::nullopt;
}

} // namespace acquisition
} // namespace boardident
