#pragma once
#include "board-ident/acquisition/UidStrategy.hpp"

#include <memory>
#include <vector>

namespace boardident {
namespace acquisition {

struct UidResult {
  std::string uid;
  UidSource source{UidSource::None};
};

/// Collaborator that writes a firmware image to a board
class BOARD_IDENT_API FirmwareFlasher {
public:
  virtual ~FirmwareFlasher() = default;
  virtual bool flash(const Device &device, const std::string &image) = 0;
};

/// Runs strategies in insertion order and stops at the first uid.
/// Strategies run strictly one after another on the same port.
class BOARD_IDENT_API UidAcquisitionChain {
public:
  UidAcquisitionChain() = default;

  void add_strategy(std::unique_ptr<UidStrategy> strategy);
  const std::vector<std::unique_ptr<UidStrategy>> &strategies() const {
    return strategies_;
  }

  /// Never throws; a throwing strategy counts as a failed one
  std::optional<UidResult> acquire(const Device &device);

  /// acquire(), and when that fails flash `image` and ask the
  /// UID-reporting firmware once more
  std::optional<UidResult> acquire_with_provisioning(const Device &device,
                                                     FirmwareFlasher *flasher,
                                                     const std::string &image);

private:
  std::optional<UidResult> run_strategy(UidStrategy &strategy,
                                        const Device &device);

  std::vector<std::unique_ptr<UidStrategy>> strategies_;
};

} // namespace acquisition
} // namespace boardident
