#pragma once
#include "board-ident/EngineConfig.hpp"
#include "board-ident/acquisition/UidStrategy.hpp"
#include "board-ident/serial/SerialPort.hpp"

namespace boardident {
namespace acquisition {

/// Asks UID-reporting firmware for its identity: writes a single command
/// byte and expects a "UID: <hex>" line back.
class BOARD_IDENT_API DirectTextStrategy : public UidStrategy {
public:
  DirectTextStrategy(serial::SerialPortFactory &factory,
                     const DirectTextConfig &config);

  UidSource kind() const override { return UidSource::DirectText; }
  std::string name() const override { return "direct-text"; }
  bool applies_to(const Device &device) const override;
  std::optional<std::string> attempt(const Device &device) override;

  /// Uid from the first line containing "UID:", if it is at least
  /// `min_hex_digits` hex characters after normalisation
  static std::optional<std::string>
  parse_uid_response(const std::string &text, size_t min_hex_digits = 24);

private:
  std::optional<std::string> exchange(const std::string &port);

  serial::SerialPortFactory &factory_;
  DirectTextConfig config_;
};

} // namespace acquisition
} // namespace boardident
