#pragma once
#include "board-ident/EngineConfig.hpp"
#include "board-ident/acquisition/ToolLocator.hpp"
#include "board-ident/acquisition/UidStrategy.hpp"
#include "board-ident/process/ProcessRunner.hpp"

#include <array>

namespace boardident {
namespace acquisition {

/// Reads the UID words over SWD through a vendor debugger CLI. Tools are
/// tried in programmer_tools() order; a missing, failing or unparsable tool
/// moves on to the next one.
class BOARD_IDENT_API ProgrammerCliStrategy : public UidStrategy {
public:
  ProgrammerCliStrategy(process::CommandRunner &runner,
                        const ToolLocator &locator,
                        const ProgrammerConfig &config,
                        const UidAddressMap &addresses);

  UidSource kind() const override { return UidSource::ProgrammerCli; }
  std::string name() const override { return "programmer-cli"; }
  bool applies_to(const Device &device) const override;
  std::optional<std::string> attempt(const Device &device) override;

  /// First three 32-bit words printed after `address` on one line. Accepts
  /// "0x1FFF7A10 : w0 w1 w2", "0x1fff7a10: w0 w1 w2" and "1FFF7A10 = w0 w1 w2".
  static std::optional<std::array<uint32_t, 3>>
  parse_memory_words(const std::string &output, uint32_t address);

  /// UID text in memory byte order (little-endian words), matching the
  /// bootloader read of the same region
  static std::string words_to_uid(const std::array<uint32_t, 3> &words);

  std::vector<std::string> connect_command(ProgrammerTool tool,
                                           const std::string &executable,
                                           const Device &device) const;
  std::vector<std::string> read_command(ProgrammerTool tool,
                                        const std::string &executable,
                                        const Device &device,
                                        uint32_t address) const;

private:
  std::optional<std::string> try_tool(ProgrammerTool tool,
                                      const std::string &executable,
                                      const Device &device, uint32_t address);

  bool run_ok(const std::vector<std::string> &args, const std::string &tool_id,
              const std::string &port, std::string *output);

  process::CommandRunner &runner_;
  const ToolLocator &locator_;
  ProgrammerConfig config_;
  UidAddressMap addresses_;
};

} // namespace acquisition
} // namespace boardident
