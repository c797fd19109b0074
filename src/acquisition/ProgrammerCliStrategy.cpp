#include "board-ident/acquisition/ProgrammerCliStrategy.hpp"
#include "board-ident/Logger.hpp"
#include "board-ident/serial/BoardClassifier.hpp"

#include <atomic>
#include <fstream>
#include <regex>
#include <unistd.h>

namespace boardident {
namespace acquisition {

namespace fs = std::filesystem;

namespace {

/// J-Link Commander only takes scripts from a file
class JLinkScript {
public:
  explicit JLinkScript(const std::string &body) {
    static std::atomic<unsigned> counter{0};
    path_ = fs::temp_directory_path() /
            fmt::format("board-ident-{}-{}.jlink", getpid(), counter++);
    std::ofstream ofs(path_);
    ofs << body;
  }
  ~JLinkScript() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  std::string path() const { return path_.string(); }

private:
  fs::path path_;
};

} // namespace

ProgrammerCliStrategy::ProgrammerCliStrategy(process::CommandRunner &runner,
                                             const ToolLocator &locator,
                                             const ProgrammerConfig &config,
                                             const UidAddressMap &addresses)
    : runner_(runner), locator_(locator), config_(config),
      addresses_(addresses) {}

bool ProgrammerCliStrategy::applies_to(const Device &device) const {
  if (!config_.enabled)
    return false;
  if (serial::is_debug_probe(device.vendor_id, device.product_id))
    return true;
  return !config_.debug_probes_only && device.board_kind == BoardKind::Stm32;
}

std::optional<std::array<uint32_t, 3>>
ProgrammerCliStrategy::parse_memory_words(const std::string &output,
                                          uint32_t address) {
  std::regex pattern(
      fmt::format("(?:0x)?{:08x}\\s*[:=]?\\s*([0-9a-f]{{8}})\\s+([0-9a-f]{{8}})"
                  "\\s+([0-9a-f]{{8}})",
                  address),
      std::regex::icase);

  std::smatch match;
  if (!std::regex_search(output, match, pattern))
    return std::nullopt;

  std::array<uint32_t, 3> words{};
  for (size_t i = 0; i < words.size(); ++i) {
    words[i] = static_cast<uint32_t>(std::stoul(match[i + 1].str(), nullptr, 16));
  }
  return words;
}

std::string
ProgrammerCliStrategy::words_to_uid(const std::array<uint32_t, 3> &words) {
  uint8_t bytes[12];
  for (size_t i = 0; i < words.size(); ++i) {
    for (size_t b = 0; b < 4; ++b)
      bytes[i * 4 + b] = static_cast<uint8_t>(words[i] >> (8 * b));
  }
  return hex_encode(bytes, sizeof(bytes));
}

std::vector<std::string>
ProgrammerCliStrategy::connect_command(ProgrammerTool tool,
                                       const std::string &executable,
                                       const Device &device) const {
  const std::string serial = device.serial_number.value_or("");

  switch (tool) {
  case ProgrammerTool::CubeProgrammer: {
    std::vector<std::string> args = {executable, "-c", "port=SWD"};
    if (!serial.empty())
      args.push_back("sn=" + serial);
    return args;
  }
  case ProgrammerTool::OpenOcd: {
    std::vector<std::string> args = {executable, "-f",
                                     config_.openocd_interface, "-f",
                                     config_.openocd_target};
    if (!serial.empty()) {
      args.insert(args.begin() + 3, {"-c", "adapter serial " + serial});
    }
    args.insert(args.end(), {"-c", "init", "-c", "exit"});
    return args;
  }
  case ProgrammerTool::JLink: {
    std::vector<std::string> args = {executable,  "-device", config_.jlink_device,
                                     "-if",       "SWD",     "-speed",
                                     "4000",      "-autoconnect", "1",
                                     "-ExitOnError", "1"};
    if (!serial.empty())
      args.insert(args.end(), {"-USB", serial});
    return args;
  }
  }
  return {};
}

std::vector<std::string>
ProgrammerCliStrategy::read_command(ProgrammerTool tool,
                                    const std::string &executable,
                                    const Device &device,
                                    uint32_t address) const {
  auto args = connect_command(tool, executable, device);
  const std::string hex_address = fmt::format("0x{:08X}", address);

  switch (tool) {
  case ProgrammerTool::CubeProgrammer:
    args.insert(args.end(), {"-r32", hex_address, "12"});
    break;
  case ProgrammerTool::OpenOcd:
    // Replace the trailing "-c exit" with the read and exit
    args.resize(args.size() - 2);
    args.insert(args.end(), {"-c", "mdw " + hex_address + " 3", "-c", "exit"});
    break;
  case ProgrammerTool::JLink:
    break; // the memory read lives in the command file
  }
  return args;
}

bool ProgrammerCliStrategy::run_ok(const std::vector<std::string> &args,
                                   const std::string &tool_id,
                                   const std::string &port,
                                   std::string *output) {
  auto result = runner_.run(args, config_.timeout);
  if (!result) {
    LOG_DEBUG("PROGRAMMER", port, "{} could not be started", tool_id);
    return false;
  }
  if (result->timed_out) {
    LOG_DEBUG("PROGRAMMER", port, "{} timed out", tool_id);
    return false;
  }
  if (result->exit_code != 0) {
    LOG_DEBUG("PROGRAMMER", port, "{} exited with {}", tool_id,
              result->exit_code);
    return false;
  }
  if (output)
    *output = std::move(result->output);
  return true;
}

std::optional<std::string>
ProgrammerCliStrategy::try_tool(ProgrammerTool tool,
                                const std::string &executable,
                                const Device &device, uint32_t address) {
  const std::string &tool_id = tool_descriptor(tool).id;
  std::string output;

  if (tool == ProgrammerTool::JLink) {
    JLinkScript connect("connect\nexit\n");
    auto args = connect_command(tool, executable, device);
    args.insert(args.end(), {"-CommandFile", connect.path()});
    if (!run_ok(args, tool_id, device.port, nullptr))
      return std::nullopt;

    JLinkScript read(fmt::format("connect\nmem32 0x{:08X}, 3\nexit\n", address));
    args = read_command(tool, executable, device, address);
    args.insert(args.end(), {"-CommandFile", read.path()});
    if (!run_ok(args, tool_id, device.port, &output))
      return std::nullopt;
  } else {
    if (!run_ok(connect_command(tool, executable, device), tool_id,
                device.port, nullptr))
      return std::nullopt;
    if (!run_ok(read_command(tool, executable, device, address), tool_id,
                device.port, &output))
      return std::nullopt;
  }

  auto words = parse_memory_words(output, address);
  if (!words) {
    LOG_DEBUG("PROGRAMMER", device.port, "Unparsable {} output", tool_id);
    return std::nullopt;
  }
  return words_to_uid(*words);
}

std::optional<std::string>
ProgrammerCliStrategy::attempt(const Device &device) {
  const uint32_t address = addresses_.address_for(device.board_kind);

  for (const auto &desc : programmer_tools()) {
    auto executable = locator_.locate(desc.tool);
    if (!executable)
      continue;

    LOG_DEBUG("PROGRAMMER", device.port, "Trying {} ({})", desc.id,
              *executable);
    if (auto uid = try_tool(desc.tool, *executable, device, address)) {
      LOG_DEBUG("PROGRAMMER", device.port, "UID {} via {}", *uid, desc.id);
      return uid;
    }
  }
  return std::nullopt;
}

} // namespace acquisition
} // namespace boardident
