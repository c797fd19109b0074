#include "board-ident/acquisition/ToolLocator.hpp"
#include "board-ident/Logger.hpp"

#include <cstdlib>
#include <glob.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace boardident {
namespace acquisition {

namespace fs = std::filesystem;

const std::vector<ToolDescriptor> &programmer_tools() {
  static const std::vector<ToolDescriptor> tools = {
      {ProgrammerTool::CubeProgrammer,
       "stm32_programmer_cli",
       "BOARD_IDENT_STM32_PROGRAMMER_CLI",
       "STM32_Programmer_CLI",
       {"~/STMicroelectronics/STM32Cube/STM32CubeProgrammer/bin/"
        "STM32_Programmer_CLI",
        "/usr/local/STMicroelectronics/STM32Cube/STM32CubeProgrammer/bin/"
        "STM32_Programmer_CLI",
        "/opt/st/stm32cubeclt*/STM32CubeProgrammer/bin/STM32_Programmer_CLI"}},
      {ProgrammerTool::OpenOcd,
       "openocd",
       "BOARD_IDENT_OPENOCD",
       "openocd",
       {"/opt/openocd*/bin/openocd", "/opt/st/stm32cubeclt*/*/bin/openocd"}},
      {ProgrammerTool::JLink,
       "jlink",
       "BOARD_IDENT_JLINK",
       "JLinkExe",
       {"/opt/SEGGER/JLink/JLinkExe", "/opt/SEGGER/JLink_V*/JLinkExe"}},
  };
  return tools;
}

const ToolDescriptor &tool_descriptor(ProgrammerTool tool) {
  for (const auto &desc : programmer_tools()) {
    if (desc.tool == tool)
      return desc;
  }
  throw std::invalid_argument("unknown programmer tool");
}

bool is_executable_file(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

static std::string expand_home(const std::string &pattern) {
  if (pattern.empty() || pattern[0] != '~')
    return pattern;
  const char *home = std::getenv("HOME");
  if (!home)
    return pattern;
  return std::string(home) + pattern.substr(1);
}

// Last match wins so the newest versioned install directory is preferred
static std::optional<std::string> glob_last(const std::string &pattern) {
  glob_t results{};
  std::optional<std::string> found;
  if (glob(pattern.c_str(), 0, nullptr, &results) == 0) {
    for (size_t i = results.gl_pathc; i > 0; --i) {
      if (is_executable_file(results.gl_pathv[i - 1])) {
        found = results.gl_pathv[i - 1];
        break;
      }
    }
  }
  globfree(&results);
  return found;
}

ToolLocator::ToolLocator(std::map<std::string, std::string> configured,
                         fs::path tools_dir)
    : configured_(std::move(configured)), tools_dir_(std::move(tools_dir)) {}

std::optional<std::string>
ToolLocator::search_path(const std::string &executable) const {
  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return std::nullopt;

  std::istringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty())
      continue;
    fs::path candidate = fs::path(dir) / executable;
    if (is_executable_file(candidate))
      return candidate.string();
  }
  return std::nullopt;
}

std::optional<std::string> ToolLocator::locate(ProgrammerTool tool) const {
  const ToolDescriptor &desc = tool_descriptor(tool);

  if (const char *env = std::getenv(desc.env_var.c_str()); env && *env) {
    if (is_executable_file(env))
      return std::string(env);
    LOG_WARN("TOOLS", desc.id, "{} points to a non-executable: {}",
             desc.env_var, env);
  }

  if (auto it = configured_.find(desc.id); it != configured_.end()) {
    if (is_executable_file(it->second))
      return it->second;
    LOG_WARN("TOOLS", desc.id, "Configured path is not executable: {}",
             it->second);
  }

  if (!tools_dir_.empty()) {
    fs::path bundled = tools_dir_ / desc.executable;
    if (is_executable_file(bundled))
      return bundled.string();
  }

  for (const auto &pattern : desc.install_globs) {
    if (auto found = glob_last(expand_home(pattern)))
      return found;
  }

  auto on_path = search_path(desc.executable);
  if (!on_path) {
    LOG_DEBUG("TOOLS", desc.id, "{} not found", desc.executable);
  }
  return on_path;
}

} // namespace acquisition
} // namespace boardident
