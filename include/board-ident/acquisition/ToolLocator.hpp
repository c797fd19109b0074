#pragma once
#include "board-ident/export.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace boardident {
namespace acquisition {

enum class ProgrammerTool { CubeProgrammer, OpenOcd, JLink };

struct ToolDescriptor {
  ProgrammerTool tool;
  std::string id;         // config key, e.g. "openocd"
  std::string env_var;    // e.g. "BOARD_IDENT_OPENOCD"
  std::string executable; // name searched on PATH
  std::vector<std::string> install_globs; // "~" expands to $HOME
};

/// Tools in the order the programmer strategy tries them
const std::vector<ToolDescriptor> &programmer_tools();
const ToolDescriptor &tool_descriptor(ProgrammerTool tool);

/// Finds an executable by environment override, configured path, vendor
/// install locations and finally PATH.
class BOARD_IDENT_API ToolLocator {
public:
  explicit ToolLocator(std::map<std::string, std::string> configured = {},
                       std::filesystem::path tools_dir = {});

  std::optional<std::string> locate(ProgrammerTool tool) const;

private:
  std::optional<std::string> search_path(const std::string &executable) const;

  std::map<std::string, std::string> configured_;
  std::filesystem::path tools_dir_;
};

bool is_executable_file(const std::filesystem::path &path);

} // namespace acquisition
} // namespace boardident
