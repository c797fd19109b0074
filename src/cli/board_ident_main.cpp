#include "board-ident/Engine.hpp"
#include "board-ident/Logger.hpp"
#include "board-ident/serial/BoardClassifier.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace boardident;
using json = nlohmann::json;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: board-ident [--config <file>] [--log-level <level>] "
               "<command> [options]\n\n";
  std::cout << "Discovery:\n";
  std::cout << "  scan [--json]                      Scan all serial ports\n";
  std::cout << "  monitor [--interval <s>]           Report connects and "
               "disconnects until Ctrl-C\n";
  std::cout << "  acquire <port>                     Read the UID of one port\n";
  std::cout << "  tools                              Show located programmer "
               "tools\n";
  std::cout << "\nRegistry:\n";
  std::cout << "  list [--json]                      List known devices\n";
  std::cout << "  show <id>                          Show one device as JSON\n";
  std::cout << "  remove <id>                        Forget a device\n";
  std::cout << "  search <query> [--fields a,b]      Case-insensitive search\n";
  std::cout << "  tag <tag> <id>...                  Add a tag\n";
  std::cout << "  untag <tag> <id>...                Remove a tag\n";
  std::cout << "  note <id> <text>                   Set notes\n";
  std::cout << "  rename <id> <name>                 Set the custom name\n";
  std::cout << "  stats                              Counts by status and board\n";
  std::cout << "\nTemplates:\n";
  std::cout << "  template save <name> <id> [--description <d>]\n";
  std::cout << "  template apply <name> <port>\n";
  std::cout << "  template list\n";
  std::cout << "  template delete <name>\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <file>      YAML configuration\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error "
               "(default: from config)\n";
}

static std::string display(const std::optional<std::string> &value) {
  return value && !value->empty() ? *value : "-";
}

static void print_device_row(const Device &d) {
  std::cout << fmt::format("{:<28} {:<14} {:<8} {:<13} {:>3}  {}\n",
                           d.get_unique_id(), d.port, to_string(d.board_kind),
                           to_string(d.status), d.health_score,
                           display(d.custom_name ? d.custom_name
                                                 : d.description));
}

static void print_device_table(const std::vector<Device> &devices) {
  std::cout << fmt::format("{:<28} {:<14} {:<8} {:<13} {:>3}  {}\n", "ID",
                           "PORT", "BOARD", "STATUS", "HP", "NAME");
  for (const auto &d : devices) {
    print_device_row(d);
  }
}

static std::vector<std::string> split(const std::string &text, char sep) {
  std::vector<std::string> parts;
  std::istringstream stream(text);
  std::string part;
  while (std::getline(stream, part, sep)) {
    if (!part.empty())
      parts.push_back(part);
  }
  return parts;
}

int cmd_scan(Engine &engine, int argc, char **argv);
int cmd_monitor(Engine &engine, int argc, char **argv);
int cmd_acquire(Engine &engine, int argc, char **argv);
int cmd_list(Engine &engine, int argc, char **argv);
int cmd_show(Engine &engine, int argc, char **argv);
int cmd_remove(Engine &engine, int argc, char **argv);
int cmd_search(Engine &engine, int argc, char **argv);
int cmd_tag(Engine &engine, int argc, char **argv, bool add);
int cmd_note(Engine &engine, int argc, char **argv);
int cmd_rename(Engine &engine, int argc, char **argv);
int cmd_template(Engine &engine, int argc, char **argv);
int cmd_stats(Engine &engine, int argc, char **argv);
int cmd_tools(Engine &engine, int argc, char **argv);

int main(int argc, char **argv) {
  std::string config_path;
  std::string log_level;

  int i = 1;
  for (; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      break;
    }
  }

  if (i >= argc) {
    print_usage();
    return 1;
  }

  std::string command = argv[i];
  int sub_argc = argc - i - 1;
  char **sub_argv = argv + i + 1;

  EngineConfig config;
  try {
    if (!config_path.empty())
      config = load_config(config_path);
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  if (command == "monitor") {
    for (int j = 0; j + 1 < sub_argc; j++) {
      if (std::string(sub_argv[j]) == "--interval") {
        try {
          config.scan.monitor_interval = std::chrono::milliseconds(
              static_cast<int64_t>(std::stod(sub_argv[j + 1]) * 1000));
        } catch (const std::exception &) {
          std::cerr << "Invalid interval: " << sub_argv[j + 1] << "\n";
          return 1;
        }
      }
    }
  }

  std::filesystem::path log_file = config.logging.file;
  if (log_file.is_relative())
    log_file = config.data_dir / log_file;
  try {
    std::filesystem::create_directories(config.data_dir);
  } catch (const std::exception &e) {
    std::cerr << "Cannot create data directory " << config.data_dir << ": "
              << e.what() << "\n";
    return 1;
  }
  EngineLogger::instance().init(
      log_file.string(),
      parse_log_level(log_level.empty() ? config.logging.level : log_level));

  try {
    Engine engine(config);
    int rc = 1;

    if (command == "scan") {
      rc = cmd_scan(engine, sub_argc, sub_argv);
    } else if (command == "monitor") {
      rc = cmd_monitor(engine, sub_argc, sub_argv);
    } else if (command == "acquire") {
      rc = cmd_acquire(engine, sub_argc, sub_argv);
    } else if (command == "list") {
      rc = cmd_list(engine, sub_argc, sub_argv);
    } else if (command == "show") {
      rc = cmd_show(engine, sub_argc, sub_argv);
    } else if (command == "remove") {
      rc = cmd_remove(engine, sub_argc, sub_argv);
    } else if (command == "search") {
      rc = cmd_search(engine, sub_argc, sub_argv);
    } else if (command == "tag") {
      rc = cmd_tag(engine, sub_argc, sub_argv, true);
    } else if (command == "untag") {
      rc = cmd_tag(engine, sub_argc, sub_argv, false);
    } else if (command == "note") {
      rc = cmd_note(engine, sub_argc, sub_argv);
    } else if (command == "rename") {
      rc = cmd_rename(engine, sub_argc, sub_argv);
    } else if (command == "template") {
      rc = cmd_template(engine, sub_argc, sub_argv);
    } else if (command == "stats") {
      rc = cmd_stats(engine, sub_argc, sub_argv);
    } else if (command == "tools") {
      rc = cmd_tools(engine, sub_argc, sub_argv);
    } else {
      std::cerr << "Unknown command: " << command << "\n\n";
      print_usage();
    }

    EngineLogger::instance().shutdown();
    return rc;
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("MAIN", command, "Command failed: {}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_scan(Engine &engine, int argc, char **argv) {
  bool as_json = false;
  for (int i = 0; i < argc; i++) {
    if (std::string(argv[i]) == "--json")
      as_json = true;
  }

  auto devices = engine.scan_and_record();

  if (as_json) {
    json out = json::array();
    for (const auto &d : devices) {
      out.push_back(d.to_json());
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (devices.empty()) {
    std::cout << "No devices found\n";
    return 0;
  }
  print_device_table(devices);
  return 0;
}

int cmd_monitor(Engine &engine, int argc, char **argv) {
  (void)argc; // --interval is applied to the config before the engine exists
  (void)argv;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto &monitor = engine.monitor();
  monitor.start([](scan::DeviceEventKind kind, const Device &device) {
    std::cout << (kind == scan::DeviceEventKind::Connected ? "+ " : "- ");
    print_device_row(device);
    std::cout.flush();
  });

  std::cout << "Monitoring serial ports, Ctrl-C to stop\n";
  while (g_running && monitor.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  return monitor.stop() ? 0 : 1;
}

int cmd_acquire(Engine &engine, int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: board-ident acquire <port>\n";
    return 1;
  }

  auto device = engine.probe_port(argv[0]);
  if (!device) {
    std::cerr << "Probe of " << argv[0] << " failed\n";
    return 1;
  }

  if (!device->uid) {
    std::cout << "No UID from " << argv[0] << " ("
              << to_string(device->board_kind) << ")\n";
    return 2;
  }

  std::cout << *device->uid << " (" << to_string(device->uid_source) << ")\n";
  return 0;
}

int cmd_list(Engine &engine, int argc, char **argv) {
  auto devices = engine.registry().list();

  for (int i = 0; i < argc; i++) {
    if (std::string(argv[i]) == "--json") {
      json out = json::object();
      for (const auto &d : devices) {
        out[d.get_unique_id()] = d.to_json();
      }
      std::cout << out.dump(2) << "\n";
      return 0;
    }
  }

  if (devices.empty()) {
    std::cout << "Registry is empty\n";
    return 0;
  }
  print_device_table(devices);
  return 0;
}

int cmd_show(Engine &engine, int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: board-ident show <id>\n";
    return 1;
  }

  auto device = engine.registry().get(argv[0]);
  if (!device) {
    std::cerr << "Device not found: " << argv[0] << "\n";
    return 1;
  }
  std::cout << device->to_json().dump(2) << "\n";
  return 0;
}

int cmd_remove(Engine &engine, int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: board-ident remove <id>\n";
    return 1;
  }

  if (!engine.registry().remove(argv[0])) {
    std::cerr << "Device not found: " << argv[0] << "\n";
    return 1;
  }
  std::cout << "Removed " << argv[0] << "\n";
  return 0;
}

int cmd_search(Engine &engine, int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: board-ident search <query> [--fields a,b]\n";
    return 1;
  }

  std::string query = argv[0];
  std::vector<registry::SearchField> fields = registry::default_search_fields();

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--fields" && i + 1 < argc) {
      fields.clear();
      for (const auto &name : split(argv[++i], ',')) {
        auto field = registry::search_field_from_string(name);
        if (!field) {
          std::cerr << "Unknown search field: " << name << "\n";
          return 1;
        }
        fields.push_back(*field);
      }
    }
  }

  auto devices = engine.registry().search(query, fields);
  if (devices.empty()) {
    std::cout << "No matches\n";
    return 0;
  }
  print_device_table(devices);
  return 0;
}

int cmd_tag(Engine &engine, int argc, char **argv, bool add) {
  if (argc < 2) {
    std::cerr << "Usage: board-ident " << (add ? "tag" : "untag")
              << " <tag> <id>...\n";
    return 1;
  }

  std::set<std::string> tags = {argv[0]};
  std::vector<std::string> ids(argv + 1, argv + argc);

  size_t changed = add ? engine.registry().add_tags(ids, tags)
                       : engine.registry().remove_tags(ids, tags);
  std::cout << "Updated " << changed << " of " << ids.size() << " devices\n";
  return 0;
}

int cmd_note(Engine &engine, int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: board-ident note <id> <text>\n";
    return 1;
  }

  if (engine.registry().set_notes({argv[0]}, argv[1]) == 0) {
    std::cerr << "Device not found: " << argv[0] << "\n";
    return 1;
  }
  return 0;
}

int cmd_rename(Engine &engine, int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: board-ident rename <id> <name>\n";
    return 1;
  }

  if (!engine.registry().set_custom_name(argv[0], argv[1])) {
    std::cerr << "Device not found: " << argv[0] << "\n";
    return 1;
  }
  return 0;
}

int cmd_template(Engine &engine, int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: board-ident template <save|apply|list|delete> ...\n";
    return 1;
  }

  auto &registry = engine.registry();
  std::string subcmd = argv[0];

  if (subcmd == "save") {
    if (argc < 3) {
      std::cerr << "Usage: board-ident template save <name> <id> "
                   "[--description <d>]\n";
      return 1;
    }
    std::string description;
    for (int i = 3; i < argc; i++) {
      std::string arg = argv[i];
      if (arg == "--description" && i + 1 < argc)
        description = argv[++i];
    }

    auto device = registry.get(argv[2]);
    if (!device) {
      std::cerr << "Device not found: " << argv[2] << "\n";
      return 1;
    }
    if (!registry.save_template(argv[1], *device, description)) {
      std::cerr << "Failed to save template " << argv[1] << "\n";
      return 1;
    }
    std::cout << "Saved template " << argv[1] << "\n";
    return 0;

  } else if (subcmd == "apply") {
    if (argc < 3) {
      std::cerr << "Usage: board-ident template apply <name> <port>\n";
      return 1;
    }
    auto device = registry.apply_template(argv[1], argv[2]);
    if (!device) {
      std::cerr << "Template not found: " << argv[1] << "\n";
      return 1;
    }
    Device stored = registry.upsert(*device);
    std::cout << "Registered " << stored.get_unique_id() << " from template "
              << argv[1] << "\n";
    return 0;

  } else if (subcmd == "list") {
    auto templates = registry.list_templates();
    if (templates.empty()) {
      std::cout << "No templates\n";
      return 0;
    }
    for (const auto &t : templates) {
      std::cout << fmt::format("{:<20} {:<8} {}\n", t.name,
                               to_string(t.board_kind), t.description);
    }
    return 0;

  } else if (subcmd == "delete") {
    if (argc < 2) {
      std::cerr << "Usage: board-ident template delete <name>\n";
      return 1;
    }
    if (!registry.delete_template(argv[1])) {
      std::cerr << "Template not found: " << argv[1] << "\n";
      return 1;
    }
    std::cout << "Deleted template " << argv[1] << "\n";
    return 0;
  }

  std::cerr << "Unknown template command: " << subcmd << "\n";
  return 1;
}

int cmd_stats(Engine &engine, int argc, char **argv) {
  (void)argc;
  (void)argv;

  auto stats = engine.registry().statistics();
  std::cout << "Total devices: " << stats.total << "\n";
  std::cout << "  connected:    " << stats.connected << "\n";
  std::cout << "  disconnected: " << stats.disconnected << "\n";
  std::cout << "By board:\n";
  for (const auto &[kind, count] : stats.by_kind) {
    std::cout << fmt::format("  {:<8} {}\n", to_string(kind), count);
  }

  auto io = engine.registry().stats();
  std::cout << "Registry writes: " << io.writes << " (" << io.write_failures
            << " failed)\n";
  return 0;
}

int cmd_tools(Engine &engine, int argc, char **argv) {
  (void)argc;
  (void)argv;

  for (const auto &desc : acquisition::programmer_tools()) {
    auto path = engine.tool_locator().locate(desc.tool);
    std::cout << fmt::format("{:<22} {}\n", desc.id,
                             path ? *path : "not found (set " + desc.env_var +
                                                ")");
  }
  return 0;
}
