#include "board-ident/serial/PortEnumerator.hpp"
#include "board-ident/Logger.hpp"

#include <algorithm>
#include <fstream>

namespace boardident {
namespace serial {

namespace fs = std::filesystem;

// First line of a sysfs attribute, trimmed; nullopt when absent or empty
static std::optional<std::string> read_attribute(const fs::path &path) {
  std::ifstream ifs(path);
  if (!ifs)
    return std::nullopt;
  std::string line;
  std::getline(ifs, line);
  auto end = line.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return std::nullopt;
  auto begin = line.find_first_not_of(" \t");
  return line.substr(begin, end - begin + 1);
}

SysfsPortEnumerator::SysfsPortEnumerator(fs::path sysfs_root, fs::path dev_root)
    : sysfs_root_(std::move(sysfs_root)), dev_root_(std::move(dev_root)) {}

std::vector<RawPort> SysfsPortEnumerator::list_ports() {
  std::vector<RawPort> ports;
  fs::path tty_class = sysfs_root_ / "class" / "tty";

  try {
    if (!fs::is_directory(tty_class)) {
      LOG_WARN("ENUM", "SYSFS", "No tty class directory at {}",
               tty_class.string());
      return ports;
    }

    for (const auto &entry : fs::directory_iterator(tty_class)) {
      try {
        if (auto port = read_port(entry.path()))
          ports.push_back(std::move(*port));
      } catch (const fs::filesystem_error &ex) {
        LOG_DEBUG("ENUM", entry.path().filename().string(),
                  "Skipping tty: {}", ex.what());
      }
    }
  } catch (const std::exception &ex) {
    LOG_ERROR("ENUM", "SYSFS", "Port enumeration failed: {}", ex.what());
    return {};
  }

  std::sort(ports.begin(), ports.end(),
            [](const RawPort &a, const RawPort &b) { return a.device < b.device; });
  LOG_DEBUG("ENUM", "SYSFS", "Enumerated {} serial ports", ports.size());
  return ports;
}

std::optional<RawPort>
SysfsPortEnumerator::read_port(const fs::path &tty_entry) {
  fs::path device_link = tty_entry / "device";
  if (!fs::exists(device_link))
    return std::nullopt; // virtual console, pty, ...

  fs::path device_dir = fs::canonical(device_link);

  fs::path subsystem_link = device_dir / "subsystem";
  if (fs::exists(subsystem_link) &&
      fs::canonical(subsystem_link).filename() == "platform") {
    return std::nullopt; // legacy 8250 placeholders
  }

  RawPort port;
  port.name = tty_entry.filename().string();
  port.device = (dev_root_ / port.name).string();
  port.hwid = "n/a";

  // Walk up to the USB device node
  fs::path usb_dir;
  fs::path interface_dir = device_dir;
  for (fs::path p = device_dir; !p.empty() && p != p.root_path() &&
                                p != sysfs_root_;
       p = p.parent_path()) {
    if (fs::exists(p / "idVendor") && fs::exists(p / "idProduct")) {
      usb_dir = p;
      break;
    }
    interface_dir = p;
  }

  std::optional<std::string> interface_name =
      read_attribute(interface_dir / "interface");

  if (!usb_dir.empty()) {
    // sysfs reports bare hex ("0483")
    if (auto vid = read_attribute(usb_dir / "idVendor"))
      port.vendor_id = parse_usb_id("0x" + *vid);
    if (auto pid = read_attribute(usb_dir / "idProduct"))
      port.product_id = parse_usb_id("0x" + *pid);
    port.serial_number = read_attribute(usb_dir / "serial");
    port.manufacturer = read_attribute(usb_dir / "manufacturer");
    port.description = read_attribute(usb_dir / "product");
    port.location = interface_dir.filename().string();

    if (port.vendor_id && port.product_id) {
      port.hwid = fmt::format("USB VID:PID={:04X}:{:04X}", *port.vendor_id,
                              *port.product_id);
      if (port.serial_number)
        port.hwid += " SER=" + *port.serial_number;
      port.hwid += " LOCATION=" + port.location;
    }
  }

  if (!port.description)
    port.description = interface_name ? interface_name : port.name;

  return port;
}

} // namespace serial
} // namespace boardident
