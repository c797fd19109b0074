#include "board-ident/harvest/MetadataHarvester.hpp"
#include "board-ident/Logger.hpp"
#include "board-ident/acquisition/UidStrategy.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

namespace boardident {
namespace harvest {

namespace {

std::string trim(const std::string &text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

// First balanced {...} span, honouring quoted strings
std::optional<std::string> find_object_span(const std::string &text) {
  auto start = text.find('{');
  if (start == std::string::npos)
    return std::nullopt;

  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (in_string) {
      if (escaped)
        escaped = false;
      else if (c == '\\')
        escaped = true;
      else if (c == '"')
        in_string = false;
      continue;
    }
    if (c == '"')
      in_string = true;
    else if (c == '{')
      ++depth;
    else if (c == '}' && --depth == 0)
      return text.substr(start, i - start + 1);
  }
  return std::nullopt;
}

Attributes parse_json(const std::string &span) {
  Attributes attributes;
  auto j = nlohmann::json::parse(span, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    return attributes;

  for (const auto &[key, value] : j.items()) {
    std::string normalized = MetadataHarvester::normalize_key(key);
    if (normalized.empty())
      continue;
    attributes[normalized] =
        value.is_string() ? value.get<std::string>() : value.dump();
  }
  return attributes;
}

Attributes parse_lines(const std::string &text) {
  Attributes attributes;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    auto sep = line.find_first_of(":=");
    if (sep == std::string::npos)
      continue;
    std::string key = MetadataHarvester::normalize_key(line.substr(0, sep));
    if (key.empty())
      continue;
    attributes[key] = trim(line.substr(sep + 1));
  }
  return attributes;
}

} // namespace

MetadataHarvester::MetadataHarvester(serial::SerialPortFactory &factory,
                                     const HarvestConfig &config)
    : factory_(factory), config_(config) {}

std::string MetadataHarvester::normalize_key(const std::string &key) {
  std::string out;
  bool pending_space = false;
  for (char c : trim(key)) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      out.push_back('_');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

Attributes MetadataHarvester::parse(const std::string &text) {
  if (auto span = find_object_span(text)) {
    auto attributes = parse_json(*span);
    if (!attributes.empty())
      return attributes;
  }

  auto attributes = parse_lines(text);
  if (!attributes.empty())
    return attributes;

  static const std::regex hex_run("[0-9A-Fa-f]{24,}");
  std::smatch match;
  if (std::regex_search(text, match, hex_run))
    attributes["uid"] = match.str();
  return attributes;
}

void MetadataHarvester::apply(const Attributes &attributes,
                              const std::string &raw, Device &device) {
  for (const auto &[key, value] : attributes) {
    if (key == "uid") {
      if (device.uid && !device.uid->empty())
        continue;
      std::string uid = acquisition::normalize_uid(value);
      device.uid = uid.empty() ? value : uid;
      device.uid_source = UidSource::Harvested;
    } else if (key == "serial_number") {
      device.serial_number = value;
    } else if (key == "chip_id") {
      device.chip_id = value;
    } else if (key == "mac" || key == "mac_address") {
      device.mac_address = value;
    } else if (key == "firmware" || key == "firmware_version") {
      device.firmware_version = value;
    } else if (key == "hardware_version") {
      device.hardware_version = value;
    } else if (key == "flash_size") {
      device.flash_size = value;
    } else if (key == "cpu_frequency" || key == "cpu_freq") {
      device.cpu_frequency = value;
    } else if (key == "manufacturer") {
      device.manufacturer = value;
    } else if (key == "description") {
      device.description = value;
    } else {
      device.extra_info[key] = value;
    }
  }
  device.extra_info["raw_output"] = raw;
}

std::optional<std::string>
MetadataHarvester::capture(const std::string &port_path, uint32_t baud,
                           bool silent) {
  try {
    auto port = factory_.open(port_path, baud);
    std::string text;
    auto deadline = std::chrono::steady_clock::now() + config_.read_window;

    while (text.size() < config_.max_bytes) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0)
        break;
      auto chunk = port->read(config_.max_bytes - text.size(), remaining);
      if (chunk.empty())
        break;
      text.append(chunk.begin(), chunk.end());
    }

    if (text.empty())
      return std::nullopt;
    return text;
  } catch (const serial::SerialError &ex) {
    if (!silent) {
      LOG_DEBUG("HARVEST", port_path, "{} baud: {}", baud, ex.what());
    }
    return std::nullopt;
  }
}

bool MetadataHarvester::harvest(Device &device, bool silent) {
  for (uint32_t baud : config_.bauds) {
    auto text = capture(device.port, baud, silent);
    if (!text)
      continue;

    auto attributes = parse(*text);
    apply(attributes, *text, device);
    if (!silent) {
      LOG_DEBUG("HARVEST", device.port, "{} attributes from {} bytes at {} baud",
                attributes.size(), text->size(), baud);
    }
    return true;
  }
  return false;
}

} // namespace harvest
} // namespace boardident
