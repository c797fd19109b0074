#include "board-ident/acquisition/DirectTextStrategy.hpp"
#include "board-ident/Logger.hpp"

#include <sstream>
#include <thread>

namespace boardident {
namespace acquisition {

static const char *UID_TOKEN = "UID:";

DirectTextStrategy::DirectTextStrategy(serial::SerialPortFactory &factory,
                                       const DirectTextConfig &config)
    : factory_(factory), config_(config) {}

bool DirectTextStrategy::applies_to(const Device &device) const {
  return config_.enabled && !device.port.empty();
}

std::optional<std::string>
DirectTextStrategy::parse_uid_response(const std::string &text,
                                       size_t min_hex_digits) {
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    auto pos = line.find(UID_TOKEN);
    if (pos == std::string::npos)
      continue;

    pos += std::char_traits<char>::length(UID_TOKEN);
    auto begin = line.find_first_not_of(" \t", pos);
    if (begin == std::string::npos)
      return std::nullopt;
    auto end = line.find_first_of(" \t\r", begin);
    std::string token = line.substr(begin, end == std::string::npos
                                               ? std::string::npos
                                               : end - begin);

    std::string uid = normalize_uid(token);
    if (uid.size() < min_hex_digits)
      return std::nullopt;
    return uid;
  }
  return std::nullopt;
}

std::optional<std::string> DirectTextStrategy::attempt(const Device &device) {
  for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
    try {
      return exchange(device.port);
    } catch (const serial::SerialError &ex) {
      LOG_DEBUG("DIRECT", device.port, "Attempt {}/{} failed: {}", attempt,
                config_.max_attempts, ex.what());
    }
    if (attempt < config_.max_attempts)
      std::this_thread::sleep_for(config_.retry_delay);
  }
  return std::nullopt;
}

std::optional<std::string>
DirectTextStrategy::exchange(const std::string &port_path) {
  auto port = factory_.open(port_path, config_.baud);
  port->flush_input();
  port->write({static_cast<uint8_t>(config_.command)});

  std::string buffer;
  auto deadline = std::chrono::steady_clock::now() + config_.read_window;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      break;

    auto chunk = port->read(256, remaining);
    if (chunk.empty())
      break;
    buffer.append(chunk.begin(), chunk.end());

    // Stop as soon as the UID line is terminated
    auto pos = buffer.find(UID_TOKEN);
    if (pos != std::string::npos && buffer.find('\n', pos) != std::string::npos)
      break;
  }

  LOG_TRACE("DIRECT", port_path, "Received {} bytes", buffer.size());

  auto uid = parse_uid_response(buffer, config_.min_uid_hex_digits);
  if (uid) {
    LOG_DEBUG("DIRECT", port_path, "UID {}", *uid);
  }
  return uid;
}

} // namespace acquisition
} // namespace boardident
