#pragma once
#include "board-ident/export.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace boardident {
namespace serial {

/// Transient serial failure: port busy, permission denied, device gone.
class SerialError : public std::runtime_error {
public:
  SerialError(const std::string &message, int error_code = 0)
      : std::runtime_error(message), error_code_(error_code) {}

  int error_code() const { return error_code_; }

private:
  int error_code_;
};

/// Byte-level serial channel. Reads are bounded by an explicit timeout and
/// return whatever arrived; I/O failures throw SerialError.
class BOARD_IDENT_API SerialPort {
public:
  virtual ~SerialPort() = default;

  virtual const std::string &path() const = 0;

  virtual void write(const std::vector<uint8_t> &data) = 0;

  /// Wait up to `timeout` for data and return at most `max_bytes`.
  /// An empty result means the timeout expired.
  virtual std::vector<uint8_t> read(size_t max_bytes,
                                    std::chrono::milliseconds timeout) = 0;

  /// Discard anything buffered on the input side
  virtual void flush_input() = 0;

  /// Keep reading until `count` bytes arrived or `timeout` elapsed
  std::vector<uint8_t> read_exact(size_t count,
                                  std::chrono::milliseconds timeout);

  /// Read a single byte, or -1 on timeout
  int read_byte(std::chrono::milliseconds timeout);
};

class BOARD_IDENT_API SerialPortFactory {
public:
  virtual ~SerialPortFactory() = default;

  /// Open `device` in raw 8N1 mode. Throws SerialError on failure.
  virtual std::unique_ptr<SerialPort> open(const std::string &device,
                                           uint32_t baud) = 0;
};

/// termios-backed port. Opened exclusively (TIOCEXCL) so no second opener
/// can interleave with an in-flight exchange.
class BOARD_IDENT_API PosixSerialPort : public SerialPort {
public:
  PosixSerialPort(const std::string &device, uint32_t baud);
  ~PosixSerialPort() override;

  PosixSerialPort(const PosixSerialPort &) = delete;
  PosixSerialPort &operator=(const PosixSerialPort &) = delete;

  const std::string &path() const override { return device_; }
  void write(const std::vector<uint8_t> &data) override;
  std::vector<uint8_t> read(size_t max_bytes,
                            std::chrono::milliseconds timeout) override;
  void flush_input() override;

private:
  std::string device_;
  int fd_{-1};
};

class BOARD_IDENT_API PosixSerialPortFactory : public SerialPortFactory {
public:
  std::unique_ptr<SerialPort> open(const std::string &device,
                                   uint32_t baud) override;
};

} // namespace serial
} // namespace boardident
