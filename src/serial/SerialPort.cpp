#include "board-ident/serial/SerialPort.hpp"
#include "board-ident/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace boardident {
namespace serial {

std::vector<uint8_t> SerialPort::read_exact(size_t count,
                                            std::chrono::milliseconds timeout) {
  std::vector<uint8_t> out;
  out.reserve(count);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (out.size() < count) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      break;
    auto chunk = read(count - out.size(), remaining);
    if (chunk.empty())
      break; // timed out
    out.insert(out.end(), chunk.begin(), chunk.end());
  }
  return out;
}

int SerialPort::read_byte(std::chrono::milliseconds timeout) {
  auto bytes = read(1, timeout);
  if (bytes.empty())
    return -1;
  return bytes[0];
}

static speed_t to_speed(uint32_t baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    LOG_WARN("SERIAL", "BAUD", "Unsupported baud {}, falling back to 115200",
             baud);
    return B115200;
  }
}

// Raw 8N1, no flow control, VMIN=VTIME=0 (poll() handles timing)
static bool set_raw(int fd, speed_t baud) {
  termios tio{};
  if (tcgetattr(fd, &tio) != 0)
    return false;

  cfmakeraw(&tio);
  cfsetispeed(&tio, baud);
  cfsetospeed(&tio, baud);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tio) != 0)
    return false;
  tcflush(fd, TCIOFLUSH);
  return true;
}

PosixSerialPort::PosixSerialPort(const std::string &device, uint32_t baud)
    : device_(device) {
  fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    int err = errno;
    throw SerialError(fmt::format("cannot open {}: {}", device,
                                  std::strerror(err)),
                      err);
  }

  if (ioctl(fd_, TIOCEXCL) != 0) {
    int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw SerialError(fmt::format("cannot lock {}: {}", device,
                                  std::strerror(err)),
                      err);
  }

  if (!set_raw(fd_, to_speed(baud))) {
    int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw SerialError(fmt::format("cannot configure {}: {}", device,
                                  std::strerror(err)),
                      err);
  }
}

PosixSerialPort::~PosixSerialPort() {
  if (fd_ >= 0) {
    ioctl(fd_, TIOCNXCL);
    ::close(fd_);
  }
}

void PosixSerialPort::write(const std::vector<uint8_t> &data) {
  size_t written = 0;
  pollfd pfd{fd_, POLLOUT, 0};

  while (written < data.size()) {
    int pr = ::poll(&pfd, 1, 1000);
    if (pr == 0)
      throw SerialError(fmt::format("write timeout on {}", device_), ETIMEDOUT);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      throw SerialError(fmt::format("poll failed on {}: {}", device_,
                                    std::strerror(errno)),
                        errno);
    }
    ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR)
        continue;
      throw SerialError(fmt::format("write failed on {}: {}", device_,
                                    std::strerror(errno)),
                        errno);
    }
    written += static_cast<size_t>(n);
  }
  tcdrain(fd_);
}

std::vector<uint8_t> PosixSerialPort::read(size_t max_bytes,
                                           std::chrono::milliseconds timeout) {
  std::vector<uint8_t> out;
  if (max_bytes == 0)
    return out;

  pollfd pfd{fd_, POLLIN, 0};
  int pr;
  do {
    pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (pr < 0 && errno == EINTR);

  if (pr == 0)
    return out;
  if (pr < 0) {
    throw SerialError(fmt::format("poll failed on {}: {}", device_,
                                  std::strerror(errno)),
                      errno);
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    throw SerialError(fmt::format("{} hung up", device_), EIO);
  }

  out.resize(max_bytes);
  ssize_t n = ::read(fd_, out.data(), max_bytes);
  if (n < 0) {
    if (errno == EAGAIN || errno == EINTR) {
      out.clear();
      return out;
    }
    throw SerialError(fmt::format("read failed on {}: {}", device_,
                                  std::strerror(errno)),
                      errno);
  }
  out.resize(static_cast<size_t>(n));
  return out;
}

void PosixSerialPort::flush_input() { tcflush(fd_, TCIFLUSH); }

std::unique_ptr<SerialPort>
PosixSerialPortFactory::open(const std::string &device, uint32_t baud) {
  return std::make_unique<PosixSerialPort>(device, baud);
}

} // namespace serial
} // namespace boardident
