/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "serial_port.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#if defined(__APPLE__)
  #include <IOKit/serial/ioss.h>
#endif

#include <spdlog/spdlog.h>

namespace espflasher::posix_common {

using espflasher::core::Errc;
using espflasher::core::Result;
using espflasher::core::Status;

namespace {

std::optional<speed_t> speed_for(std::uint32_t baud) noexcept {
  switch (baud) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
#if defined(B460800)
    case 460800: return B460800;
#endif
#if defined(B921600)
    case 921600: return B921600;
#endif
#if defined(B1500000)
    case 1500000: return B1500000;
#endif
#if defined(B2000000)
    case 2000000: return B2000000;
#endif
    default: return std::nullopt;
  }
}

Status open_errno_status(const std::string& path, int e) {
  switch (e) {
    case ENOENT:
    case ENODEV:
    case ENXIO:
      return Status::Failf(Errc::DeviceNotFound, "Serial port {} not found", path);
    case EACCES:
    case EPERM:
      return Status::Failf(Errc::PermissionDenied,
                           "Permission denied opening {} (is your user in the dialout/uucp group?)", path);
    case EBUSY:
      return Status::Failf(Errc::PermissionDenied, "Serial port {} is in use by another program", path);
    default:
      return Status::Failf(Errc::Io, "Cannot open {}: {}", path, std::strerror(e));
  }
}

void sleep_ms(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

} // namespace

SerialPort::SerialPort(std::string path, std::uint32_t baud)
  : path_(std::move(path)), baud_(baud) {}

SerialPort::~SerialPort() { close(); }

SerialPort::SerialPort(SerialPort&& o) noexcept { *this = std::move(o); }

SerialPort& SerialPort::operator=(SerialPort&& o) noexcept {
  if (this == &o) return *this;
  close();
  fd_ = std::move(o.fd_);
  path_ = std::move(o.path_);
  baud_ = o.baud_;
  timeout_ms_ = o.timeout_ms_;
  write_timeout_ms_ = o.write_timeout_ms_;
  return *this;
}

Status SerialPort::open() noexcept {
  if (fd_.valid()) return Status::Ok();

  FileHandle fd{do_open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC)};
  if (!fd.valid()) return open_errno_status(path_, errno);

  if (do_ioctl(fd, TIOCEXCL, nullptr) < 0) {
    const int e = errno;
    return Status::Failf(Errc::PermissionDenied, "Cannot get exclusive access to {}: {}", path_, std::strerror(e));
  }

  termios tio{};
  if (do_tcgetattr(fd, &tio) != 0) return Status::Failf(Errc::Io, "{} is not a serial port", path_);

  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
  tio.c_cflag = (tio.c_cflag & ~CSIZE) | CS8;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  if (do_tcsetattr(fd, TCSANOW, &tio) != 0) return Status::Failf(Errc::Io, "Cannot configure {}", path_);

  fd_ = std::move(fd);

  auto st = apply_baud_();
  if (!st.ok) {
    fd_.close();
    return st;
  }

  discard_input();
  spdlog::debug("SerialPort: opened {} @ {}", path_, baud_);
  return Status::Ok();
}

void SerialPort::close() noexcept {
  if (!fd_.valid()) return;
  spdlog::debug("SerialPort: close {}", path_);
  (void)::ioctl(fd_.fd, TIOCNXCL, nullptr);
  fd_.close();
}

Status SerialPort::apply_baud_() noexcept {
  termios tio{};
  if (do_tcgetattr(fd_, &tio) != 0) return Status::Failf(Errc::Io, "tcgetattr failed on {}", path_);

  if (const auto sp = speed_for(baud_)) {
    ::cfsetispeed(&tio, *sp);
    ::cfsetospeed(&tio, *sp);
    if (do_tcsetattr(fd_, TCSANOW, &tio) != 0) return Status::Failf(Errc::Io, "Cannot set {} baud on {}", baud_, path_);
    return Status::Ok();
  }

#if defined(__APPLE__)
  speed_t custom = static_cast<speed_t>(baud_);
  if (do_ioctl(fd_, IOSSIOSPEED, &custom) < 0) return Status::Failf(Errc::Io, "Cannot set {} baud on {}", baud_, path_);
  return Status::Ok();
#else
  return Status::Failf(Errc::InvalidArgument, "Unsupported baud rate: {}", baud_);
#endif
}

Status SerialPort::set_baud(std::uint32_t baud) noexcept {
  const auto prev = baud_;
  baud_ = baud;
  if (!fd_.valid()) return Status::Ok();

  auto st = apply_baud_();
  if (!st.ok) {
    baud_ = prev;
    return st;
  }
  spdlog::debug("SerialPort: {} now @ {}", path_, baud_);
  return Status::Ok();
}

Status SerialPort::send(std::span<const std::uint8_t> data) noexcept {
  if (!connected()) return Status::Fail(Errc::Io, "SerialPort::send: port not open");

  const std::uint8_t* p = data.data();
  std::size_t left = data.size();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(write_timeout_ms_);

  while (left) {
    int ms_left = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count()
    );
    if (ms_left <= 0) {
      spdlog::warn("SerialPort::send: timeout (giving up)");
      return Status::Fail(Errc::Timeout, "Serial write timed out");
    }

    pollfd pfd{};
    pfd.fd = fd_.fd;
    pfd.events = POLLOUT;

    const int pr = ::poll(&pfd, 1, ms_left);
    if (pr == 0) continue;
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      spdlog::error("SerialPort::send: poll: {}", std::strerror(e));
      return Status::Failf(Errc::Io, "poll: {}", std::strerror(e));
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      spdlog::warn("SerialPort::send: device went away");
      return Status::Failf(Errc::DeviceNotFound, "{} disconnected", path_);
    }

    const ssize_t n = do_write(fd_, p, left);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      left -= static_cast<std::size_t>(n);
      continue;
    }

    const int e = errno;
    if (n < 0 && (e == EINTR || e == EAGAIN || e == EWOULDBLOCK)) continue;
    return Status::Failf(Errc::Io, "write to {} failed: {}", path_, std::strerror(e));
  }

  // Half-duplex protocol: the request must be on the wire before we start waiting.
  return drain_(deadline);
}

Status SerialPort::drain_(std::chrono::steady_clock::time_point deadline) noexcept {
#if defined(TIOCOUTQ)
  for (;;) {
    int pending = 0;
    if (::ioctl(fd_.fd, TIOCOUTQ, &pending) < 0) break;
    if (pending <= 0) return Status::Ok();
    if (std::chrono::steady_clock::now() >= deadline) {
      spdlog::warn("SerialPort::send: {} bytes still queued at the deadline", pending);
      return Status::Failf(Errc::Timeout, "Serial output on {} did not drain", path_);
    }
    sleep_ms(1);
  }
#endif
  // No output queue query on this tty; tcdrain has no deadline of its own.
  for (;;) {
    if (::tcdrain(fd_.fd) == 0) return Status::Ok();
    const int e = errno;
    if (e == EINTR) continue;
    spdlog::error("SerialPort::send: tcdrain: {}", std::strerror(e));
    return Status::Failf(Errc::Io, "tcdrain on {} failed: {}", path_, std::strerror(e));
  }
}

Result<std::size_t> SerialPort::recv(std::span<std::uint8_t> data) noexcept {
  if (!connected()) return Result<std::size_t>::Fail(Errc::Io, "SerialPort::recv: port not open");
  if (data.empty()) return Result<std::size_t>::Ok(0);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

  for (;;) {
    int ms_left = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count()
    );
    if (ms_left <= 0) return Result<std::size_t>::Fail(Errc::Timeout, "Serial read timed out");

    pollfd pfd{};
    pfd.fd = fd_.fd;
    pfd.events = POLLIN;

    const int pr = ::poll(&pfd, 1, ms_left);
    if (pr == 0) return Result<std::size_t>::Fail(Errc::Timeout, "Serial read timed out");
    if (pr < 0) {
      const int e = errno;
      if (e == EINTR) continue;
      spdlog::error("SerialPort::recv: poll: {}", std::strerror(e));
      return Result<std::size_t>::Failf(Errc::Io, "poll: {}", std::strerror(e));
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      spdlog::warn("SerialPort::recv: device went away");
      return Result<std::size_t>::Failf(Errc::DeviceNotFound, "{} disconnected", path_);
    }

    const ssize_t n = do_read(fd_, data.data(), data.size());
    if (n > 0) {
      if (spdlog::should_log(spdlog::level::trace)) spdlog::trace("SerialPort::recv {} bytes", n);
      return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
    }
    if (n == 0) continue;

    const int e = errno;
    if (e == EINTR || e == EAGAIN || e == EWOULDBLOCK) continue;
    return Result<std::size_t>::Failf(Errc::Io, "read from {} failed: {}", path_, std::strerror(e));
  }
}

void SerialPort::discard_input() noexcept {
  if (fd_.valid()) (void)::tcflush(fd_.fd, TCIFLUSH);
}

Status SerialPort::set_line_(int bit, bool on, const char* what) noexcept {
  int bits = bit;
  const int rc = on ? do_ioctl(fd_, TIOCMBIS, &bits) : do_ioctl(fd_, TIOCMBIC, &bits);
  if (rc < 0) return Status::Failf(Errc::Io, "Cannot drive {} on {}", what, path_);
  return Status::Ok();
}

Status SerialPort::set_lines(bool dtr, bool rts) noexcept {
  if (!connected()) return Status::Fail(Errc::Io, "SerialPort::set_lines: port not open");
  ESPF_TRY(set_line_(TIOCM_DTR, dtr, "DTR"));
  return set_line_(TIOCM_RTS, rts, "RTS");
}

// DTR drives IO0 and RTS drives EN through the usual transistor pair, both inverted.
Status SerialPort::reset(espflasher::core::ResetMode mode, bool into_bootloader) noexcept {
  using espflasher::core::ResetMode;
  if (!connected()) return Status::Fail(Errc::Io, "SerialPort::reset: port not open");
  if (mode == ResetMode::NoReset) return Status::Ok();

  if (!into_bootloader) {
    spdlog::debug("SerialPort: hard reset via RTS");
    ESPF_TRY(set_lines(false, true));
    sleep_ms(mode == ResetMode::UsbJtagReset ? 200 : 100);
    return set_lines(false, false);
  }

  if (mode == ResetMode::UsbJtagReset) {
    spdlog::debug("SerialPort: USB-JTAG reset into loader");
    ESPF_TRY(set_lines(false, false));
    sleep_ms(100);
    ESPF_TRY(set_lines(true, false));
    sleep_ms(100);
    ESPF_TRY(set_lines(false, true));
    sleep_ms(100);
    return set_lines(false, false);
  }

  spdlog::debug("SerialPort: classic reset into loader");
  ESPF_TRY(set_lines(false, true));
  sleep_ms(100);
  ESPF_TRY(set_lines(true, false));
  sleep_ms(50);
  ESPF_TRY(set_lines(false, false));
  discard_input();
  return Status::Ok();
}

} // namespace espflasher::posix_common
