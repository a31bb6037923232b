#include "wirehdr/io/fd_stream.hpp"

#include <cerrno>

#include "wirehdr/utils/posix_wrapper.hpp"

namespace wirehdr::io {

using wirehdr::utils::PosixWrapper;

static std::error_code errno_to_error(int err) noexcept {
  if (err == EAGAIN || err == EWOULDBLOCK) {
    return std::make_error_code(std::errc::timed_out);
  }
  return {err, std::system_category()};
}

std::error_code FdStream::read_exact(std::span<std::uint8_t> out) noexcept {
  size_t done = 0;
  while (done < out.size()) {
    ssize_t n = PosixWrapper::readFd(fd_, out.data() + done, out.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno_to_error(errno);
    }
    if (n == 0) {
      return std::make_error_code(std::errc::connection_reset);
    }
    done += static_cast<size_t>(n);
  }
  return {};
}

std::error_code FdStream::write_all(std::span<const std::uint8_t> data) noexcept {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t n = PosixWrapper::sendFd(fd_, data.data() + done, data.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno_to_error(errno);
    }
    if (n == 0) {
      return std::make_error_code(std::errc::connection_reset);
    }
    done += static_cast<size_t>(n);
  }
  return {};
}

std::error_code FdStream::set_timeout(std::chrono::milliseconds timeout) noexcept {
  if (timeout.count() < 0) {
    return std::make_error_code(std::errc::invalid_argument);
  }
  if (PosixWrapper::setRecvTimeout(fd_, timeout) != 0) return errno_to_error(errno);
  if (PosixWrapper::setSendTimeout(fd_, timeout) != 0) return errno_to_error(errno);
  return {};
}

} // namespace wirehdr::io
