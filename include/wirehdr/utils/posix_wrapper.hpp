#pragma once

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#include <winsock2.h>
using ssize_t = long long;
#else
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace wirehdr::utils {

class PosixWrapper {
public:
  static ssize_t readFd(int fd, void *buf, size_t count);
  static ssize_t writeFd(int fd, const void *buf, size_t count);
  // ソケットでは SIGPIPE を発生させずに EPIPE を返す。ソケット以外は writeFd と同じ
  static ssize_t sendFd(int fd, const void *buf, size_t count);
  static int closeFd(int fd);
  // SO_RCVTIMEO / SO_SNDTIMEO。ソケット以外では失敗する
  static int setRecvTimeout(int sock, std::chrono::milliseconds timeout);
  static int setSendTimeout(int sock, std::chrono::milliseconds timeout);
  static bool setEnv(const std::string &key, const std::string &value,
                     bool overwrite);
  static bool unsetEnv(const std::string &key);
};

#ifdef _WIN32
inline ssize_t PosixWrapper::readFd(int fd, void *buf, size_t count) {
  return _read(fd, buf, static_cast<unsigned int>(count));
}
inline ssize_t PosixWrapper::writeFd(int fd, const void *buf, size_t count) {
  return _write(fd, buf, static_cast<unsigned int>(count));
}
inline ssize_t PosixWrapper::sendFd(int fd, const void *buf, size_t count) {
  return writeFd(fd, buf, count);
}
inline int PosixWrapper::closeFd(int fd) { return _close(fd); }
inline int PosixWrapper::setRecvTimeout(int sock,
                                        std::chrono::milliseconds timeout) {
  DWORD ms = static_cast<DWORD>(timeout.count());
  return ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO,
                      reinterpret_cast<const char *>(&ms), sizeof(ms));
}
inline int PosixWrapper::setSendTimeout(int sock,
                                        std::chrono::milliseconds timeout) {
  DWORD ms = static_cast<DWORD>(timeout.count());
  return ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO,
                      reinterpret_cast<const char *>(&ms), sizeof(ms));
}
inline bool PosixWrapper::setEnv(const std::string &key,
                                 const std::string &value, bool overwrite) {
  if (!overwrite) {
    const char *existing = std::getenv(key.c_str());
    if (existing)
      return true;
  }
  return _putenv_s(key.c_str(), value.c_str()) == 0;
}
inline bool PosixWrapper::unsetEnv(const std::string &key) {
  return _putenv_s(key.c_str(), "") == 0;
}
#else
inline ssize_t PosixWrapper::readFd(int fd, void *buf, size_t count) {
  return ::read(fd, buf, count);
}
inline ssize_t PosixWrapper::writeFd(int fd, const void *buf, size_t count) {
  return ::write(fd, buf, count);
}
inline ssize_t PosixWrapper::sendFd(int fd, const void *buf, size_t count) {
#ifdef MSG_NOSIGNAL
  ssize_t n = ::send(fd, buf, count, MSG_NOSIGNAL);
  if (n < 0 && errno == ENOTSOCK)
    return writeFd(fd, buf, count);
  return n;
#else
  return writeFd(fd, buf, count);
#endif
}
inline int PosixWrapper::closeFd(int fd) { return ::close(fd); }
inline int PosixWrapper::setRecvTimeout(int sock,
                                        std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}
inline int PosixWrapper::setSendTimeout(int sock,
                                        std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}
inline bool PosixWrapper::setEnv(const std::string &key,
                                 const std::string &value, bool overwrite) {
  return ::setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0) == 0;
}
inline bool PosixWrapper::unsetEnv(const std::string &key) {
  return ::unsetenv(key.c_str()) == 0;
}
#endif

} // namespace wirehdr::utils
