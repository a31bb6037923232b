#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <system_error>

#include "wirehdr/io/stream.hpp"

namespace wirehdr::io {

/**
 * @brief ファイルディスクリプタ（ソケット/パイプ）上のリーダー兼ライター
 *
 * ディスクリプタは所有しない。部分転送はループで継続し、EINTR は再試行する。
 * 終端は connection_reset、EAGAIN/EWOULDBLOCK（受信/送信タイムアウト）は
 * timed_out として返す。切断済みソケットへの書き込みは SIGPIPE ではなく
 * broken_pipe になる。
 */
class FdStream final : public ByteReader, public ByteWriter {
public:
  explicit FdStream(int fd) noexcept : fd_(fd) {}

  std::error_code read_exact(std::span<std::uint8_t> out) noexcept override;
  std::error_code write_all(std::span<const std::uint8_t> data) noexcept override;

  /**
   * @brief 受信/送信タイムアウトを設定（ソケットのみ）
   * @param timeout タイムアウト時間（0で無制限）
   */
  std::error_code set_timeout(std::chrono::milliseconds timeout) noexcept;

private:
  int fd_;
};

} // namespace wirehdr::io
