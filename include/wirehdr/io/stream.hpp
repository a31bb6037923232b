#pragma once

#include <cstdint>
#include <span>
#include <system_error>

namespace wirehdr::io {

/**
 * @brief ブロッキングな正確長読み込みを提供するバイト入力
 */
class ByteReader {
public:
  virtual ~ByteReader() = default;

  /**
   * @brief out を完全に埋めるまで読み込む
   * @return 成功時は空のエラーコード。途中でストリームが終わった場合もエラー
   */
  virtual std::error_code read_exact(std::span<std::uint8_t> out) noexcept = 0;
};

/**
 * @brief 全量書き込みを提供するバイト出力
 */
class ByteWriter {
public:
  virtual ~ByteWriter() = default;

  /**
   * @brief data をすべて書き込む
   * @return 成功時は空のエラーコード。一部のみ書けた場合もエラー
   */
  virtual std::error_code write_all(std::span<const std::uint8_t> data) noexcept = 0;
};

} // namespace wirehdr::io
