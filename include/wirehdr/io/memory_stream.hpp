#pragma once

#include <cstdint>
#include <limits>
#include <span>
#include <utility>
#include <vector>

#include "wirehdr/io/stream.hpp"

namespace wirehdr::io {

/**
 * @brief 借用したバイト列から読み込むリーダー
 *
 * 要求長に満たない場合は残りをすべて消費した上でエラーを返す。
 */
class MemoryReader final : public ByteReader {
public:
  explicit MemoryReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

  std::error_code read_exact(std::span<std::uint8_t> out) noexcept override;

  size_t consumed() const noexcept { return pos_; }
  size_t remaining() const noexcept { return data_.size() - pos_; }

private:
  std::span<const std::uint8_t> data_;
  size_t pos_ = 0;
};

/**
 * @brief 内部バッファへ追記するライター
 */
class MemoryWriter final : public ByteWriter {
public:
  /**
   * @brief コンストラクタ
   * @param capacity_limit 書き込み可能な最大バイト数（超過分は書かずにエラー）
   */
  explicit MemoryWriter(size_t capacity_limit = std::numeric_limits<size_t>::max())
      : capacity_limit_(capacity_limit) {}

  std::error_code write_all(std::span<const std::uint8_t> data) noexcept override;

  const std::vector<std::uint8_t>& data() const noexcept { return buffer_; }
  std::vector<std::uint8_t> take() noexcept { return std::move(buffer_); }

private:
  std::vector<std::uint8_t> buffer_;
  size_t capacity_limit_;
};

} // namespace wirehdr::io
