#include "wirehdr/io/memory_stream.hpp"

#include <algorithm>
#include <new>

namespace wirehdr::io {

std::error_code MemoryReader::read_exact(std::span<std::uint8_t> out) noexcept {
  const size_t avail = data_.size() - pos_;
  if (out.size() > avail) {
    // 短い読み込み: 残りを捨ててストリーム終端に揃える
    pos_ = data_.size();
    return std::make_error_code(std::errc::io_error);
  }
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), out.size(), out.begin());
  pos_ += out.size();
  return {};
}

std::error_code MemoryWriter::write_all(std::span<const std::uint8_t> data) noexcept {
  const size_t room = capacity_limit_ - std::min(capacity_limit_, buffer_.size());
  const size_t n = std::min(room, data.size());
  try {
    buffer_.insert(buffer_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
  } catch (const std::bad_alloc&) {
    return std::make_error_code(std::errc::not_enough_memory);
  }
  if (n < data.size()) {
    return std::make_error_code(std::errc::no_buffer_space);
  }
  return {};
}

} // namespace wirehdr::io
