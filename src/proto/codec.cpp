#include "wirehdr/proto/codec.hpp"

#include <array>
#include <memory>
#include <new>
#include <sstream>
#include <string>
#include <vector>

#include "wirehdr/io/memory_stream.hpp"
#include "wirehdr/proto/byte_order.hpp"
#include "wirehdr/utils/log_config.hpp"

namespace wirehdr::proto {

namespace {

// フィールド領域（22バイト）内のオフセット
constexpr size_t kOffProvider = 0;
constexpr size_t kOffSession = 1;
constexpr size_t kOffContentType = 9;
constexpr size_t kOffAcceptType = 10;
constexpr size_t kOffAuthType = 11;
constexpr size_t kOffBodyLen = 12;
constexpr size_t kOffAuthLen = 16;
constexpr size_t kOffOpcode = 18;
constexpr size_t kOffStatus = 20;

std::shared_ptr<utils::Logger> codec_logger() {
  return utils::LogManager::instance().get_logger("wirehdr.codec");
}

std::string hex32(uint32_t v) {
  std::ostringstream ss;
  ss << "0x" << std::hex << v;
  return ss.str();
}

bool encode_fields(const WireHeader& h, std::span<std::uint8_t> out) noexcept {
  if (out.size() < kHeaderFieldsSize) return false;
  uint8_t* p = out.data();
  p[kOffProvider] = h.provider;
  write_le64(p + kOffSession, h.session);
  p[kOffContentType] = h.content_type;
  p[kOffAcceptType] = h.accept_type;
  p[kOffAuthType] = h.auth_type;
  write_le32(p + kOffBodyLen, h.body_len);
  write_le16(p + kOffAuthLen, h.auth_len);
  write_le16(p + kOffOpcode, h.opcode);
  write_le16(p + kOffStatus, h.status);
  return true;
}

wirehdr::Result<WireHeader> decode_fields(std::span<const std::uint8_t> in) noexcept {
  if (in.size() != kHeaderFieldsSize) {
    return make_error_code(WireErrc::invalid_encoding);
  }
  const uint8_t* p = in.data();
  WireHeader h{};
  h.provider = p[kOffProvider];
  h.session = read_le64(p + kOffSession);
  h.content_type = p[kOffContentType];
  h.accept_type = p[kOffAcceptType];
  h.auth_type = p[kOffAuthType];
  h.body_len = read_le32(p + kOffBodyLen);
  h.auth_len = read_le16(p + kOffAuthLen);
  h.opcode = read_le16(p + kOffOpcode);
  h.status = read_le16(p + kOffStatus);
  return h;
}

} // namespace

wirehdr::Result<FrameBytes> encode_frame(const WireHeader& h) noexcept {
  FrameBytes out{};
  write_le32(out.data(), kMagicNumber);
  write_le16(out.data() + 4, kRequestHeaderSize);
  out[kPreambleSize] = kWireProtocolVersionMajor;
  out[kPreambleSize + 1] = kWireProtocolVersionMinor;
  if (!encode_fields(h, std::span<std::uint8_t>(out).subspan(kPreambleSize + 2))) {
    return make_error_code(WireErrc::invalid_encoding);
  }
  return out;
}

std::error_code write_to_stream(const WireHeader& h, io::ByteWriter& out) noexcept {
  auto frame = encode_frame(h);
  if (!frame) {
    WIREHDR_LOG_ERROR(codec_logger(), "Failed to serialise wire header: " + to_string(h));
    return frame.error();
  }
  if (auto ec = out.write_all(frame.value())) {
    WIREHDR_LOG_ERROR(codec_logger(), "Failed to write wire header: " + ec.message());
    return make_error_code(WireErrc::connection_error);
  }
  WIREHDR_LOG_DEBUG(codec_logger(), "Wrote wire header: " + to_string(h));
  return {};
}

wirehdr::Result<WireHeader> read_from_stream(io::ByteReader& in) noexcept {
  auto log = codec_logger();

  std::array<std::uint8_t, 4> magic_bytes{};
  if (auto ec = in.read_exact(magic_bytes)) {
    WIREHDR_LOG_ERROR(log, "Failed to read magic number: " + ec.message());
    return make_error_code(WireErrc::connection_error);
  }
  const uint32_t magic = read_le32(magic_bytes.data());
  if (magic != kMagicNumber) {
    WIREHDR_LOG_ERROR(log, "Expected magic number " + hex32(kMagicNumber) + ", got " + hex32(magic));
    return make_error_code(WireErrc::invalid_header);
  }

  std::array<std::uint8_t, 2> size_bytes{};
  if (auto ec = in.read_exact(size_bytes)) {
    WIREHDR_LOG_ERROR(log, "Failed to read header size: " + ec.message());
    return make_error_code(WireErrc::connection_error);
  }
  const uint16_t hdr_size = read_le16(size_bytes.data());

  // 宣言長が不正でも先に読み切り、ストリームのバイト位置を保つ
  std::vector<std::uint8_t> bytes;
  try {
    bytes.resize(hdr_size);
  } catch (const std::bad_alloc&) {
    WIREHDR_LOG_ERROR(log, "Failed to allocate " + std::to_string(hdr_size) + " header bytes");
    return make_error_code(WireErrc::invalid_encoding);
  }
  if (auto ec = in.read_exact(bytes)) {
    WIREHDR_LOG_ERROR(log, "Failed to read " + std::to_string(hdr_size) + " header bytes: " + ec.message());
    return make_error_code(WireErrc::connection_error);
  }
  if (hdr_size != kRequestHeaderSize) {
    WIREHDR_LOG_ERROR(log, "Expected request header size " + std::to_string(kRequestHeaderSize) +
                           ", got " + std::to_string(hdr_size));
    return make_error_code(WireErrc::invalid_header);
  }

  const uint8_t version_maj = bytes[0];
  const uint8_t version_min = bytes[1];
  if (version_maj != kWireProtocolVersionMajor || version_min != kWireProtocolVersionMinor) {
    WIREHDR_LOG_ERROR(log, "Expected wire protocol version " +
                           std::to_string(kWireProtocolVersionMajor) + "." + std::to_string(kWireProtocolVersionMinor) +
                           ", got " + std::to_string(version_maj) + "." + std::to_string(version_min) + " instead");
    return make_error_code(WireErrc::wire_protocol_version_not_supported);
  }

  auto h = decode_fields(std::span<const std::uint8_t>(bytes).subspan(2));
  if (!h) {
    WIREHDR_LOG_ERROR(log, "Failed to decode wire header fields");
    return h.error();
  }
  WIREHDR_LOG_TRACE(log, "Decoded wire header: " + to_string(h.value()));
  return h;
}

wirehdr::Result<WireHeader> decode_frame(std::span<const std::uint8_t> bytes) noexcept {
  io::MemoryReader reader(bytes);
  return read_from_stream(reader);
}

std::string to_string(const WireHeader& h) {
  std::ostringstream ss;
  ss << "{provider=" << static_cast<unsigned>(h.provider)
     << ", session=" << h.session
     << ", content_type=" << static_cast<unsigned>(h.content_type)
     << ", accept_type=" << static_cast<unsigned>(h.accept_type)
     << ", auth_type=" << static_cast<unsigned>(h.auth_type)
     << ", body_len=" << h.body_len
     << ", auth_len=" << h.auth_len
     << ", opcode=" << h.opcode
     << ", status=" << h.status << '}';
  return ss.str();
}

} // namespace wirehdr::proto
