#pragma once

#include <string>
#include <system_error>

namespace wirehdr {

// ヘッダフレーマが返すエラー種別（プロトコルスタック共通の分類のうち4種）
enum class WireErrc {
  ok = 0,
  invalid_header = 1,
  connection_error = 2,
  invalid_encoding = 3,
  wire_protocol_version_not_supported = 4,
};

class WireErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "wirehdr"; }
  std::string message(int ev) const override {
    switch (static_cast<WireErrc>(ev)) {
      case WireErrc::ok: return "ok";
      case WireErrc::invalid_header: return "invalid header";
      case WireErrc::connection_error: return "connection error";
      case WireErrc::invalid_encoding: return "invalid encoding";
      case WireErrc::wire_protocol_version_not_supported: return "wire protocol version not supported";
      default: return "unknown error";
    }
  }
};

inline const std::error_category& wire_error_category() {
  static WireErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(WireErrc e) {
  return {static_cast<int>(e), wire_error_category()};
}

} // namespace wirehdr

namespace std {
template<> struct is_error_code_enum<wirehdr::WireErrc> : true_type {};
}
