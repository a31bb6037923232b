#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace wirehdr::proto {

// プロトコルファミリー識別子（バージョン非依存）
constexpr uint32_t kMagicNumber = 0x5EC0A710u;

constexpr uint8_t kWireProtocolVersionMajor = 1;
constexpr uint8_t kWireProtocolVersionMinor = 0;

// ヘッダ長フィールドが数えるバイト数（バージョン2バイト + フィールド22バイト）
constexpr uint16_t kRequestHeaderSize = 24;
constexpr size_t kHeaderFieldsSize = 22u;
// マジック(4) + ヘッダ長(2)
constexpr size_t kPreambleSize = 6u;
constexpr size_t kWireHeaderFrameSize = kPreambleSize + kRequestHeaderSize; // 30

using FrameBytes = std::array<std::uint8_t, kWireHeaderFrameSize>;

/**
 * @brief リクエスト/レスポンス共通のワイヤーヘッダ
 *
 * 各フィールドは生の整数値で、列挙値としての妥当性は上位層で検証する。
 * body_len / auth_len はヘッダの後に続くデータ長の宣言であり、
 * このヘッダの読み書きでは本体を読まない。
 */
struct WireHeader {
  uint8_t  provider = 0;      // プロバイダID
  uint64_t session = 0;       // セッションハンドル
  uint8_t  content_type = 0;  // ボディのエンコーディング
  uint8_t  accept_type = 0;   // 要求するレスポンスのエンコーディング
  uint8_t  auth_type = 0;     // 認証方式
  uint32_t body_len = 0;      // ボディのバイト数
  uint16_t auth_len = 0;      // 認証データのバイト数
  uint16_t opcode = 0;        // オペレーション
  uint16_t status = 0;        // レスポンスステータス（リクエストでは無視）

  bool operator==(const WireHeader&) const = default;
};

/**
 * @brief ログ/デバッグ用の1行表現
 */
std::string to_string(const WireHeader& h);

} // namespace wirehdr::proto
