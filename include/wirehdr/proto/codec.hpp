#pragma once

#include <cstdint>
#include <span>
#include <system_error>

#include "wirehdr/error.hpp"
#include "wirehdr/expected.hpp"
#include "wirehdr/io/stream.hpp"
#include "wirehdr/proto/wire_header.hpp"

namespace wirehdr::proto {

// 30バイト固定フレーム（マジック/ヘッダ長/バージョン/フィールド）を構築
wirehdr::Result<FrameBytes> encode_frame(const WireHeader& h) noexcept;

/**
 * @brief ヘッダフレームをストリームへ書き込む
 *
 * - フィールドのシリアライズ失敗: WireErrc::invalid_encoding
 * - 書き込み失敗: WireErrc::connection_error（ストリーム位置は不定）
 */
std::error_code write_to_stream(const WireHeader& h, io::ByteWriter& out) noexcept;

/**
 * @brief ストリームからヘッダフレームを読み込む
 *
 * 検査順序: マジック -> 宣言長ぶんの読み込み -> 宣言長 -> バージョン -> フィールド。
 * - マジック不一致、宣言長不一致: WireErrc::invalid_header
 *   （宣言長不一致の場合も宣言長ぶんは消費済み）
 * - 読み込み失敗（タイムアウト、途中終端を含む）: WireErrc::connection_error
 * - バージョンが 1.0 以外: WireErrc::wire_protocol_version_not_supported
 * - フィールドの構造的な復号失敗: WireErrc::invalid_encoding
 */
wirehdr::Result<WireHeader> read_from_stream(io::ByteReader& in) noexcept;

// 連続したバイト列から read_from_stream と同じ検査で復号
wirehdr::Result<WireHeader> decode_frame(std::span<const std::uint8_t> bytes) noexcept;

} // namespace wirehdr::proto
