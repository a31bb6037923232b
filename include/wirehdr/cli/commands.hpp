#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "wirehdr/proto/wire_header.hpp"
#include "wirehdr/utils/config_loader.hpp"
#include "wirehdr/utils/runtime_config.hpp"

namespace wirehdr::cli {

// 終了コード
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/**
 * @brief バイト列を小文字16進文字列へ
 */
std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * @brief 16進文字列をバイト列へ（空白と ':' は無視）
 * @return 奇数桁や16進以外の文字を含む場合 nullopt
 */
std::optional<std::vector<std::uint8_t>> from_hex(const std::string& text);

/**
 * @brief ヘッダーを整形済みJSONで出力
 */
std::string to_json(const proto::WireHeader& h);

/**
 * @brief --provider=N 等からヘッダーを組み立て
 *
 * 未指定のフィールドは0。フィールド幅に収まらない値や数値でない値は nullopt。
 */
std::optional<proto::WireHeader> header_from_args(const utils::ConfigLoader& args);

/**
 * @brief サブコマンドを実行
 * @param argc 引数数
 * @param argv 引数配列（argv[0] はプログラム名）
 * @param rc 実行時設定（io.timeout_ms を decode-file に適用）
 * @param out 結果の出力先
 * @param err 診断メッセージの出力先
 * @return kExitOk / kExitFailure（デコード失敗等）/ kExitUsage（使い方の誤り）
 */
int run(int argc, char** argv, const utils::RuntimeConfig& rc, std::ostream& out, std::ostream& err);

} // namespace wirehdr::cli
