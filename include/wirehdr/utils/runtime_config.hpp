#pragma once

#include <chrono>
#include <string>

#include "wirehdr/utils/config_loader.hpp"
#include "wirehdr/utils/log_config.hpp"

namespace wirehdr::utils {

// 環境変数プレフィックス（例: WIREHDR_LOG_LEVEL）
inline constexpr const char* kEnvPrefix = "WIREHDR_";

/**
 * @brief 実行時設定（ログ出力とI/Oタイムアウト）
 *
 * ワイヤーフォーマットの定数はここでは設定できない。
 */
struct RuntimeConfig {
    LogLevel log_level = LogLevel::Warning;
    bool log_to_console = true;
    std::string log_file{};
    bool log_json = false;  // log.format=json
    std::chrono::milliseconds io_timeout{0}; // 0で無制限

    /**
     * @brief 既定値を ConfigLoader に登録
     *
     * キー: log.level, log.console, log.file, log.format, io.timeout_ms
     */
    static void register_defaults(ConfigLoader& loader);

    /**
     * @brief ConfigLoader から解決
     */
    static RuntimeConfig from_loader(const ConfigLoader& loader);

    /**
     * @brief 既定値 -> WIREHDR_* 環境変数 -> --key=value の順で解決
     */
    static RuntimeConfig load(int argc, char* argv[]);
};

/**
 * @brief ログ設定を LogManager に反映
 */
void apply_logging(const RuntimeConfig& cfg);

} // namespace wirehdr::utils
