#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace wirehdr::utils {

/**
 * @brief 設定値の型
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    bool
>;

/**
 * @brief キー/値設定の読み込み・管理クラス
 *
 * 優先順位は後から読み込んだものが勝つ: デフォルト -> 環境変数 -> コマンドライン。
 * 環境変数やコマンドライン由来の値は文字列で保持し、型付き取得時に変換する。
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief デフォルト設定を読み込み
     * @param defaults デフォルト設定マップ
     */
    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    /**
     * @brief 既知キーを環境変数で上書き
     * @param prefix 環境変数のプレフィックス（例："WIREHDR_"）。
     *        キー "io.timeout_ms" は "WIREHDR_IO_TIMEOUT_MS" を参照する
     * @return 読み込まれた設定数
     */
    size_t load_from_environment(const std::string& prefix = "");

    /**
     * @brief コマンドライン引数（--key=value）から設定を読み込み
     * @param argc 引数数
     * @param argv 引数配列
     * @return 読み込まれた設定数
     */
    size_t load_from_command_line(int argc, char* argv[]);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /**
     * @brief 整数として設定値を取得（文字列は10進/0x付き16進を解釈）
     */
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;

    /**
     * @brief 符号なし整数として設定値を取得（負数や解析失敗はデフォルト値）
     */
    uint64_t get_uint(const std::string& key, uint64_t default_value = 0) const;

    /**
     * @brief 真偽値として設定値を取得（"1"/"true"/"yes"/"on" を真とする）
     */
    bool get_bool(const std::string& key, bool default_value = false) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lk(config_mutex_);
        config_data_[key] = ConfigValue{value};
    }

    bool has(const std::string& key) const;
    bool remove(const std::string& key);
    void clear();

    std::vector<std::string> get_all_keys() const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;

    std::optional<ConfigValue> find_value(const std::string& key) const;
};

/**
 * @brief 設定ユーティリティ
 */
namespace config_utils {
    /**
     * @brief 環境変数名を正規化（'.' -> '_'、大文字化）
     * @param key キー
     * @param prefix プレフィックス
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "");

    std::optional<std::string> get_env_var(const std::string& env_var_name);

    bool parse_bool(const std::string& str);

    /**
     * @brief 整数文字列を解析（10進、または0x付き16進）
     * @return 解析できない場合nullopt
     */
    std::optional<int64_t> parse_int(const std::string& str);
    std::optional<uint64_t> parse_uint(const std::string& str);
}

} // namespace wirehdr::utils
