#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wirehdr::utils {

/**
 * @brief ログレベル
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief ログエントリ
 */
struct LogEntry {
    LogLevel level;
    std::string logger_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string thread_id;
    std::string file;
    int line = 0;
    std::string function;
};

/**
 * @brief 統一ログフォーマッター
 */
class UnifiedLogFormatter {
public:
    /**
     * @brief フォーマット設定
     */
    struct FormatConfig {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
        std::string field_separator = " | ";
        bool json_output = false;  // trueで1行1オブジェクトのJSON
    };

    UnifiedLogFormatter();
    explicit UnifiedLogFormatter(const FormatConfig& config);

    /**
     * @brief ログエントリをフォーマット
     * @param entry ログエントリ
     * @return フォーマットされた文字列
     */
    std::string format(const LogEntry& entry) const;

    /**
     * @brief JSONフォーマットで出力（ファイル位置とスレッドIDを含む）
     */
    std::string format_json(const LogEntry& entry) const;

    /**
     * @brief 設定に従いテキストまたはJSONで出力（シンクはこれを使う）
     */
    std::string render(const LogEntry& entry) const;

private:
    FormatConfig config_;
    mutable std::mutex format_mutex_;

    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp) const;
};

/**
 * @brief ログシンク（出力先）
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    /**
     * @brief ログエントリを書き込み
     * @param entry ログエントリ
     */
    virtual void write(const LogEntry& entry) = 0;

    virtual void flush() {}
    virtual void close() {}

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

    /**
     * @brief フォーマッターを差し替え（未設定時は既定フォーマット）
     */
    void set_formatter(std::shared_ptr<UnifiedLogFormatter> formatter) { formatter_ = std::move(formatter); }

protected:
    LogLevel min_level_ = LogLevel::Trace;
    std::shared_ptr<UnifiedLogFormatter> formatter_ = std::make_shared<UnifiedLogFormatter>();
};

/**
 * @brief コンソールログシンク（stderr）
 */
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(bool use_colors = true);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex console_mutex_;
    std::string colorize(LogLevel level, const std::string& text) const;
};

/**
 * @brief ファイルログシンク
 */
class FileLogSink : public LogSink {
public:
    /**
     * @brief コンストラクタ
     * @param file_path ファイルパス
     * @param max_file_size 最大ファイルサイズ（0で無制限）
     * @param max_files 最大ファイル数（ローテーション用）
     */
    explicit FileLogSink(const std::filesystem::path& file_path,
                        size_t max_file_size = 10 * 1024 * 1024,  // 10MB
                        size_t max_files = 5);

    ~FileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;
    void close() override;

    bool is_open() const;

private:
    std::filesystem::path file_path_;
    size_t max_file_size_;
    size_t max_files_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex file_mutex_;
    size_t current_file_size_{0};

    void rotate_file();
    std::filesystem::path get_rotated_file_path(size_t index) const;
};

/**
 * @brief ロガークラス
 */
class Logger {
public:
    explicit Logger(const std::string& name);

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * @brief 指定レベルが出力対象か
     */
    bool should_log(LogLevel level) const;

    /**
     * @brief ログを出力
     * @param level ログレベル
     * @param message メッセージ
     * @param file ファイル名
     * @param line 行番号
     * @param function 関数名
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0, const std::string& function = "");

    void trace(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void debug(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void info(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void warning(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void error(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");
    void critical(const std::string& message, const std::string& file = "", int line = 0, const std::string& function = "");

    void flush();

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
    LogLevel min_level_;

    void write_to_sinks(const LogEntry& entry);
    std::string get_thread_id() const;
};

/**
 * @brief ログマネージャー
 */
class LogManager {
public:
    /**
     * @brief シングルトンインスタンスを取得
     */
    static LogManager& instance();

    /**
     * @brief ロガーを取得（存在しない場合は作成し、グローバルシンクを接続）
     * @param name ロガー名
     */
    std::shared_ptr<Logger> get_logger(const std::string& name);

    void remove_logger(const std::string& name);

    /**
     * @brief グローバルレベルを設定（既存ロガーにも反映）
     */
    void set_global_level(LogLevel level);
    LogLevel get_global_level() const;

    /**
     * @brief グローバルシンクを追加（既存ロガーにも接続）
     */
    void add_global_sink(std::shared_ptr<LogSink> sink);
    void clear_global_sinks();

    void flush_all();

private:
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    mutable std::mutex loggers_mutex_;
    LogLevel global_level_{LogLevel::Warning};
    std::vector<std::shared_ptr<LogSink>> global_sinks_;

    LogManager() = default;
    ~LogManager();
};

/**
 * @brief ログマクロ
 */
#define WIREHDR_LOG_TRACE(logger, message) \
    logger->trace(message, __FILE__, __LINE__, __FUNCTION__)

#define WIREHDR_LOG_DEBUG(logger, message) \
    logger->debug(message, __FILE__, __LINE__, __FUNCTION__)

#define WIREHDR_LOG_WARNING(logger, message) \
    logger->warning(message, __FILE__, __LINE__, __FUNCTION__)

#define WIREHDR_LOG_ERROR(logger, message) \
    logger->error(message, __FILE__, __LINE__, __FUNCTION__)

/**
 * @brief ログユーティリティ
 */
namespace log_utils {
    /**
     * @brief ログレベルを文字列から解析（不明な文字列は Info）
     */
    LogLevel parse_log_level(const std::string& level_str);

    std::string log_level_to_string(LogLevel level);

    std::shared_ptr<FileLogSink> create_rotating_file_sink(
        const std::filesystem::path& base_path,
        size_t max_size = 10 * 1024 * 1024,
        size_t max_files = 5
    );

    /**
     * @brief 基本ログ設定を初期化（既存のグローバルシンクは置き換える）
     * @param level 最小レベル
     * @param log_to_console コンソール出力有効
     * @param log_file ログファイルパス（空で無効）
     * @param json_output 全シンクをJSON出力にする
     */
    void setup_basic_logging(LogLevel level = LogLevel::Info,
                            bool log_to_console = true,
                            const std::filesystem::path& log_file = {},
                            bool json_output = false);
}

} // namespace wirehdr::utils
