#include "wirehdr/utils/log_config.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace wirehdr::utils {

namespace {

std::tm to_local_tm(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

const char* level_tag(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "OFF";
    }
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace

// UnifiedLogFormatter
UnifiedLogFormatter::UnifiedLogFormatter() : config_{} {}
UnifiedLogFormatter::UnifiedLogFormatter(const FormatConfig& config) : config_(config) {}

std::string UnifiedLogFormatter::format_timestamp(const std::chrono::system_clock::time_point& tp) const {
    std::tm tm = to_local_tm(tp);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), config_.timestamp_format.c_str(), &tm);
    return std::string(buf, n);
}

std::string UnifiedLogFormatter::format(const LogEntry& e) const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    std::ostringstream ss;
    ss << format_timestamp(e.timestamp) << config_.field_separator << level_tag(e.level)
       << config_.field_separator << e.logger_name << config_.field_separator << e.message;
    return ss.str();
}

std::string UnifiedLogFormatter::format_json(const LogEntry& e) const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    std::ostringstream ss;
    ss << '{' << "\"time\":\"" << format_timestamp(e.timestamp) << "\","
       << "\"level\":\"" << level_tag(e.level) << "\","
       << "\"logger\":\"" << json_escape(e.logger_name) << "\","
       << "\"msg\":\"" << json_escape(e.message) << '"';
    if (!e.thread_id.empty()) ss << ",\"thread\":\"" << json_escape(e.thread_id) << '"';
    if (!e.file.empty()) ss << ",\"file\":\"" << json_escape(e.file) << "\",\"line\":" << e.line;
    ss << '}';
    return ss.str();
}

std::string UnifiedLogFormatter::render(const LogEntry& e) const {
    return config_.json_output ? format_json(e) : format(e);
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(bool use_colors) : use_colors_(use_colors) {}

std::string ConsoleLogSink::colorize(LogLevel level, const std::string& text) const {
    if (!use_colors_) return text;
    const char* c = "\033[0m";
    switch (level) {
        case LogLevel::Trace: c = "\033[37m"; break;
        case LogLevel::Debug: c = "\033[36m"; break;
        case LogLevel::Info: c = "\033[32m"; break;
        case LogLevel::Warning: c = "\033[33m"; break;
        case LogLevel::Error: c = "\033[31m"; break;
        case LogLevel::Critical: c = "\033[35m"; break;
        default: break;
    }
    return std::string(c) + text + "\033[0m";
}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(console_mutex_);
    std::cerr << colorize(entry.level, formatter_->render(entry)) << '\n';
}

void ConsoleLogSink::flush() { std::lock_guard<std::mutex> lk(console_mutex_); std::cerr.flush(); }

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& file_path, size_t max_file_size, size_t max_files)
    : file_path_(file_path), max_file_size_(max_file_size), max_files_(max_files) {
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::app);
    std::error_code ec;
    auto sz = std::filesystem::file_size(file_path_, ec);
    if (!ec) current_file_size_ = static_cast<size_t>(sz);
}

FileLogSink::~FileLogSink() { close(); }

bool FileLogSink::is_open() const {
    std::lock_guard<std::mutex> lk(file_mutex_);
    return file_stream_ && file_stream_->is_open();
}

void FileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) return;
    std::string line = formatter_->render(entry);
    (*file_stream_) << line << '\n';
    current_file_size_ += line.size() + 1;
    if (max_file_size_ && current_file_size_ > max_file_size_) rotate_file();
}

void FileLogSink::flush() { std::lock_guard<std::mutex> lk(file_mutex_); if (file_stream_) file_stream_->flush(); }

void FileLogSink::close() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) { file_stream_->flush(); file_stream_->close(); }
}

void FileLogSink::rotate_file() {
    if (!file_stream_) return;
    file_stream_->close();
    std::error_code ec;
    // app.log.(n-1) -> app.log.n ... app.log -> app.log.1
    for (size_t i = max_files_; i-- > 1;) {
        std::filesystem::remove(get_rotated_file_path(i), ec);
        std::filesystem::rename(get_rotated_file_path(i - 1), get_rotated_file_path(i), ec);
    }
    if (max_files_ > 0) {
        std::filesystem::rename(file_path_, get_rotated_file_path(0), ec);
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::trunc);
    current_file_size_ = 0;
}

std::filesystem::path FileLogSink::get_rotated_file_path(size_t index) const {
    std::filesystem::path p = file_path_;
    p += "." + std::to_string(index + 1);
    return p;
}

// Logger
Logger::Logger(const std::string& name) : name_(name), min_level_(LogLevel::Info) {}
void Logger::add_sink(std::shared_ptr<LogSink> s) { std::lock_guard<std::mutex> lk(sinks_mutex_); sinks_.push_back(std::move(s)); }
void Logger::remove_sink(const std::shared_ptr<LogSink>& s) { std::lock_guard<std::mutex> lk(sinks_mutex_); sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end()); }
void Logger::set_level(LogLevel l) { std::lock_guard<std::mutex> lk(sinks_mutex_); min_level_ = l; }
LogLevel Logger::get_level() const { std::lock_guard<std::mutex> lk(sinks_mutex_); return min_level_; }
bool Logger::should_log(LogLevel l) const { return l != LogLevel::Off && l >= get_level(); }
void Logger::write_to_sinks(const LogEntry& e) { std::lock_guard<std::mutex> lk(sinks_mutex_); for (auto& s : sinks_) if (e.level >= s->get_min_level()) s->write(e); }
std::string Logger::get_thread_id() const { std::ostringstream ss; ss << std::this_thread::get_id(); return ss.str(); }

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line, const std::string& function) {
    if (!should_log(level)) return;
    LogEntry e{level, name_, message, std::chrono::system_clock::now(), get_thread_id(), file, line, function};
    write_to_sinks(e);
}

void Logger::trace(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Trace, m, f, l, fn); }
void Logger::debug(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Debug, m, f, l, fn); }
void Logger::info(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Info, m, f, l, fn); }
void Logger::warning(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Warning, m, f, l, fn); }
void Logger::error(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Error, m, f, l, fn); }
void Logger::critical(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Critical, m, f, l, fn); }

void Logger::flush() { std::lock_guard<std::mutex> lk(sinks_mutex_); for (auto& s : sinks_) s->flush(); }

// LogManager
LogManager& LogManager::instance() { static LogManager inst; return inst; }
LogManager::~LogManager() { flush_all(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto l = std::make_shared<Logger>(name);
    l->set_level(global_level_);
    for (auto& s : global_sinks_) l->add_sink(s);
    loggers_[name] = l;
    return l;
}

void LogManager::remove_logger(const std::string& name) { std::lock_guard<std::mutex> lk(loggers_mutex_); loggers_.erase(name); }

void LogManager::set_global_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_level_ = l;
    for (auto& [n, lg] : loggers_) lg->set_level(l);
}

LogLevel LogManager::get_global_level() const { std::lock_guard<std::mutex> lk(loggers_mutex_); return global_level_; }

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, lg] : loggers_) lg->add_sink(sink);
    global_sinks_.push_back(std::move(sink));
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, lg] : loggers_) {
        for (auto& s : global_sinks_) lg->remove_sink(s);
    }
    global_sinks_.clear();
}

void LogManager::flush_all() { std::lock_guard<std::mutex> lk(loggers_mutex_); for (auto& [n, l] : loggers_) l->flush(); }

// log_utils
LogLevel log_utils::parse_log_level(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return LogLevel::Trace;
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    if (s == "critical" || s == "fatal") return LogLevel::Critical;
    if (s == "off" || s == "none") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_utils::log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        default: return "off";
    }
}

std::shared_ptr<FileLogSink> log_utils::create_rotating_file_sink(const std::filesystem::path& base_path, size_t max_size, size_t max_files) {
    if (base_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path.parent_path(), ec);
    }
    return std::make_shared<FileLogSink>(base_path, max_size, max_files);
}

void log_utils::setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file,
                                    bool json_output) {
    UnifiedLogFormatter::FormatConfig fc;
    fc.json_output = json_output;
    auto formatter = std::make_shared<UnifiedLogFormatter>(fc);

    auto& mgr = LogManager::instance();
    mgr.clear_global_sinks();
    mgr.set_global_level(level);
    if (log_to_console) {
        // JSON出力では色付けしない
        auto sink = std::make_shared<ConsoleLogSink>(!json_output);
        sink->set_formatter(formatter);
        mgr.add_global_sink(sink);
    }
    if (!log_file.empty()) {
        auto sink = create_rotating_file_sink(log_file);
        sink->set_formatter(formatter);
        mgr.add_global_sink(sink);
    }
}

} // namespace wirehdr::utils
