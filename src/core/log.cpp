#include <superbox/core/log.hpp>
#include <superbox/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace superbox {

namespace {

thread_local std::string current_connection;

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* LevelColour(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// UTC with milliseconds, or local wall-clock seconds for the terminal.
std::string Timestamp(bool utc_millis) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (!utc_millis) {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }

    gmtime_r(&seconds, &parts);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        out_ << Timestamp(true) << " [" << LevelName(record.level) << "] ["
             << record.component << "] ";
        if (!record.connection.empty()) {
            out_ << '<' << record.connection << "> ";
        }
        out_ << record.message << '\n';
        out_.flush();
        return;
    }

    const auto* colour = LevelColour(record.level);
    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << colour << std::left << std::setw(5) << LevelName(record.level)
         << ansi::kReset << ' '
         << ansi::kDim << '[' << record.component << ']';
    if (!record.connection.empty()) {
        out_ << " <" << record.connection << '>';
    }
    out_ << ansi::kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << colour << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::ordered_json line;
    line["ts"] = Timestamp(true);
    line["level"] = LevelName(record.level);
    line["component"] = std::string(record.component);
    if (!record.connection.empty()) {
        line["connection"] = std::string(record.connection);
    }
    line["message"] = std::string(record.message);
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    sink_->Write(LogRecord{level, component, message, current_connection});
}

// ---------------------------------------------------------------------------
// LogContext
// ---------------------------------------------------------------------------
LogContext::LogContext(std::string connection)
    : previous_(std::move(current_connection)) {
    current_connection = std::move(connection);
}

LogContext::~LogContext() {
    current_connection = std::move(previous_);
}

const std::string& LogContext::Current() {
    return current_connection;
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

std::string Truncate(std::string_view text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return std::string(text);
    }
    return std::string(text.substr(0, max_chars)) + "...";
}

} // namespace superbox
