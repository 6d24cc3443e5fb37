#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace superbox {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// One log line as handed to a sink. `connection` is the id of the client
// connection the calling thread is serving, empty outside one.
struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string_view message;
    std::string_view connection;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines, stderr by default; stdout belongs to the stdio
// gateway. Colour mode: "HH:MM:SS LEVEL [component] <connection> message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line. Invalid UTF-8 (child stderr) is replaced, never
// emitted.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level);

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// LogContext: tags every line the current thread logs with a connection id
// for the lifetime of the object. Scopes nest; the outer id comes back when
// the inner scope ends.
// ---------------------------------------------------------------------------
class LogContext {
public:
    explicit LogContext(std::string connection);
    ~LogContext();

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

    static const std::string& Current();

private:
    std::string previous_;
};

/// Replace the global logger. Call once at startup, before worker threads run.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// The global logger; discards everything until InitGlobalLogger is called.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

/// Shorten text for a log line, appending "..." when cut.
std::string Truncate(std::string_view text, size_t max_chars);

} // namespace superbox
