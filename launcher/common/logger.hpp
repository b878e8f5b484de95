#pragma once
#include <cstdio>
#include <cstdarg>

class QString;

enum class LogLevel
{
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

class Logger
{
public:
    // 初始化：默认输出到stderr，等级 INFO
    static void init(LogLevel lvl = LogLevel::INFO, FILE* out = stderr, bool enable_color = true);

    static void set_level(LogLevel lvl);
    static LogLevel level();

    static void set_output(FILE* out);
    static void set_color(bool enable);

    // "debug" / "info" / "warn" / "error"，无法识别时返回 false
    static bool parse_level(const QString& text, LogLevel* out);

    // 把 qDebug/qWarning 等也接到同一个输出
    static void install_qt_handler();

    // printf 风格的日志函数
    static void log(LogLevel lvl, const char* file, int line, const char* fmt, ...);

private:
    static const char* level_str(LogLevel lvl);
    static const char* level_color(LogLevel lvl);
};

// 自动带上文件名和行号，printf 风格：%s，%d，%lld ...
// QString 参数请用 qUtf8Printable()
#define LOG_DEBUG(fmt, ...) Logger::log(LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(LogLevel::WARN, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(LogLevel::ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
