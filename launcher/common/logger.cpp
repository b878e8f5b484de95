#include "common/logger.hpp"
#include <QString>
#include <QtGlobal>
#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <array>
#include <chrono>
#include <ctime>
#include <cstring>
#include <sys/syscall.h>
#include <unistd.h>

namespace
{

    // 全局状态
    static std::mutex g_mu;
    static LogLevel g_level = LogLevel::INFO;
    static FILE *g_out = stderr;
    static bool g_color = true;

    inline unsigned long get_tid()
    {
        return static_cast<unsigned long>(::syscall(SYS_gettid));
    }

    // 取文件名
    inline const char *basename2(const char *path)
    {
        if (!path)
            return "";
        const char *p = std::strrchr(path, '/');
        return p ? (p + 1) : path;
    }

    // 格式化时间到 yyyy-mm-dd HH:MM:SS.mmm
    inline void format_timestamp(char *buf, size_t n)
    {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto secs = time_point_cast<seconds>(now);
        auto ms = duration_cast<milliseconds>(now - secs).count();

        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        std::snprintf(buf, n, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<long>(ms));
    }

    LogLevel from_qt_type(QtMsgType type)
    {
        switch (type)
        {
        case QtDebugMsg:
            return LogLevel::DEBUG;
        case QtInfoMsg:
            return LogLevel::INFO;
        case QtWarningMsg:
            return LogLevel::WARN;
        case QtCriticalMsg:
        case QtFatalMsg:
            return LogLevel::ERROR;
        }
        return LogLevel::INFO;
    }

    void qt_message_handler(QtMsgType type, const QMessageLogContext &ctx, const QString &msg)
    {
        // release 构建下 ctx.file 为空
        const char *file = ctx.file ? ctx.file : "qt";
        Logger::log(from_qt_type(type), file, ctx.line, "%s", qUtf8Printable(msg));
        if (type == QtFatalMsg)
            std::abort();
    }

} // namespace

void Logger::init(LogLevel lvl, FILE *out, bool enable_color)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_level = lvl;
    g_out = out ? out : stderr;
    g_color = enable_color;
}

void Logger::set_level(LogLevel lvl)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_level = lvl;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(g_mu);
    return g_level;
}

void Logger::set_output(FILE *out)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_out = out ? out : stderr;
}

void Logger::set_color(bool enable)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_color = enable;
}

bool Logger::parse_level(const QString &text, LogLevel *out)
{
    const QString t = text.trimmed().toLower();
    LogLevel lvl;
    if (t == QLatin1String("debug"))
        lvl = LogLevel::DEBUG;
    else if (t == QLatin1String("info"))
        lvl = LogLevel::INFO;
    else if (t == QLatin1String("warn") || t == QLatin1String("warning"))
        lvl = LogLevel::WARN;
    else if (t == QLatin1String("error"))
        lvl = LogLevel::ERROR;
    else
        return false;

    if (out)
        *out = lvl;
    return true;
}

void Logger::install_qt_handler()
{
    qInstallMessageHandler(qt_message_handler);
}

const char *Logger::level_str(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char *Logger::level_color(LogLevel lvl)
{
    if (!g_color)
        return "";

    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "\033[36m"; // Cyan
    case LogLevel::INFO:
        return "\033[32m"; // Green
    case LogLevel::WARN:
        return "\033[33m"; // Yellow
    case LogLevel::ERROR:
        return "\033[31m"; // Red
    }
    return "";
}

void Logger::log(LogLevel lvl, const char *file, int line, const char *fmt, ...)
{
    std::lock_guard<std::mutex> lk(g_mu);

    if (static_cast<int>(lvl) < static_cast<int>(g_level))
        return;

    std::array<char, 2048> buf{};
    size_t pos = 0;

    auto advance = [&](int n) {
        if (n > 0)
            pos = std::min(pos + static_cast<size_t>(n), buf.size() - 1);
    };

    // 1) 时间戳
    char ts[64];
    format_timestamp(ts, sizeof(ts));
    advance(std::snprintf(buf.data() + pos, buf.size() - pos, "[%s]", ts));

    // 2) 等级 + 颜色
    const char *c = level_color(lvl);
    const char *r = g_color ? "\033[0m" : "";
    advance(std::snprintf(buf.data() + pos, buf.size() - pos, "%s[%s]%s", c, level_str(lvl), r));

    // 3) 线程号
    advance(std::snprintf(buf.data() + pos, buf.size() - pos, "[tid:%lu]", get_tid()));

    // 4) 源文件:行号
    advance(std::snprintf(buf.data() + pos, buf.size() - pos, "[%s:%d] ", basename2(file), line));

    // 5) 正文
    va_list ap;
    va_start(ap, fmt);
    advance(std::vsnprintf(buf.data() + pos, buf.size() - pos, fmt, ap));
    va_end(ap);

    // 6) 结尾换行（缓冲不够也强行结尾）
    if (pos < buf.size() - 1)
    {
        buf[pos++] = '\n';
        buf[pos] = '\0';
    }
    else
    {
        buf[buf.size() - 2] = '\n';
        buf[buf.size() - 1] = '\0';
    }

    std::fwrite(buf.data(), 1, std::strlen(buf.data()), g_out);
    std::fflush(g_out);
}
