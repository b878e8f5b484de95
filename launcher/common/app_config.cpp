#include "common/app_config.hpp"

#include <QSettings>
#include <limits>

namespace {

const char* levelName(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::DEBUG: return "debug";
    case LogLevel::INFO:  return "info";
    case LogLevel::WARN:  return "warn";
    case LogLevel::ERROR: return "error";
    }
    return "info";
}

qint64 readPositive(QSettings& s, const QString& key, qint64 fallback)
{
    if (!s.contains(key)) return fallback;
    bool ok = false;
    const qint64 v = s.value(key).toLongLong(&ok);
    if (!ok || v <= 0) {
        LOG_WARN("config %s=%s is invalid, using %lld", qUtf8Printable(key),
                 qUtf8Printable(s.value(key).toString()), static_cast<long long>(fallback));
        return fallback;
    }
    return v;
}

// int 型的键：超出 int 范围同样视为非法
int readPositiveInt(QSettings& s, const QString& key, int fallback)
{
    const qint64 v = readPositive(s, key, fallback);
    if (v > std::numeric_limits<int>::max()) {
        LOG_WARN("config %s=%lld is out of range, using %d", qUtf8Printable(key),
                 static_cast<long long>(v), fallback);
        return fallback;
    }
    return static_cast<int>(v);
}

} // namespace

void saveAppConfig(const QString& iniPath, const AppConfig& cfg)
{
    QSettings s(iniPath, QSettings::IniFormat);

    s.beginGroup("Catalog");
    s.setValue("BaseUrl", cfg.catalogBaseUrl);
    s.setValue("MaxBytes", cfg.catalogMaxBytes);
    s.endGroup();

    s.beginGroup("Transfer");
    s.setValue("MaxBytes", cfg.limits.maxBytes);
    s.setValue("TimeoutMs", cfg.limits.timeoutMs);
    s.endGroup();

    s.beginGroup("Clipboard");
    s.setValue("HelperTimeoutMs", cfg.clipboard.helperTimeoutMs);
    s.endGroup();

    s.beginGroup("TempArea");
    s.setValue("DirName", cfg.tempDirName);
    s.endGroup();

    s.beginGroup("Window");
    s.setValue("HideOnFocusLoss", cfg.hideOnFocusLoss);
    s.endGroup();

    s.beginGroup("Log");
    s.setValue("Level", QString::fromLatin1(levelName(cfg.logLevel)));
    s.setValue("Color", cfg.logColor);
    s.endGroup();

    s.sync(); // 立即写入文件
    if (s.status() != QSettings::NoError)
        LOG_WARN("cannot write configuration %s", qUtf8Printable(iniPath));
}

AppConfig loadAppConfig(const QString& iniPath)
{
    AppConfig cfg;
    QSettings s(iniPath, QSettings::IniFormat);

    // 首次运行：写入默认配置
    if (s.allKeys().isEmpty()) {
        LOG_INFO("no configuration at %s, writing defaults", qUtf8Printable(iniPath));
        saveAppConfig(iniPath, cfg);
        return cfg;
    }

    const AppConfig def;

    cfg.catalogBaseUrl = s.value("Catalog/BaseUrl", def.catalogBaseUrl).toString().trimmed();
    if (cfg.catalogBaseUrl.isEmpty()) cfg.catalogBaseUrl = def.catalogBaseUrl;
    cfg.catalogMaxBytes = readPositive(s, "Catalog/MaxBytes", def.catalogMaxBytes);

    cfg.limits.maxBytes  = readPositive(s, "Transfer/MaxBytes", def.limits.maxBytes);
    cfg.limits.timeoutMs = readPositiveInt(s, "Transfer/TimeoutMs", def.limits.timeoutMs);
    cfg.clipboard.helperTimeoutMs = readPositiveInt(s, "Clipboard/HelperTimeoutMs", def.clipboard.helperTimeoutMs);

    // 目录名不能带路径分隔符
    const QString dirName = s.value("TempArea/DirName", def.tempDirName).toString().trimmed();
    if (dirName.isEmpty() || dirName.contains(QLatin1Char('/')) || dirName.contains(QLatin1Char('\\'))
        || dirName == QLatin1String("..") || dirName == QLatin1String(".")) {
        LOG_WARN("config TempArea/DirName=%s is invalid, using %s", qUtf8Printable(dirName),
                 qUtf8Printable(def.tempDirName));
        cfg.tempDirName = def.tempDirName;
    } else {
        cfg.tempDirName = dirName;
    }

    cfg.hideOnFocusLoss = s.value("Window/HideOnFocusLoss", def.hideOnFocusLoss).toBool();

    const QString level = s.value("Log/Level", QString::fromLatin1(levelName(def.logLevel))).toString();
    if (!Logger::parse_level(level, &cfg.logLevel)) {
        LOG_WARN("config Log/Level=%s is invalid, using info", qUtf8Printable(level));
        cfg.logLevel = def.logLevel;
    }
    cfg.logColor = s.value("Log/Color", def.logColor).toBool();

    return cfg;
}
