#pragma once
#include <QString>

#include "catalog/catalog_client.hpp"
#include "clipboard/clipboard_delivery.hpp"
#include "common/logger.hpp"
#include "transfer/transfer_types.hpp"

struct AppConfig {
    QString catalogBaseUrl = QStringLiteral("https://hamburger-api.powernplant101-c6b.workers.dev");
    qint64  catalogMaxBytes = CatalogClient::kDefaultMaxBytes;

    TransferLimits    limits;
    ClipboardSettings clipboard;

    QString tempDirName = QStringLiteral("asset_launcher");
    bool    hideOnFocusLoss = true;

    LogLevel logLevel = LogLevel::INFO;
    bool     logColor = true;
};

// INI 配置。文件里没有任何键时（首次运行）写入默认值并返回默认值。
// 数值非法时回退到默认值并打 WARN。
AppConfig loadAppConfig(const QString& iniPath);
void saveAppConfig(const QString& iniPath, const AppConfig& cfg);
