#include <QApplication>
#include <QDir>
#include <QUrl>

#include "catalog/catalog_client.hpp"
#include "clipboard/clipboard_delivery.hpp"
#include "common/app_config.hpp"
#include "common/logger.hpp"
#include "transfer/temp_area.hpp"
#include "ui/asset_service.hpp"
#include "ui/launcher_window.hpp"
#include "ui/save_path_prompt.hpp"
#include "ui/window_controller.hpp"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("asset_launcher"));
    QApplication::setQuitOnLastWindowClosed(false);

    Logger::init(LogLevel::INFO);
    Logger::install_qt_handler();

    qRegisterMetaType<TransferOutcome>("TransferOutcome");

    const QString configFile = QCoreApplication::applicationDirPath() + "/config.ini";
    const AppConfig cfg = loadAppConfig(configFile);
    Logger::set_level(cfg.logLevel);
    Logger::set_color(cfg.logColor);
    LOG_INFO("configuration: %s", qUtf8Printable(configFile));

    // 启动时先清理上次遗留的临时文件，再接受任何传输请求
    TempArea temp(TempArea::defaultRoot(cfg.tempDirName));
    if (!temp.purge())
        LOG_WARN("temp area %s is not clean, continuing", qUtf8Printable(temp.root()));

    std::unique_ptr<ClipboardDelivery> clipboard = ClipboardDelivery::createForRunningOs(cfg.clipboard);

    LauncherWindow window;
    WindowController controller(&window);
    controller.setHideOnFocusLoss(cfg.hideOnFocusLoss);

    DialogSavePathPrompt prompt(&window);
    AssetService service(temp, *clipboard, prompt);
    service.setLimits(cfg.limits);
    service.setWindowController(&controller);
    window.setService(&service);

    CatalogClient catalog;
    catalog.setBaseUrl(QUrl(cfg.catalogBaseUrl));
    catalog.setTimeoutMs(cfg.limits.timeoutMs);
    catalog.setMaxBytes(cfg.catalogMaxBytes);
    QObject::connect(&catalog, &CatalogClient::loaded, &window, &LauncherWindow::setAssets);
    QObject::connect(&catalog, &CatalogClient::failed, &window, [&window](const QString& msg) {
        window.showStatus(QStringLiteral("Failed to load assets: %1").arg(msg));
    });

    // 正常退出时先停掉传输再清理；崩溃时留到下次启动
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&service, &temp]() {
        service.shutdown();
        if (!temp.purge()) LOG_WARN("temp area %s left partially uncleaned", qUtf8Printable(temp.root()));
    });

    catalog.fetchAll();
    controller.show();

    LOG_INFO("asset_launcher started, temp area %s", qUtf8Printable(temp.root()));
    const int rc = app.exec();
    LOG_INFO("asset_launcher exited (%d)", rc);
    return rc;
}
