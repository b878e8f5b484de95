#include "ui/launcher_window.hpp"
#include "ui/asset_service.hpp"

#include <QApplication>
#include <QKeyEvent>
#include <QVBoxLayout>

LauncherWindow::LauncherWindow(QWidget* parent) : QWidget(parent)
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    resize(800, 600);

    auto* layout = new QVBoxLayout(this);
    list_ = new QListWidget(this);
    status_ = new QLabel(QStringLiteral("Loading assets..."), this);
    layout->addWidget(list_);
    layout->addWidget(status_);
}

void LauncherWindow::setService(AssetService* service)
{
    service_ = service;
    if (!service_) return;

    connect(service_, &AssetService::downloadFinished, this,
            [this](const AssetRef& asset, const TransferOutcome& o) {
        showStatus(o.success ? QStringLiteral("Saved %1").arg(o.path)
                             : QStringLiteral("%1: %2").arg(asset.filename, o.reason));
    });
    connect(service_, &AssetService::clipboardCopyFinished, this,
            [this](const AssetRef& asset, const TransferOutcome& o) {
        showStatus(o.success ? QStringLiteral("Copied %1 to clipboard").arg(asset.filename)
                             : QStringLiteral("%1: %2").arg(asset.filename, o.reason));
    });
    connect(service_, &AssetService::transferProgress, this,
            [this](const AssetRef& asset, qint64 received, qint64 total) {
        if (total > 0)
            showStatus(QStringLiteral("%1  %2%").arg(asset.filename).arg(received * 100 / total));
        else
            showStatus(QStringLiteral("%1  %2 KB").arg(asset.filename).arg(received / 1024));
    });
}

void LauncherWindow::setAssets(const QVector<AssetRecord>& assets)
{
    assets_ = assets;
    list_->clear();
    for (const AssetRecord& a : assets_)
        list_->addItem(QStringLiteral("[%1] %2").arg(a.category, a.title));
    if (!assets_.isEmpty()) list_->setCurrentRow(0);
    showStatus(QStringLiteral("%1 assets").arg(assets_.size()));
}

void LauncherWindow::showStatus(const QString& text)
{
    status_->setText(text);
}

const AssetRecord* LauncherWindow::currentAsset_() const
{
    const int row = list_->currentRow();
    if (row < 0 || row >= assets_.size()) return nullptr;
    return &assets_.at(row);
}

void LauncherWindow::keyPressEvent(QKeyEvent* event)
{
    if (!service_) {
        QWidget::keyPressEvent(event);
        return;
    }

    const AssetRecord* asset = currentAsset_();
    const bool enter = event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter;

    if (event->matches(QKeySequence::Quit)) {
        qApp->quit();
    } else if (event->key() == Qt::Key_Escape) {
        service_->requestHide();
    } else if (enter && asset) {
        showStatus(QStringLiteral("Copying %1...").arg(asset->filename));
        service_->requestClipboardCopy(asset->toRef());
    } else if (event->matches(QKeySequence::Save) && asset) {
        service_->requestDownload(asset->toRef());
    } else {
        QWidget::keyPressEvent(event);
    }
}
