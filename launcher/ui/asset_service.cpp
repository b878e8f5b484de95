#include "ui/asset_service.hpp"
#include "common/logger.hpp"
#include "transfer/file_downloader.hpp"

#include <QFile>
#include <QFileInfo>

AssetService::AssetService(const TempArea& temp, ClipboardDelivery& clipboard, SavePathPrompt& prompt,
                           QObject* parent)
    : QObject(parent), temp_(temp), clipboard_(clipboard), prompt_(prompt)
{
    connect(&clipboard_, &ClipboardDelivery::finished, this, &AssetService::onClipboardDelivered);
}

QString AssetService::suggestedName_(const AssetRef& asset)
{
    // 只取文件名部分，目录由用户决定
    QString name = QFileInfo(asset.filename).fileName();
    if (name.isEmpty()) {
        name = QStringLiteral("asset");
        if (!asset.extension.isEmpty()) name += QLatin1Char('.') + asset.extension;
    }
    return name;
}

template <typename Done>
void AssetService::startTransfer_(const TransferRequest& request, Done done)
{
    auto* dl = new FileDownloader(this);
    dl->setExclusiveCreate(request.destination.kind == DestinationSpec::Kind::ManagedTempPath);
    ++active_;

    const AssetRef asset = request.source;
    connect(dl, &FileDownloader::progress, this, [this, asset](qint64 received, qint64 total) {
        emit transferProgress(asset, received, total);
    });
    connect(dl, &FileDownloader::finished, this, [this, dl, done](const TransferOutcome& outcome) {
        --active_;
        dl->deleteLater();
        done(outcome);
    });

    dl->start(QUrl(request.source.url), request.destination.path, request.limits);
}

void AssetService::requestDownload(const AssetRef& asset)
{
    const QString path = prompt_.askSavePath(suggestedName_(asset));
    if (path.isEmpty()) {
        LOG_INFO("download of %s canceled by user", qUtf8Printable(asset.filename));
        emit downloadFinished(asset, TransferOutcome::failure(ErrorKind::UserCanceled,
                                                              QStringLiteral("Download canceled")));
        return;
    }

    const TransferRequest req{asset, DestinationSpec::userChosen(path), limits_};
    startTransfer_(req, [this, asset](const TransferOutcome& outcome) {
        emit downloadFinished(asset, outcome);
    });
}

void AssetService::requestClipboardCopy(const AssetRef& asset)
{
    // 正常情况下启动时 purge 已经建好目录；这里再确认它仍然可信
    QString err;
    if (!temp_.prepare(&err)) {
        LOG_WARN("clipboard copy of %s refused: %s", qUtf8Printable(asset.filename), qUtf8Printable(err));
        emit clipboardCopyFinished(asset, TransferOutcome::failure(ErrorKind::Filesystem, err));
        return;
    }

    const QString dest = temp_.sanitizedDestination(suggestedName_(asset));
    const TransferRequest req{asset, DestinationSpec::managedTemp(dest), limits_};
    startTransfer_(req, [this, asset](const TransferOutcome& outcome) {
        if (!outcome.success) {
            emit clipboardCopyFinished(asset, outcome);
            return;
        }
        pendingDelivery_.insert(outcome.path, asset);
        clipboard_.deliverFile(outcome.path, asset.extension);
    });
}

void AssetService::onClipboardDelivered(const TransferOutcome& outcome)
{
    auto it = pendingDelivery_.find(outcome.path);
    if (it == pendingDelivery_.end()) return; // 不是本服务发起的
    const AssetRef asset = it.value();
    pendingDelivery_.erase(it);

    // 投递失败的临时文件没有用了
    if (!outcome.success && QFile::exists(outcome.path) && !QFile::remove(outcome.path))
        LOG_WARN("cannot remove undelivered temp file %s", qUtf8Printable(outcome.path));

    emit clipboardCopyFinished(asset, outcome);
}

void AssetService::shutdown()
{
    const QList<FileDownloader*> running = findChildren<FileDownloader*>(QString(), Qt::FindDirectChildrenOnly);
    int canceled = 0;
    for (FileDownloader* dl : running) {
        if (!dl->isRunning()) continue;
        dl->cancel(); // 同步删除部分文件并发出 finished
        ++canceled;
    }
    if (canceled > 0) LOG_INFO("shutdown: %d transfer(s) canceled", canceled);
}

void AssetService::requestHide()
{
    if (window_) window_->hide();
    emit hideRequested();
}
