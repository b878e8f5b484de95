#include "clipboard/clipboard_delivery.hpp"
#include "common/logger.hpp"

#include <QClipboard>
#include <QFileInfo>
#include <QGuiApplication>
#include <QImage>
#include <QMimeData>
#include <QUrl>

bool UriListClipboardDelivery::isImageExtension(const QString& extension) {
    static const QStringList kImageExts = {
        QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"),
        QStringLiteral("gif"), QStringLiteral("webp"), QStringLiteral("bmp")
    };
    QString ext = extension.trimmed().toLower();
    if (ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);
    return kImageExts.contains(ext);
}

QMimeData* UriListClipboardDelivery::buildMimeData(const QString& path, const QString& extension) {
    auto* md = new QMimeData;
    md->setUrls({QUrl::fromLocalFile(path)});
    md->setText(path);

    // 图片额外放一份位图，方便直接粘贴到图像编辑器
    if (isImageExtension(extension)) {
        const QImage image(path);
        if (!image.isNull())
            md->setImageData(image);
        else
            LOG_DEBUG("%s is not a decodable image, file reference only", qUtf8Printable(path));
    }
    return md;
}

void UriListClipboardDelivery::deliverFile(const QString& path, const QString& extension) {
    const QFileInfo fi(path);
    if (path.isEmpty() || !fi.isFile()) {
        emit finished(TransferOutcome::failure(ErrorKind::Clipboard,
                                               QStringLiteral("no such file: %1").arg(path), path));
        return;
    }

    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        emit finished(TransferOutcome::failure(ErrorKind::Clipboard,
                                               QStringLiteral("no GUI clipboard in this process"), path));
        return;
    }

    QClipboard* cb = QGuiApplication::clipboard();
    cb->setMimeData(buildMimeData(fi.absoluteFilePath(), extension)); // cb 接管所有权

    const QMimeData* now = cb->mimeData();
    if (!now || !now->hasUrls()) {
        LOG_WARN("clipboard rejected uri-list for %s", qUtf8Printable(path));
        emit finished(TransferOutcome::failure(ErrorKind::Clipboard,
                                               QStringLiteral("clipboard did not accept the file reference"), path));
        return;
    }

    LOG_INFO("clipboard set to file %s", qUtf8Printable(path));
    emit finished(TransferOutcome::ok(path));
}
