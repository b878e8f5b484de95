#include "transfer/file_downloader.hpp"
#include "common/logger.hpp"

#include <QNetworkRequest>
#if QT_CONFIG(ssl)
#include <QSslSocket>
#endif

namespace {

inline bool isSuccessStatus(int code) { return code >= 200 && code <= 299; }
inline bool isRedirectStatus(int code) { return code >= 300 && code <= 399; }

QString httpStatusMessage(QNetworkReply* reply, int code) {
    const QString phrase = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    return phrase.isEmpty() ? QStringLiteral("HTTP %1").arg(code)
                            : QStringLiteral("HTTP %1 %2").arg(code).arg(phrase);
}

} // namespace

FileDownloader::FileDownloader(QObject* parent) : QObject(parent) {
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &FileDownloader::onTimeout);
}

FileDownloader::~FileDownloader() {
    // 销毁时仍在传输：静默清理，不再发信号
    if (started_ && !done_) {
        done_ = true;
        timer_.stop();
        releaseReply_();
        removePartial_();
    }
}

bool FileDownloader::isSupportedUrl(const QUrl& url) {
    if (!url.isValid() || url.isRelative() || url.host().isEmpty()) return false;
    const QString scheme = url.scheme().toLower();
    return scheme == QLatin1String("http") || scheme == QLatin1String("https");
}

void FileDownloader::start(const QUrl& url, const QString& destPath, const TransferLimits& limits) {
    if (started_) {
        LOG_WARN("FileDownloader::start called twice, ignored (%s)", qUtf8Printable(destPath_));
        return;
    }
    started_ = true;
    url_ = url;
    destPath_ = destPath;
    limits_ = limits;

    if (!isSupportedUrl(url_)) {
        fail_(ErrorKind::Transport,
              QStringLiteral("unsupported URL: %1").arg(url_.toDisplayString()));
        return;
    }
    if (destPath_.isEmpty()) {
        fail_(ErrorKind::Filesystem, QStringLiteral("empty destination path"));
        return;
    }
    if (limits_.maxBytes < 0 || limits_.timeoutMs <= 0) {
        fail_(ErrorKind::Transport, QStringLiteral("invalid transfer limits"));
        return;
    }

    // 按 scheme 选择明文 / TLS
    const bool secure = url_.scheme().compare(QLatin1String("https"), Qt::CaseInsensitive) == 0;
#if QT_CONFIG(ssl)
    if (secure && !QSslSocket::supportsSsl()) {
        fail_(ErrorKind::Transport, QStringLiteral("TLS is not available for %1").arg(url_.host()));
        return;
    }
#else
    if (secure) {
        fail_(ErrorKind::Transport, QStringLiteral("TLS is not available for %1").arg(url_.host()));
        return;
    }
#endif

    QNetworkRequest req(url_);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    // 字节数按线上实际内容计，不让 QNAM 自动解压
    req.setRawHeader("Accept-Encoding", "identity");
    req.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("asset_launcher/1.0"));

    LOG_INFO("download start: %s -> %s (%s, max=%lld, timeout=%dms)",
             qUtf8Printable(url_.toDisplayString()), qUtf8Printable(destPath_),
             secure ? "https" : "http",
             static_cast<long long>(limits_.maxBytes), limits_.timeoutMs);

    reply_ = nam_.get(req);
    connect(reply_, &QNetworkReply::metaDataChanged, this, &FileDownloader::onMetaDataChanged);
    connect(reply_, &QIODevice::readyRead, this, &FileDownloader::onReadyRead);
    connect(reply_, &QNetworkReply::finished, this, &FileDownloader::onFinished);

    timer_.start(limits_.timeoutMs);
}

void FileDownloader::cancel() {
    if (!isRunning()) return;
    fail_(ErrorKind::UserCanceled, QStringLiteral("transfer canceled"));
}

void FileDownloader::onMetaDataChanged() {
    if (done_) return;
    timer_.start(limits_.timeoutMs);
    if (!headersAccepted_) acceptHeaders_();
}

void FileDownloader::onReadyRead() {
    if (done_) return;
    timer_.start(limits_.timeoutMs);

    if (!headersAccepted_ && !acceptHeaders_()) return;
    if (!headersAccepted_) return; // 还在重定向中
    drainReply_();
}

void FileDownloader::onFinished() {
    if (done_) return;
    timer_.stop();

    const QVariant statusAttr = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const int status = statusAttr.isValid() ? statusAttr.toInt() : 0;

    if (reply_->error() != QNetworkReply::NoError) {
        if (status != 0 && !isSuccessStatus(status)) {
            fail_(ErrorKind::HttpStatus, httpStatusMessage(reply_, status));
        } else if (reply_->error() == QNetworkReply::TimeoutError) {
            fail_(ErrorKind::Timeout, reply_->errorString());
        } else {
            fail_(ErrorKind::Transport, reply_->errorString());
        }
        return;
    }

    if (!headersAccepted_ && !acceptHeaders_()) return;
    if (!headersAccepted_) {
        fail_(ErrorKind::Transport, QStringLiteral("response finished without a final status"));
        return;
    }
    if (!drainReply_()) return;
    succeed_();
}

void FileDownloader::onTimeout() {
    if (done_) return;
    fail_(ErrorKind::Timeout,
          QStringLiteral("no response from %1 within %2 ms").arg(url_.host()).arg(limits_.timeoutMs));
}

// 返回 false 表示已经失败；返回 true 但 headersAccepted_ 仍为 false 表示还没拿到最终状态
bool FileDownloader::acceptHeaders_() {
    const QVariant statusAttr = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid()) return true;

    const int status = statusAttr.toInt();
    if (isRedirectStatus(status)) return true; // 交给 QNAM 跟随

    if (!isSuccessStatus(status)) {
        fail_(ErrorKind::HttpStatus, httpStatusMessage(reply_, status));
        return false;
    }

    const QVariant len = reply_->header(QNetworkRequest::ContentLengthHeader);
    if (len.isValid()) {
        declared_ = len.toLongLong();
        if (declared_ > limits_.maxBytes) {
            fail_(ErrorKind::SizeLimitExceeded,
                  QStringLiteral("declared size %1 exceeds limit of %2 bytes")
                      .arg(declared_).arg(limits_.maxBytes));
            return false;
        }
    }

    headersAccepted_ = true;
    LOG_DEBUG("download headers ok: status=%d length=%lld", status, static_cast<long long>(declared_));
    return true;
}

bool FileDownloader::openDestination_() {
    file_.setFileName(destPath_);
    // NewOnly 即 O_CREAT|O_EXCL，不跟随已存在的符号链接
    const QIODevice::OpenMode mode =
        QIODevice::WriteOnly | (exclusive_ ? QIODevice::NewOnly : QIODevice::Truncate);
    if (!file_.open(mode)) {
        fail_(ErrorKind::Filesystem,
              QStringLiteral("cannot open %1: %2").arg(destPath_, file_.errorString()));
        return false;
    }
    fileCreated_ = true;

    sink_.reset(new BoundedWriter(&file_, limits_.maxBytes));
    if (!sink_->open(QIODevice::WriteOnly)) {
        fail_(ErrorKind::Filesystem, sink_->errorString());
        return false;
    }
    return true;
}

bool FileDownloader::drainReply_() {
    if (!fileCreated_ && !openDestination_()) return false;

    const QByteArray chunk = reply_->readAll();
    if (chunk.isEmpty()) return true;

    received_ += chunk.size();
    if (sink_->write(chunk) != chunk.size()) {
        if (sink_->limitExceeded()) {
            fail_(ErrorKind::SizeLimitExceeded,
                  QStringLiteral("received more than %1 bytes").arg(limits_.maxBytes));
        } else {
            fail_(ErrorKind::Filesystem,
                  QStringLiteral("write to %1 failed: %2").arg(destPath_, sink_->errorString()));
        }
        return false;
    }

    emit progress(received_, declared_);
    return true;
}

void FileDownloader::succeed_() {
    sink_->close();
    if (!file_.flush()) {
        fail_(ErrorKind::Filesystem,
              QStringLiteral("flush of %1 failed: %2").arg(destPath_, file_.errorString()));
        return;
    }
    file_.close();
    if (file_.error() != QFileDevice::NoError) {
        fail_(ErrorKind::Filesystem,
              QStringLiteral("close of %1 failed: %2").arg(destPath_, file_.errorString()));
        return;
    }

    done_ = true;
    releaseReply_();
    LOG_INFO("download done: %s (%lld bytes)", qUtf8Printable(destPath_),
             static_cast<long long>(received_));
    emit finished(TransferOutcome::ok(destPath_));
}

// 先清理，后汇报
void FileDownloader::fail_(ErrorKind kind, const QString& msg) {
    if (done_) return;
    done_ = true;
    timer_.stop();

    releaseReply_();
    removePartial_();

    LOG_WARN("download failed [%s]: %s (%s)", errorKindName(kind), qUtf8Printable(msg),
             qUtf8Printable(destPath_));
    emit finished(TransferOutcome::failure(kind, msg, destPath_));
}

void FileDownloader::releaseReply_() {
    if (!reply_) return;
    // abort() 会同步发 finished，先断开
    reply_->disconnect(this);
    if (reply_->isRunning()) reply_->abort();
    reply_->deleteLater();
    reply_ = nullptr;
}

void FileDownloader::removePartial_() {
    if (sink_) {
        sink_->close();
        sink_.reset();
    }
    if (file_.isOpen()) {
        file_.close();
        if (file_.error() != QFileDevice::NoError)
            LOG_WARN("close of partial file %s failed: %s", qUtf8Printable(destPath_),
                     qUtf8Printable(file_.errorString()));
    }
    if (fileCreated_) {
        fileCreated_ = false;
        if (QFile::exists(destPath_) && !QFile::remove(destPath_))
            LOG_WARN("cannot remove partial file %s", qUtf8Printable(destPath_));
    }
}
