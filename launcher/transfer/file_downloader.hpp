#pragma once
#include <QObject>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#include <memory>

#include "transfer/bounded_writer.hpp"
#include "transfer/transfer_types.hpp"

// 把一个 http/https 资源流式写到本地文件。
// 每个实例只用一次，自带 QNetworkAccessManager / 文件句柄，互不共享状态，
// 多个实例可以在同一个事件循环里并发。
// 任何失败都会先删除已写的部分文件，再发出 finished。
class FileDownloader : public QObject {
    Q_OBJECT
public:
    explicit FileDownloader(QObject* parent = nullptr);
    ~FileDownloader() override;

    // 参数不合法时在 start() 内同步发出 finished
    void start(const QUrl& url, const QString& destPath, const TransferLimits& limits = TransferLimits());

    // 中止并以 UserCanceled 结束
    void cancel();

    // 目标已存在（包括符号链接）时不覆盖，以 Filesystem 失败。start() 之前设置。
    void setExclusiveCreate(bool on) { exclusive_ = on; }

    bool isRunning() const { return started_ && !done_; }
    const QString& destination() const { return destPath_; }
    qint64 bytesReceived() const { return received_; }

    // 仅允许 http / https 的绝对 URL
    static bool isSupportedUrl(const QUrl& url);

signals:
    void progress(qint64 received, qint64 total); // total 未知时为 -1
    void finished(TransferOutcome outcome);

private slots:
    void onMetaDataChanged();
    void onReadyRead();
    void onFinished();
    void onTimeout();

private:
    bool acceptHeaders_();
    bool openDestination_();
    bool drainReply_();
    void succeed_();
    void fail_(ErrorKind kind, const QString& msg);
    void releaseReply_();
    void removePartial_();

private:
    QNetworkAccessManager nam_;
    QPointer<QNetworkReply> reply_;
    QTimer timer_;

    QFile file_;
    std::unique_ptr<BoundedWriter> sink_;
    bool fileCreated_ = false;
    bool exclusive_ = false;

    QUrl    url_;
    QString destPath_;
    TransferLimits limits_;

    qint64 received_ = 0;
    qint64 declared_ = -1;
    bool   headersAccepted_ = false;
    bool   started_ = false;
    bool   done_ = false;
};
