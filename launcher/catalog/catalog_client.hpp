#pragma once
#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QUrl>
#include <QVector>

#include "transfer/transfer_types.hpp"

// 目录服务返回的一条资源元信息
struct AssetRecord {
    QString id;
    QString title;
    QString filename;
    QString ext;
    QString url;
    qint64  size = 0;
    QString category;

    AssetRef toRef() const { return AssetRef{url, filename, ext}; }
};

// GET <base>/all -> { "categories": { "<name>": [AssetRecord...] } }
class CatalogClient : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kDefaultMaxBytes = 32LL * 1024 * 1024;

    explicit CatalogClient(QObject* parent = nullptr);

    void setBaseUrl(const QUrl& base) { base_ = base; }
    void setTimeoutMs(int ms) { timeoutMs_ = ms; }
    void setMaxBytes(qint64 n) { maxBytes_ = n; }

    // 已有请求在进行时忽略
    void fetchAll();

    // 展开所有分类（跳过 resources），按标题排序（不区分大小写）
    static bool parseCatalog(const QByteArray& json, QVector<AssetRecord>* out, QString* error);

signals:
    void loaded(QVector<AssetRecord> assets);
    void failed(QString message);

private slots:
    void onReadyRead();
    void onFinished();

private:
    void fail_(const QString& msg);

private:
    QNetworkAccessManager nam_;
    QPointer<QNetworkReply> reply_;
    QByteArray body_;

    QUrl   base_;
    int    timeoutMs_ = TransferLimits::kDefaultTimeoutMs;
    qint64 maxBytes_ = kDefaultMaxBytes;
    bool   timedOut_ = false;
};
