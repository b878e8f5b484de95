#include "catalog/catalog_client.hpp"
#include "common/logger.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QScopedPointer>
#include <QTimer>
#include <algorithm>

namespace {

// 同 FileDownloader：超时后 abort，并在 reply 上留标记
void attachTimeoutToReply(QNetworkReply* reply, int timeoutMs, bool* timedOutFlag)
{
    if (!reply || timeoutMs <= 0) return;

    QTimer* timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply, timedOutFlag]() {
        if (timedOutFlag) *timedOutFlag = true;
        if (!reply->isFinished()) reply->abort();
    });
    QObject::connect(reply, &QIODevice::readyRead, timer, [timer, timeoutMs]() { timer->start(timeoutMs); });
    QObject::connect(reply, &QNetworkReply::finished, timer, &QTimer::stop);
    timer->start(timeoutMs);
}

QString stringField(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isString()) return v.toString();
    if (v.isDouble()) return QString::number(v.toVariant().toLongLong());
    return QString();
}

} // namespace

CatalogClient::CatalogClient(QObject* parent) : QObject(parent) {}

void CatalogClient::fetchAll()
{
    if (reply_) {
        LOG_DEBUG("catalog fetch already in progress");
        return;
    }

    QUrl url = base_;
    QString path = url.path();
    if (!path.endsWith(QLatin1Char('/'))) path += QLatin1Char('/');
    url.setPath(path + QStringLiteral("all"));

    if (!url.isValid() || url.host().isEmpty()) {
        fail_(QStringLiteral("invalid catalog URL: %1").arg(url.toDisplayString()));
        return;
    }

    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("Accept", "application/json");

    LOG_INFO("catalog fetch: %s", qUtf8Printable(url.toDisplayString()));
    body_.clear();
    timedOut_ = false;
    reply_ = nam_.get(req);
    attachTimeoutToReply(reply_, timeoutMs_, &timedOut_);
    connect(reply_, &QIODevice::readyRead, this, &CatalogClient::onReadyRead);
    connect(reply_, &QNetworkReply::finished, this, &CatalogClient::onFinished);
}

void CatalogClient::onReadyRead()
{
    if (!reply_) return;
    body_.append(reply_->readAll());
    if (body_.size() > maxBytes_) {
        QNetworkReply* r = reply_;
        reply_ = nullptr;
        r->disconnect(this);
        r->abort();
        r->deleteLater();
        body_.clear();
        fail_(QStringLiteral("catalog response larger than %1 bytes").arg(maxBytes_));
    }
}

void CatalogClient::onFinished()
{
    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> guard(reply_.data());
    reply_ = nullptr;
    if (!guard) return;

    if (timedOut_) {
        fail_(QStringLiteral("catalog request timed out after %1 ms").arg(timeoutMs_));
        return;
    }
    if (guard->error() != QNetworkReply::NoError) {
        const int http = guard->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        fail_(http > 0 ? QStringLiteral("HTTP %1: %2").arg(http).arg(guard->errorString())
                       : guard->errorString());
        return;
    }

    body_.append(guard->readAll());
    QVector<AssetRecord> assets;
    QString err;
    if (!parseCatalog(body_, &assets, &err)) {
        body_.clear();
        fail_(err);
        return;
    }
    body_.clear();

    LOG_INFO("catalog loaded: %d assets", assets.size());
    emit loaded(assets);
}

void CatalogClient::fail_(const QString& msg)
{
    LOG_WARN("catalog fetch failed: %s", qUtf8Printable(msg));
    emit failed(msg);
}

bool CatalogClient::parseCatalog(const QByteArray& json, QVector<AssetRecord>* out, QString* error)
{
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QStringLiteral("catalog is not a JSON object: %1").arg(pe.errorString());
        return false;
    }

    const QJsonValue cats = doc.object().value(QLatin1String("categories"));
    if (!cats.isObject()) {
        if (error) *error = QStringLiteral("catalog has no \"categories\" object");
        return false;
    }

    QVector<AssetRecord> assets;
    const QJsonObject categories = cats.toObject();
    for (auto it = categories.begin(); it != categories.end(); ++it) {
        if (it.key() == QLatin1String("resources")) continue;
        if (!it.value().isArray()) {
            LOG_WARN("catalog category %s is not an array, skipped", qUtf8Printable(it.key()));
            continue;
        }

        for (const QJsonValue& v : it.value().toArray()) {
            const QJsonObject o = v.toObject();
            AssetRecord r;
            r.id       = stringField(o, "id");
            r.title    = stringField(o, "title");
            r.filename = stringField(o, "filename");
            r.ext      = stringField(o, "ext");
            r.url      = stringField(o, "url");
            r.size     = o.value(QLatin1String("size")).toVariant().toLongLong();
            r.category = it.key();

            if (r.url.isEmpty() || r.filename.isEmpty()) continue;
            if (r.ext.isEmpty()) {
                const int dot = r.filename.lastIndexOf(QLatin1Char('.'));
                if (dot >= 0) r.ext = r.filename.mid(dot + 1);
            }
            if (r.title.isEmpty()) r.title = r.filename;
            assets.push_back(r);
        }
    }

    std::stable_sort(assets.begin(), assets.end(), [](const AssetRecord& a, const AssetRecord& b) {
        return a.title.compare(b.title, Qt::CaseInsensitive) < 0;
    });

    if (out) *out = assets;
    return true;
}
