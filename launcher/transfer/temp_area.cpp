#include "transfer/temp_area.hpp"
#include "common/logger.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <atomic>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace {

const QFileDevice::Permissions kOwnerOnly =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner;

} // namespace

QString TempArea::defaultRoot(const QString& dirName)
{
    return QDir(QDir::tempPath()).filePath(dirName);
}

bool TempArea::checkRoot(QString* error) const
{
    QString err;
    const QFileInfo fi(root_);
    if (root_.isEmpty()) {
        err = QStringLiteral("temp area root is empty");
    } else if (fi.isSymLink()) {
        err = QStringLiteral("temp area %1 is a symbolic link").arg(root_);
    } else if (fi.exists() && !fi.isDir()) {
        err = QStringLiteral("temp area %1 is not a directory").arg(root_);
    }
#ifdef Q_OS_UNIX
    else if (fi.exists() && fi.ownerId() != static_cast<uint>(::getuid())) {
        err = QStringLiteral("temp area %1 is owned by uid %2").arg(root_).arg(fi.ownerId());
    }
#endif

    if (err.isEmpty()) return true;
    if (error) *error = err;
    return false;
}

bool TempArea::prepare(QString* error) const
{
    if (!checkRoot(error)) return false;

    if (!QFileInfo::exists(root_)) {
        if (!QDir().mkpath(root_)) {
            if (error) *error = QStringLiteral("cannot create %1").arg(root_);
            return false;
        }
        LOG_DEBUG("temp area created: %s", qUtf8Printable(root_));
    }
    if (!QFile::setPermissions(root_, kOwnerOnly))
        LOG_WARN("cannot restrict permissions of %s", qUtf8Printable(root_));

    // mkpath 与检查之间可能被替换，再查一次
    return checkRoot(error);
}

bool TempArea::purge() const
{
    QString err;
    if (!prepare(&err)) {
        LOG_ERROR("refusing to purge temp area: %s", qUtf8Printable(err));
        return false;
    }

    QDir dir(root_);
    bool clean = true;
    int removed = 0;
    const QFileInfoList entries =
        dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
    for (const QFileInfo& fi : entries) {
        bool ok;
        // 符号链接只删链接本身
        if (fi.isDir() && !fi.isSymLink())
            ok = QDir(fi.absoluteFilePath()).removeRecursively();
        else
            ok = QFile::remove(fi.absoluteFilePath());

        if (ok) {
            ++removed;
        } else {
            clean = false;
            LOG_WARN("purge: cannot remove %s", qUtf8Printable(fi.absoluteFilePath()));
        }
    }

    LOG_INFO("temp area %s purged (%d removed)", qUtf8Printable(root_), removed);
    return clean;
}

QString TempArea::sanitizedDestination(const QString& filename) const
{
    return QDir(root_).filePath(sanitizeFileName(filename, nextToken()));
}

namespace {

QString keepAllowed(const QString& text, bool allowDot)
{
    QString out;
    out.reserve(text.size());
    for (const QChar c : text) {
        const ushort u = c.unicode();
        const bool allowed = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
                             (u >= '0' && u <= '9') || u == '-' || u == '_' || (allowDot && u == '.');
        if (allowed) out.append(c);
    }
    return out;
}

} // namespace

QString TempArea::sanitizeFileName(const QString& filename, qint64 token)
{
    // 先按原名最后一个 '.' 拆出扩展名，再分别过滤
    QString base = filename;
    QString ext;
    const int dot = filename.lastIndexOf(QLatin1Char('.'));
    if (dot >= 0) {
        base = filename.left(dot);
        ext = keepAllowed(filename.mid(dot + 1), false);
    }

    base = keepAllowed(base, true);
    // 不允许隐藏文件 / "." / ".."
    int lead = 0;
    while (lead < base.size() && base.at(lead) == QLatin1Char('.')) ++lead;
    base.remove(0, lead);
    if (base.isEmpty()) base = QStringLiteral("asset");

    QString out = base + QLatin1Char('_') + QString::number(token);
    if (!ext.isEmpty()) out += QLatin1Char('.') + ext;
    return out;
}

qint64 TempArea::nextToken()
{
    static std::atomic<qint64> last{0};

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    qint64 prev = last.load(std::memory_order_relaxed);
    qint64 next;
    do {
        next = now > prev ? now : prev + 1;
    } while (!last.compare_exchange_weak(prev, next, std::memory_order_relaxed));
    return next;
}
