#include "transfer/bounded_writer.hpp"

BoundedWriter::BoundedWriter(QIODevice* target, qint64 maxBytes, QObject* parent)
    : QIODevice(parent), target_(target), maxBytes_(maxBytes) {}

bool BoundedWriter::open(OpenMode mode) {
    if (mode & ReadOnly) {
        setErrorString(QStringLiteral("BoundedWriter is write-only"));
        return false;
    }
    if (!target_ || !target_->isWritable()) {
        setErrorString(QStringLiteral("target device is not open for writing"));
        return false;
    }
    total_ = 0;
    exceeded_ = false;
    return QIODevice::open(mode | Unbuffered);
}

void BoundedWriter::close() {
    // 不关闭 target，由拥有者决定
    QIODevice::close();
}

qint64 BoundedWriter::readData(char*, qint64) {
    return -1;
}

qint64 BoundedWriter::writeData(const char* data, qint64 size) {
    if (exceeded_) return -1;

    if (size > maxBytes_ - total_) {
        exceeded_ = true;
        setErrorString(QStringLiteral("size limit of %1 bytes exceeded").arg(maxBytes_));
        return -1;
    }
    if (!target_) {
        setErrorString(QStringLiteral("target device is gone"));
        return -1;
    }

    qint64 written = 0;
    while (written < size) {
        const qint64 n = target_->write(data + written, size - written);
        if (n <= 0) {
            setErrorString(target_->errorString());
            total_ += written;
            return -1;
        }
        written += n;
    }
    total_ += written;
    return written;
}
