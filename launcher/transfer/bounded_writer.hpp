#pragma once
#include <QIODevice>
#include <QPointer>

// 只写的 QIODevice 装饰器：累计写入字节数，超过上限时拒绝写入（返回 -1）
// 并置 limitExceeded()。与具体传输方式无关。
class BoundedWriter : public QIODevice {
    Q_OBJECT
public:
    BoundedWriter(QIODevice* target, qint64 maxBytes, QObject* parent = nullptr);

    bool open(OpenMode mode) override;
    void close() override;
    bool isSequential() const override { return true; }

    qint64 maxBytes() const { return maxBytes_; }
    qint64 total() const { return total_; }
    bool   limitExceeded() const { return exceeded_; }

protected:
    qint64 readData(char* data, qint64 maxSize) override;
    qint64 writeData(const char* data, qint64 size) override;

private:
    QPointer<QIODevice> target_;
    qint64 maxBytes_ = 0;
    qint64 total_ = 0;
    bool   exceeded_ = false;
};
