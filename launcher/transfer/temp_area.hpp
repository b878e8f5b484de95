#pragma once
#include <QString>
#include <QtGlobal>
#include <utility>

// 剪贴板流程用的临时目录。进程启动和正常退出时各 purge 一次。
// purge 与写入同一目录的传输不能并发，由调用方保证先后顺序。
class TempArea
{
public:
    explicit TempArea(QString root) : root_(std::move(root)) {}

    // <系统临时目录>/<dirName>
    static QString defaultRoot(const QString& dirName);

    const QString& root() const { return root_; }

    // 目录存在则清空（单项失败只记日志继续），不存在则创建。
    // 全部清理成功返回 true；不会抛异常。根目录不可信时什么都不删，返回 false。
    bool purge() const;

    // 写入前调用：不存在则创建，权限收紧为仅属主可访问，再做 checkRoot
    bool prepare(QString* error) const;

    // 根目录必须是当前用户拥有的真实目录（不是符号链接）；不存在也算通过
    bool checkRoot(QString* error) const;

    // root/<净化后的名字>，名字里插入唯一时间戳
    QString sanitizedDestination(const QString& filename) const;

    // 只保留 [A-Za-z0-9._-]，去掉前导 '.'，在扩展名前插入 "_<token>"
    static QString sanitizeFileName(const QString& filename, qint64 token);

    // 单调递增的毫秒时间戳，同一毫秒内多次调用也不重复
    static qint64 nextToken();

private:
    QString root_;
};
