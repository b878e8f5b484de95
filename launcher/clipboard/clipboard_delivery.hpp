#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>

#include "transfer/transfer_types.hpp"

struct ClipboardSettings {
    static constexpr int kDefaultHelperTimeoutMs = 10000;

    int helperTimeoutMs = kDefaultHelperTimeoutMs; // 外部进程最长执行时间
};

// 把一个本地文件（作为文件对象，而不是字节）放到系统剪贴板。
// 每个平台一个实现，构造时按运行时平台选定。
class ClipboardDelivery : public QObject {
    Q_OBJECT
public:
    enum class Variant {
        FileDropList, // Windows: PowerShell Set-Clipboard
        PosixFile,    // macOS: osascript POSIX file
        UriList       // 其他: 进程内 text/uri-list + text/plain
    };

    explicit ClipboardDelivery(QObject* parent = nullptr) : QObject(parent) {}
    ~ClipboardDelivery() override = default;

    // kernelType 同 QSysInfo::kernelType()："winnt" / "darwin" / "linux" ...
    static Variant variantFor(const QString& kernelType);
    static std::unique_ptr<ClipboardDelivery> create(Variant variant, const ClipboardSettings& settings,
                                                     QObject* parent = nullptr);
    static std::unique_ptr<ClipboardDelivery> createForRunningOs(const ClipboardSettings& settings,
                                                                 QObject* parent = nullptr);

    virtual Variant variant() const = 0;

    // 结果通过 finished 返回，outcome.path 总是等于传入的 path。
    // extension 只用来判断是否额外附带图片数据（不是每个实现都用）。
    virtual void deliverFile(const QString& path, const QString& extension = QString()) = 0;

signals:
    void finished(TransferOutcome outcome);
};

const char* clipboardVariantName(ClipboardDelivery::Variant variant);

// 外部命令：程序 + 参数向量，不经过 shell
struct HelperCommand {
    QString     program;
    QStringList arguments;
};

// 通过外部辅助进程写剪贴板的实现共用的部分：启动、超时、错误归类
class ProcessClipboardDelivery : public ClipboardDelivery {
    Q_OBJECT
public:
    explicit ProcessClipboardDelivery(const ClipboardSettings& settings, QObject* parent = nullptr);

    void deliverFile(const QString& path, const QString& extension = QString()) override;

    // 纯函数，便于单测
    virtual HelperCommand commandFor(const QString& path) const = 0;

protected:
    ClipboardSettings settings_;
};

// Variant A：PowerShell 单引号字面量 + -EncodedCommand
class PowerShellClipboardDelivery : public ProcessClipboardDelivery {
    Q_OBJECT
public:
    using ProcessClipboardDelivery::ProcessClipboardDelivery;

    Variant variant() const override { return Variant::FileDropList; }
    HelperCommand commandFor(const QString& path) const override;

    // 'xxx'，内部的单引号（含 PowerShell 认作单引号的 U+2018..U+201B）全部双写
    static QString quoteLiteral(const QString& text);
    static QString scriptFor(const QString& path);
    // UTF-16LE 再 Base64，-EncodedCommand 要求的格式
    static QString encodeCommand(const QString& script);
};

// Variant B：osascript -e 'set the clipboard to (POSIX file "...")'
class AppleScriptClipboardDelivery : public ProcessClipboardDelivery {
    Q_OBJECT
public:
    using ProcessClipboardDelivery::ProcessClipboardDelivery;

    Variant variant() const override { return Variant::PosixFile; }
    HelperCommand commandFor(const QString& path) const override;

    // "xxx"，反斜杠和双引号加反斜杠转义
    static QString quoteString(const QString& text);
};

class QMimeData;

// Variant C：直接写进程内剪贴板
class UriListClipboardDelivery : public ClipboardDelivery {
    Q_OBJECT
public:
    using ClipboardDelivery::ClipboardDelivery;

    Variant variant() const override { return Variant::UriList; }
    void deliverFile(const QString& path, const QString& extension = QString()) override;

    // text/uri-list: file://<path>；text/plain: path；图片扩展名时附带图像
    static QMimeData* buildMimeData(const QString& path, const QString& extension);
    static bool isImageExtension(const QString& extension);
};
