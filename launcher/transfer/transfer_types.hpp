#pragma once
#include <QString>
#include <QJsonObject>
#include <QMetaType>
#include <QtGlobal>

// 远端资源：url + 期望的本地文件名 + 扩展名（调用方提供，不信任 Content-Type）
struct AssetRef {
    QString url;
    QString filename;
    QString extension;
};

struct TransferLimits {
    static constexpr qint64 kDefaultMaxBytes  = 500LL * 1024 * 1024; // 500 MiB
    static constexpr int    kDefaultTimeoutMs = 30000;

    qint64 maxBytes  = kDefaultMaxBytes;
    int    timeoutMs = kDefaultTimeoutMs; // 无响应超时，每收到数据重新计时
};

// 目标只能是：用户在保存对话框里选的路径，或托管临时目录里净化过的名字
struct DestinationSpec {
    enum class Kind { UserChosenPath, ManagedTempPath };

    Kind    kind = Kind::UserChosenPath;
    QString path;

    static DestinationSpec userChosen(const QString& p) { return {Kind::UserChosenPath, p}; }
    static DestinationSpec managedTemp(const QString& p) { return {Kind::ManagedTempPath, p}; }
};

struct TransferRequest {
    AssetRef        source;
    DestinationSpec destination;
    TransferLimits  limits;
};

enum class ErrorKind {
    None = 0,
    HttpStatus,
    SizeLimitExceeded,
    Timeout,
    Transport,
    Filesystem,
    Clipboard,
    UserCanceled
};

const char* errorKindName(ErrorKind kind);

struct TransferOutcome {
    bool      success = false;
    QString   path;    // 成功：落地路径；失败：相关的目标路径（可能为空）
    QString   reason;
    ErrorKind kind = ErrorKind::None;

    static TransferOutcome ok(const QString& path);
    static TransferOutcome failure(ErrorKind kind, const QString& reason,
                                   const QString& path = QString());

    // 给 UI 的统一形状：{success, path} 或 {success, message, kind}
    QJsonObject toJson() const;
};

Q_DECLARE_METATYPE(TransferOutcome)
