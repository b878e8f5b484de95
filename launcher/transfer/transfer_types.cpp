#include "transfer/transfer_types.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:              return "None";
    case ErrorKind::HttpStatus:        return "HttpStatusError";
    case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
    case ErrorKind::Timeout:           return "TimeoutError";
    case ErrorKind::Transport:         return "TransportError";
    case ErrorKind::Filesystem:        return "FilesystemError";
    case ErrorKind::Clipboard:         return "ClipboardError";
    case ErrorKind::UserCanceled:      return "UserCanceled";
    }
    return "Unknown";
}

TransferOutcome TransferOutcome::ok(const QString& path) {
    TransferOutcome o;
    o.success = true;
    o.path = path;
    return o;
}

TransferOutcome TransferOutcome::failure(ErrorKind kind, const QString& reason,
                                         const QString& path) {
    TransferOutcome o;
    o.success = false;
    o.kind = kind;
    o.reason = reason;
    o.path = path;
    return o;
}

QJsonObject TransferOutcome::toJson() const {
    if (success)
        return QJsonObject{{"success", true}, {"path", path}};

    return QJsonObject{
        {"success", false},
        {"message", reason},
        {"kind", QString::fromLatin1(errorKindName(kind))}
    };
}
