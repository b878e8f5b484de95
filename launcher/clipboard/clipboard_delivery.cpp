#include "clipboard/clipboard_delivery.hpp"
#include "common/logger.hpp"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QSysInfo>
#include <QTimer>

const char* clipboardVariantName(ClipboardDelivery::Variant variant) {
    switch (variant) {
    case ClipboardDelivery::Variant::FileDropList: return "file-drop-list";
    case ClipboardDelivery::Variant::PosixFile:    return "posix-file";
    case ClipboardDelivery::Variant::UriList:      return "uri-list";
    }
    return "unknown";
}

ClipboardDelivery::Variant ClipboardDelivery::variantFor(const QString& kernelType) {
    const QString k = kernelType.toLower();
    if (k == QLatin1String("winnt")) return Variant::FileDropList;
    if (k == QLatin1String("darwin")) return Variant::PosixFile;
    return Variant::UriList;
}

std::unique_ptr<ClipboardDelivery> ClipboardDelivery::create(Variant variant,
                                                             const ClipboardSettings& settings,
                                                             QObject* parent) {
    switch (variant) {
    case Variant::FileDropList:
        return std::unique_ptr<ClipboardDelivery>(new PowerShellClipboardDelivery(settings, parent));
    case Variant::PosixFile:
        return std::unique_ptr<ClipboardDelivery>(new AppleScriptClipboardDelivery(settings, parent));
    case Variant::UriList:
        return std::unique_ptr<ClipboardDelivery>(new UriListClipboardDelivery(parent));
    }
    return nullptr;
}

std::unique_ptr<ClipboardDelivery> ClipboardDelivery::createForRunningOs(const ClipboardSettings& settings,
                                                                         QObject* parent) {
    const QString kernel = QSysInfo::kernelType();
    const Variant v = variantFor(kernel);
    LOG_INFO("clipboard delivery: %s (kernel=%s)", clipboardVariantName(v), qUtf8Printable(kernel));
    return create(v, settings, parent);
}

// ===================== 外部进程实现 =====================

ProcessClipboardDelivery::ProcessClipboardDelivery(const ClipboardSettings& settings, QObject* parent)
    : ClipboardDelivery(parent), settings_(settings) {}

void ProcessClipboardDelivery::deliverFile(const QString& path, const QString& /*extension*/) {
    const QFileInfo fi(path);
    if (path.isEmpty() || !fi.isFile()) {
        emit finished(TransferOutcome::failure(ErrorKind::Clipboard,
                                               QStringLiteral("no such file: %1").arg(path), path));
        return;
    }

    const HelperCommand cmd = commandFor(QDir::toNativeSeparators(fi.absoluteFilePath()));

    auto* proc = new QProcess(this);
    auto* timer = new QTimer(proc);
    timer->setSingleShot(true);

    // 超时 / 启动失败 / 退出 三者只汇报一次
    auto reported = std::make_shared<bool>(false);
    auto report = [this, proc, reported](const TransferOutcome& outcome) {
        if (*reported) return;
        *reported = true;
        if (outcome.success)
            LOG_INFO("clipboard set to file %s", qUtf8Printable(outcome.path));
        else
            LOG_WARN("clipboard delivery failed [%s]: %s", errorKindName(outcome.kind),
                     qUtf8Printable(outcome.reason));
        proc->deleteLater();
        emit finished(outcome);
    };

    connect(timer, &QTimer::timeout, this, [this, proc, path, report]() {
        proc->kill();
        report(TransferOutcome::failure(
            ErrorKind::Timeout,
            QStringLiteral("%1 did not finish within %2 ms").arg(proc->program()).arg(settings_.helperTimeoutMs),
            path));
    });

    connect(proc, &QProcess::errorOccurred, this, [proc, timer, path, report](QProcess::ProcessError err) {
        if (err != QProcess::FailedToStart) return; // 其他错误随后会有 finished
        timer->stop();
        report(TransferOutcome::failure(
            ErrorKind::Clipboard,
            QStringLiteral("cannot start %1: %2").arg(proc->program(), proc->errorString()), path));
    });

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [proc, timer, path, report](int exitCode, QProcess::ExitStatus status) {
        timer->stop();
        if (status == QProcess::CrashExit) {
            report(TransferOutcome::failure(ErrorKind::Clipboard,
                                            QStringLiteral("%1 crashed").arg(proc->program()), path));
            return;
        }
        if (exitCode != 0) {
            QString msg = QString::fromLocal8Bit(proc->readAllStandardError()).trimmed();
            if (msg.isEmpty())
                msg = QStringLiteral("%1 exited with code %2").arg(proc->program()).arg(exitCode);
            report(TransferOutcome::failure(ErrorKind::Clipboard, msg, path));
            return;
        }
        report(TransferOutcome::ok(path));
    });

    LOG_DEBUG("clipboard helper: %s", qUtf8Printable(cmd.program));
    proc->start(cmd.program, cmd.arguments);
    proc->closeWriteChannel();
    timer->start(settings_.helperTimeoutMs);
}
