#pragma once
#include <QHash>
#include <QObject>
#include <QPointer>

#include "clipboard/clipboard_delivery.hpp"
#include "transfer/temp_area.hpp"
#include "transfer/transfer_types.hpp"
#include "ui/save_path_prompt.hpp"
#include "ui/window_controller.hpp"

class FileDownloader;

// UI 能调用的全部命令：下载 / 复制到剪贴板 / 隐藏。
// 所有结果都以 TransferOutcome 通过信号返回，不会抛异常。
class AssetService : public QObject
{
    Q_OBJECT
public:
    AssetService(const TempArea& temp, ClipboardDelivery& clipboard, SavePathPrompt& prompt,
                 QObject* parent = nullptr);

    void setLimits(const TransferLimits& limits) { limits_ = limits; }
    const TransferLimits& limits() const { return limits_; }
    void setWindowController(WindowController* window) { window_ = window; }

    int activeTransfers() const { return active_; }

    // 取消所有进行中的传输，退出前、最后一次 purge 之前调用
    void shutdown();

public slots:
    // 先弹保存对话框，再下载到用户选的路径
    void requestDownload(const AssetRef& asset);
    // 下载到临时目录，再把文件放到剪贴板
    void requestClipboardCopy(const AssetRef& asset);
    void requestHide();

signals:
    void downloadFinished(AssetRef asset, TransferOutcome outcome);
    void clipboardCopyFinished(AssetRef asset, TransferOutcome outcome);
    void transferProgress(AssetRef asset, qint64 received, qint64 total);
    void hideRequested();

private slots:
    void onClipboardDelivered(const TransferOutcome& outcome);

private:
    template <typename Done>
    void startTransfer_(const TransferRequest& request, Done done);

    static QString suggestedName_(const AssetRef& asset);

private:
    const TempArea& temp_;
    ClipboardDelivery& clipboard_;
    SavePathPrompt& prompt_;
    QPointer<WindowController> window_;

    TransferLimits limits_;
    int active_ = 0;

    QHash<QString, AssetRef> pendingDelivery_; // 临时文件路径 -> 资源
};
