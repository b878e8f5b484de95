#pragma once
#include <QLabel>
#include <QListWidget>
#include <QVector>
#include <QWidget>

#include "catalog/catalog_client.hpp"

class AssetService;

// 最小的浮层：资源列表 + 状态栏。
// Enter 复制到剪贴板，Ctrl+S 下载，Esc 隐藏，Ctrl+Q 退出。
class LauncherWindow : public QWidget
{
    Q_OBJECT
public:
    explicit LauncherWindow(QWidget* parent = nullptr);

    void setService(AssetService* service);

public slots:
    void setAssets(const QVector<AssetRecord>& assets);
    void showStatus(const QString& text);

protected:
    void keyPressEvent(QKeyEvent* event) override;

private:
    const AssetRecord* currentAsset_() const;

    QListWidget* list_ = nullptr;
    QLabel* status_ = nullptr;
    AssetService* service_ = nullptr;
    QVector<AssetRecord> assets_;
};
