#pragma once
#include <QPointer>
#include <QString>
#include <QWidget>

// 下载流程里询问保存路径。返回空串表示用户取消。
class SavePathPrompt
{
public:
    virtual ~SavePathPrompt() = default;
    virtual QString askSavePath(const QString& suggestedName) = 0;
};

// 原生保存对话框
class DialogSavePathPrompt : public SavePathPrompt
{
public:
    explicit DialogSavePathPrompt(QWidget* parent = nullptr) : parent_(parent) {}
    QString askSavePath(const QString& suggestedName) override;

private:
    QPointer<QWidget> parent_;
};
