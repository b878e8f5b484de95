#pragma once
#include <QObject>
#include <QPointer>
#include <QWidget>

// 浮层窗口的显示状态只在这里维护
class WindowController : public QObject
{
    Q_OBJECT
public:
    explicit WindowController(QWidget* window, QObject* parent = nullptr);

    void setHideOnFocusLoss(bool enable) { hideOnFocusLoss_ = enable; }
    bool isVisible() const { return visible_; }

public slots:
    void show();
    void hide();
    void toggle();

signals:
    void shown();
    void hidden();

protected:
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    void centerOnScreen_();

    QPointer<QWidget> window_;
    bool visible_ = false;
    bool hideOnFocusLoss_ = true;
};
