#include "ui/window_controller.hpp"

#include <QEvent>
#include <QGuiApplication>
#include <QScreen>

WindowController::WindowController(QWidget* window, QObject* parent)
    : QObject(parent), window_(window)
{
    if (window_) window_->installEventFilter(this);
}

void WindowController::show()
{
    if (!window_) return;
    centerOnScreen_();
    window_->show();
    window_->raise();
    window_->activateWindow();
    if (!visible_) {
        visible_ = true;
        emit shown();
    }
}

void WindowController::hide()
{
    if (!window_) return;
    window_->hide();
    if (visible_) {
        visible_ = false;
        emit hidden();
    }
}

void WindowController::toggle()
{
    if (visible_) hide();
    else show();
}

bool WindowController::eventFilter(QObject* obj, QEvent* event)
{
    if (obj == window_ && event->type() == QEvent::WindowDeactivate
        && hideOnFocusLoss_ && visible_) {
        hide();
    }
    return QObject::eventFilter(obj, event);
}

void WindowController::centerOnScreen_()
{
    QScreen* screen = window_->screen();
    if (!screen) screen = QGuiApplication::primaryScreen();
    if (!screen) return;

    const QRect avail = screen->availableGeometry();
    QRect frame = window_->frameGeometry();
    frame.moveCenter(avail.center());
    window_->move(frame.topLeft());
}
