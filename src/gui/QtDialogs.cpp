#include "QtDialogs.hpp"
#include "utils/Logger.hpp"

#include <QMessageBox>
#include <QPushButton>
#include <QThread>

namespace configdesk {

namespace {
QMessageBox::Icon iconFor(MessageKind kind) {
    switch (kind) {
        case MessageKind::Warning: return QMessageBox::Warning;
        case MessageKind::Error: return QMessageBox::Critical;
        case MessageKind::Info: break;
    }
    return QMessageBox::Information;
}
} // namespace

QtDialogs::QtDialogs(QObject* parent) : QObject(parent) {}

bool QtDialogs::ask(const MessageDialog& dialog) {
    return exec(dialog, true);
}

void QtDialogs::show(const MessageDialog& dialog) {
    exec(dialog, false);
}

bool QtDialogs::exec(const MessageDialog& dialog, bool withCancel) {
    bool accepted = false;
    auto runBox = [&dialog, withCancel, &accepted]() {
        QMessageBox box(iconFor(dialog.kind),
                        QString::fromStdString(dialog.title),
                        QString::fromStdString(dialog.body));
        QPushButton* ok = box.addButton(QString::fromStdString(dialog.okLabel), QMessageBox::AcceptRole);
        if (withCancel) {
            box.addButton(QString::fromStdString(dialog.cancelLabel), QMessageBox::RejectRole);
        }
        box.setDefaultButton(ok);
        box.exec();
        accepted = box.clickedButton() == ok;
    };

    if (QThread::currentThread() == thread()) {
        runBox();
    } else if (!QMetaObject::invokeMethod(this, runBox, Qt::BlockingQueuedConnection)) {
        error("QtDialogs: could not show '{}' on the GUI thread", dialog.title);
    }
    return accepted;
}

} // namespace configdesk
