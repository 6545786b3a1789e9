#pragma once

#include <QObject>

#include "Dialogs.hpp"

namespace configdesk {

// QMessageBox-backed dialogs. Must be created on the GUI thread; calls from
// other threads block until the GUI thread has shown and closed the box.
class QtDialogs : public QObject, public Dialogs {
    Q_OBJECT

public:
    explicit QtDialogs(QObject* parent = nullptr);

    bool ask(const MessageDialog& dialog) override;
    void show(const MessageDialog& dialog) override;

private:
    bool exec(const MessageDialog& dialog, bool withCancel);
};

} // namespace configdesk
