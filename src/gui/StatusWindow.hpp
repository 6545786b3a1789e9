#pragma once

#include <QMainWindow>

class QLabel;

namespace configdesk {

// Small window with the dashboard address and what the host is doing
class StatusWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit StatusWindow(QWidget* parent = nullptr);

    void setServerStatus(const QString& text);
    void setUpdateStatus(const QString& text);

    // Without a tray icon, closing the window ends the app
    void setHideOnClose(bool hide) { hideOnClose = hide; }

signals:
    void openDashboardRequested();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUI();

    QLabel* serverLabel = nullptr;
    QLabel* updateLabel = nullptr;
    bool hideOnClose = true;
};

} // namespace configdesk
