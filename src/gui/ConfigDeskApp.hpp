#pragma once

#include <QObject>
#include <QSystemTrayIcon>
#include <QTimer>
#include <QMenu>
#include <memory>
#include <string>

#include "core/RuntimeContext.hpp"
#include "core/util/SignalWatcher.hpp"
#include "gui/StatusWindow.hpp"
#include "server/ServerSupervisor.hpp"

namespace configdesk {

class UpdateCoordinator;

class ConfigDeskApp : public QObject {
    Q_OBJECT

public:
    struct Options {
        std::string resourceDir;   // overrides Paths.ResourceDir
        bool checkForUpdates = true;
    };

    explicit ConfigDeskApp(Options options, QObject* parent = nullptr);
    ~ConfigDeskApp() override;

    ConfigDeskApp(const ConfigDeskApp&) = delete;
    ConfigDeskApp& operator=(const ConfigDeskApp&) = delete;
    ConfigDeskApp(ConfigDeskApp&&) = delete;
    ConfigDeskApp& operator=(ConfigDeskApp&&) = delete;

    bool isInitialized() const noexcept { return initialized; }

private slots:
    void openDashboard();
    void showStatus();
    void refreshStatus();
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void onAboutToQuit();
    void exitApp();

private:
    void setupSignalHandling();
    void setupTrayIcon();
    void setupStatusWindow();
    void startServer();
    void startUpdateCheck();

    Options options;

    // Shared with the background tasks, which may outlive this object
    std::shared_ptr<ServerSupervisor> supervisor;
    std::shared_ptr<UpdateCoordinator> updater;

    std::unique_ptr<QSystemTrayIcon> trayIcon;
    std::unique_ptr<QMenu> trayMenu;
    std::unique_ptr<StatusWindow> statusWindow;
    std::unique_ptr<QTimer> statusTimer;

    util::SignalWatcher signalWatcher;
    RuntimeContext runtime;

    bool initialized = false;
    bool shutdownRequested = false;

    static constexpr int STATUS_REFRESH_INTERVAL_MS = 1000;
};

} // namespace configdesk
