#include "ConfigDeskApp.hpp"
#include <QApplication>
#include <QColor>
#include <QDesktopServices>
#include <QIcon>
#include <QPixmap>
#include <QUrl>
#include <stdexcept>

#include "configdesk/Constants.hpp"
#include "core/ConfigManager.hpp"
#include "core/util/Env.hpp"
#include "gui/AppRestarter.hpp"
#include "gui/QtDialogs.hpp"
#include "gui/ThreadAffinity.hpp"
#include "server/ServerCommand.hpp"
#include "update/ManifestUpdateSource.hpp"
#include "update/UpdateCoordinator.hpp"
#include "utils/Logger.hpp"

namespace configdesk {

namespace {

LogSink& serverLogSink() {
    static LoggerSink sink;
    return sink;
}

// Everything the update task touches. Shared by the app and the task, and
// only ever destroyed on the GUI thread
struct UpdateComponents {
    ManifestUpdateSource source;
    QtDialogs dialogs;
    AppRestarter restarter;
    UpdateCoordinator coordinator;

    UpdateComponents(std::vector<std::string> endpoints, int timeoutMs)
        : source(std::move(endpoints), APP_VERSION, UpdateInstaller(), timeoutMs)
        , restarter(UpdateInstaller::installTarget())
        , coordinator(source, dialogs, restarter) {}
};

QString describeUpdateState(UpdateState state) {
    switch (state) {
        case UpdateState::Idle: return "idle";
        case UpdateState::Checking: return "checking";
        case UpdateState::NoUpdate: return "up to date";
        case UpdateState::UpdateFound:
        case UpdateState::Prompting: return "update available";
        case UpdateState::Declined: return "update postponed";
        case UpdateState::Accepted:
        case UpdateState::Installing: return "installing";
        case UpdateState::InstallFailed: return "install failed";
        case UpdateState::InstallSucceeded:
        case UpdateState::Restarting: return "restarting";
    }
    return "idle";
}

} // namespace

ConfigDeskApp::ConfigDeskApp(Options options, QObject* parent)
    : QObject(parent)
    , options(std::move(options))
    , supervisor(std::make_shared<ServerSupervisor>(serverLogSink())) {

    try {
        setupSignalHandling();
        setupTrayIcon();
        setupStatusWindow();

        connect(qApp, &QCoreApplication::aboutToQuit, this, &ConfigDeskApp::onAboutToQuit);

        startServer();
        if (this->options.checkForUpdates) {
            startUpdateCheck();
        } else {
            info("Update check disabled");
        }
        initialized = true;
        info("ConfigDeskApp initialized successfully");
    } catch (const std::exception& e) {
        error("Failed to initialize ConfigDeskApp: {}", e.what());
        throw;
    }
}

ConfigDeskApp::~ConfigDeskApp() {
    onAboutToQuit();
    trayMenu.reset();
    trayIcon.reset();
}

void ConfigDeskApp::setupSignalHandling() {
    // The signals themselves are blocked in main() before any thread exists
    signalWatcher.setCleanupCallback([](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit, Qt::QueuedConnection);
    });
    try {
        signalWatcher.start();
        info("Signal handling initialized");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to set up signal handling: " + std::string(e.what()));
    }
}

void ConfigDeskApp::setupTrayIcon() {
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        // The status window is enough to drive the app
        warning("System tray is not available, showing the status window only");
        return;
    }

    trayIcon = std::make_unique<QSystemTrayIcon>(this);

    QIcon icon = QIcon::fromTheme(QStringLiteral("preferences-system"));
    if (icon.isNull()) {
        QPixmap pixmap(16, 16);
        pixmap.fill(QColor(217, 119, 87));
        icon = QIcon(pixmap);
    }
    trayIcon->setIcon(icon);
    trayIcon->setToolTip(QString::fromUtf8(APP_DISPLAY_NAME));

    trayMenu = std::make_unique<QMenu>();
    trayMenu->addAction("Open dashboard", this, &ConfigDeskApp::openDashboard);
    trayMenu->addAction("Status", this, &ConfigDeskApp::showStatus);
    trayMenu->addSeparator();
    trayMenu->addAction("Exit", this, &ConfigDeskApp::exitApp);

    trayIcon->setContextMenu(trayMenu.get());

    connect(trayIcon.get(), &QSystemTrayIcon::activated,
            this, &ConfigDeskApp::onTrayActivated);

    trayIcon->show();
    info("System tray icon created");
}

void ConfigDeskApp::setupStatusWindow() {
    statusWindow = std::make_unique<StatusWindow>();
    connect(statusWindow.get(), &StatusWindow::openDashboardRequested,
            this, &ConfigDeskApp::openDashboard);

    statusTimer = std::make_unique<QTimer>(this);
    connect(statusTimer.get(), &QTimer::timeout, this, &ConfigDeskApp::refreshStatus);
    statusTimer->start(STATUS_REFRESH_INTERVAL_MS);

    if (!trayIcon) {
        statusWindow->setHideOnClose(false);
        statusWindow->show();
    }
}

void ConfigDeskApp::startServer() {
    std::string resourceDir = options.resourceDir;
    if (resourceDir.empty()) {
        resourceDir = Configs::Get().GetResourceDir();
    }

    runtime.spawn("server", [supervisor = supervisor, resourceDir]() {
        const CommandSpec spec = resolveServerCommand(resolveResourceRoot(resourceDir));
        info("Starting {} server from {}", toString(spec.mode), spec.executable);
        if (spec.mode == LaunchMode::Development && Env::which(spec.executable).empty()) {
            warning("'{}' was not found in PATH", spec.executable);
        }
        // Spawn failures are logged by the supervisor itself
        supervisor->spawnAndSupervise(spec);
    });
}

void ConfigDeskApp::startUpdateCheck() {
    auto& config = Configs::Get();
    auto components = std::make_shared<UpdateComponents>(config.GetUpdateEndpoints(),
                                                         config.GetUpdateTimeoutMs());
    // Created here so QtDialogs lives on the GUI thread
    updater = std::shared_ptr<UpdateCoordinator>(components, &components->coordinator);

    runtime.spawn("updater", [updater = updater]() mutable {
        updater->run();
        // Never the last reference to QtDialogs on this thread
        releaseOnThreadOf(QCoreApplication::instance(), std::move(updater));
    });
}

void ConfigDeskApp::refreshStatus() {
    if (!statusWindow) {
        return;
    }
    if (supervisor->isActive()) {
        statusWindow->setServerStatus(QStringLiteral("running (pid %1)").arg(supervisor->getPid()));
    } else {
        statusWindow->setServerStatus("stopped");
    }
    if (updater) {
        statusWindow->setUpdateStatus(describeUpdateState(updater->state()));
    } else {
        statusWindow->setUpdateStatus("disabled");
    }
}

void ConfigDeskApp::openDashboard() {
    const QUrl url(QStringLiteral("http://localhost:%1").arg(SERVER_PORT));
    if (!QDesktopServices::openUrl(url)) {
        error("Failed to open {}", url.toString().toStdString());
    }
}

void ConfigDeskApp::showStatus() {
    refreshStatus();
    statusWindow->show();
    statusWindow->raise();
    statusWindow->activateWindow();
}

void ConfigDeskApp::onTrayActivated(QSystemTrayIcon::ActivationReason reason) {
    if (reason == QSystemTrayIcon::Trigger || reason == QSystemTrayIcon::DoubleClick) {
        showStatus();
    }
}

void ConfigDeskApp::onAboutToQuit() {
    if (shutdownRequested) {
        return;
    }
    shutdownRequested = true;
    info("Shutting down");

    if (statusTimer) {
        statusTimer->stop();
    }
    supervisor->shutdown();
    signalWatcher.stop();
}

void ConfigDeskApp::exitApp() {
    info("User requested exit");
    QApplication::quit();
}

} // namespace configdesk
