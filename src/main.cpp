#include <QApplication>
#include <QDir>
#include <QLockFile>
#include <QStandardPaths>
#include <iostream>
#include <string>

#include "configdesk/Constants.hpp"
#include "core/ConfigManager.hpp"
#include "core/util/SignalWatcher.hpp"
#include "gui/ConfigDeskApp.hpp"
#include "utils/Logger.hpp"

using namespace configdesk;

namespace {

void printUsage() {
    std::cout << "Usage: " << APP_NAME << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --resource-dir DIR  Directory holding the bundled server/\n";
    std::cout << "  --no-update-check   Don't look for updates at startup\n";
    std::cout << "  --debug, -d         Enable debug logging\n";
    std::cout << "  --version, -v       Print the version and exit\n";
    std::cout << "  --help, -h          Show this help\n";
}

// A restarted instance starts while the old one is still shutting down
constexpr int INSTANCE_LOCK_WAIT_MS = 10000;

QString instanceLockPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (dir.isEmpty()) {
        dir = QDir::tempPath();
    }
    return QDir(dir).filePath(QStringLiteral("%1.lock").arg(QString::fromUtf8(APP_NAME)));
}

} // namespace

int main(int argc, char* argv[]) {
    ConfigDeskApp::Options options;
    bool debugMode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--no-update-check") {
            options.checkForUpdates = false;
        } else if (arg == "--resource-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --resource-dir needs a directory\n";
                return 2;
            }
            options.resourceDir = argv[++i];
        } else if (arg.rfind("--resource-dir=", 0) == 0) {
            options.resourceDir = arg.substr(std::string("--resource-dir=").size());
        } else if (arg == "--version" || arg == "-v") {
            std::cout << APP_NAME << " " << APP_VERSION << "\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            printUsage();
            return 2;
        }
    }

    // Initialize config first
    try {
        auto& config = Configs::Get();
        config.EnsureConfigFile();
        config.Load();
        Logger::getInstance().initializeWithConfig();
        if (debugMode) {
            Logger::getInstance().setLogLevel(Logger::LOG_DEBUG);
        }
        info("{} {} starting", APP_NAME, APP_VERSION);
        CONFIGDESK_LOG_INFO("Config path: {}", config.getPath());
        for (const auto& key : config.Validate()) {
            warning("Unknown config key '{}'", key);
        }
        if (options.checkForUpdates && !config.GetCheckUpdatesOnStartup()) {
            options.checkForUpdates = false;
        }
    } catch (const std::exception& e) {
        error("Critical: Failed to initialize config: {}", e.what());
        return 1;
    }

    // Before any thread exists, so every thread inherits the mask and only
    // the watcher thread ever sees these signals
    try {
        util::blockSignals(util::watchedSignals());
    } catch (const std::exception& e) {
        error("Critical: {}", e.what());
        return 1;
    }

    QApplication app(argc, argv);
    app.setApplicationName(QString::fromUtf8(APP_NAME));
    app.setApplicationDisplayName(QString::fromUtf8(APP_DISPLAY_NAME));
    app.setApplicationVersion(QString::fromUtf8(APP_VERSION));
    app.setQuitOnLastWindowClosed(false); // Keep running in tray

    QLockFile instanceLock(instanceLockPath());
    if (!instanceLock.tryLock(INSTANCE_LOCK_WAIT_MS)) {
        qint64 pid = 0;
        QString host;
        QString appName;
        instanceLock.getLockInfo(&pid, &host, &appName);
        error("Another instance is already running (pid {})", pid);
        return 1;
    }

    try {
        ConfigDeskApp configDeskApp(options);

        if (!configDeskApp.isInitialized()) {
            error("Failed to initialize ConfigDeskApp");
            return 1;
        }

        info("{} started successfully", APP_DISPLAY_NAME);
        return app.exec();

    } catch (const std::exception& e) {
        fatal("Fatal error: {}", e.what());
        return 1;
    }
}
