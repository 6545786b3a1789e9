#include "AppRestarter.hpp"
#include "utils/Logger.hpp"

#include <QCoreApplication>
#include <QProcess>
#include <QStringList>

namespace configdesk {

AppRestarter::AppRestarter(std::string executable) : executable(std::move(executable)) {}

void AppRestarter::restart() {
    QStringList args = QCoreApplication::arguments();
    if (!args.isEmpty()) {
        args.removeFirst();
    }

    qint64 pid = 0;
    if (!QProcess::startDetached(QString::fromStdString(executable), args, QString(), &pid)) {
        error("Failed to restart {}, keeping the current instance", executable);
        return;
    }
    info("Restarted as pid {}, quitting", pid);
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit, Qt::QueuedConnection);
}

} // namespace configdesk
