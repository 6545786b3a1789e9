#include "StatusWindow.hpp"
#include "configdesk/Constants.hpp"
#include <QApplication>
#include <QLabel>
#include <QVBoxLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QHBoxLayout>
#include <QCloseEvent>

namespace configdesk {

StatusWindow::StatusWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle(QString::fromUtf8(APP_DISPLAY_NAME));
    setMinimumSize(420, 220);
    setupUI();
}

void StatusWindow::setupUI() {
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* mainLayout = new QVBoxLayout(centralWidget);

    auto* titleLabel = new QLabel(QString::fromUtf8(APP_DISPLAY_NAME), this);
    titleLabel->setStyleSheet("font-size: 18px; font-weight: bold; margin: 10px;");
    titleLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(titleLabel);

    const QString url = QStringLiteral("http://localhost:%1").arg(SERVER_PORT);
    auto* urlLabel = new QLabel(QStringLiteral("<a href=\"%1\">%1</a>").arg(url), this);
    urlLabel->setTextFormat(Qt::RichText);
    urlLabel->setOpenExternalLinks(true);
    urlLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(urlLabel);

    auto* statusGroup = new QGroupBox("Status", this);
    auto* statusLayout = new QVBoxLayout(statusGroup);
    serverLabel = new QLabel("Server: starting", this);
    updateLabel = new QLabel("Updates: idle", this);
    statusLayout->addWidget(serverLabel);
    statusLayout->addWidget(updateLabel);
    mainLayout->addWidget(statusGroup);

    mainLayout->addStretch();

    auto* buttonLayout = new QHBoxLayout();
    auto* versionLabel = new QLabel(QStringLiteral("v%1").arg(QString::fromUtf8(APP_VERSION)), this);
    buttonLayout->addWidget(versionLabel);
    buttonLayout->addStretch();

    auto* openBtn = new QPushButton("Open dashboard", this);
    connect(openBtn, &QPushButton::clicked, this, &StatusWindow::openDashboardRequested);
    buttonLayout->addWidget(openBtn);

    auto* closeBtn = new QPushButton("Close", this);
    connect(closeBtn, &QPushButton::clicked, this, &QWidget::close);
    buttonLayout->addWidget(closeBtn);

    mainLayout->addLayout(buttonLayout);
}

void StatusWindow::setServerStatus(const QString& text) {
    serverLabel->setText("Server: " + text);
}

void StatusWindow::setUpdateStatus(const QString& text) {
    updateLabel->setText("Updates: " + text);
}

void StatusWindow::closeEvent(QCloseEvent* event) {
    if (!hideOnClose) {
        event->accept();
        QApplication::quit();
        return;
    }
    // Hide instead of closing completely; the tray keeps the app alive
    hide();
    event->ignore();
}

} // namespace configdesk
