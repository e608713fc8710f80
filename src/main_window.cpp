#include "speccle/main_window.hpp"

#include "speccle/logging.hpp"

#include <QClipboard>
#include <QFontDatabase>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTimer>
#include <QVBoxLayout>
#include <QWidget>
#include <QtConcurrent/QtConcurrent>

#include <utility>

namespace {

constexpr int kCopiedNoticeMs = 2000;

} // namespace

MainWindow::MainWindow(std::shared_ptr<const speccle::HardwareFactCollector> collector, QWidget* parent)
    : QMainWindow(parent), collector_(std::move(collector)) {
    setWindowTitle("Speccle - System Specs");
    resize(600, 500);
    setMinimumSize(400, 300);

    auto* central = new QWidget(this);
    auto* rootLayout = new QVBoxLayout(central);
    rootLayout->setContentsMargins(10, 10, 10, 10);
    rootLayout->setSpacing(10);

    reportView_ = new QPlainTextEdit(central);
    reportView_->setObjectName("reportView");
    reportView_->setReadOnly(true);
    reportView_->setLineWrapMode(QPlainTextEdit::WidgetWidth);
    reportView_->setTextInteractionFlags(Qt::TextSelectableByMouse | Qt::TextSelectableByKeyboard);
    QFont font = QFontDatabase::systemFont(QFontDatabase::FixedFont);
    font.setPointSize(11);
    reportView_->setFont(font);

    auto* bottomBar = new QHBoxLayout();
    statusLabel_ = new QLabel(central);
    statusLabel_->setObjectName("statusLabel");
    copyButton_ = new QPushButton("Copy to Clipboard", central);
    copyButton_->setObjectName("copyButton");
    copyButton_->setEnabled(false);
    bottomBar->addStretch(1);
    bottomBar->addWidget(statusLabel_);
    bottomBar->addWidget(copyButton_);

    rootLayout->addWidget(reportView_, 1);
    rootLayout->addLayout(bottomBar);
    setCentralWidget(central);

    connect(copyButton_, &QPushButton::clicked, this, &MainWindow::copyReport);
    connect(&watcher_, &QFutureWatcher<speccle::SystemSnapshot>::finished, this, &MainWindow::showSnapshot);

    applyTheme();
    startCollection();
}

QString MainWindow::reportText() const {
    return reportView_->toPlainText();
}

void MainWindow::startCollection() {
    reportView_->setPlainText("Detecting system specifications...");

    auto collector = collector_;
    watcher_.setFuture(QtConcurrent::run([collector] { return collector->collect(); }));
}

void MainWindow::showSnapshot() {
    const speccle::SystemSnapshot snapshot = watcher_.result();
    reportView_->setPlainText(QString::fromStdString(speccle::renderReport(snapshot)));
    copyButton_->setEnabled(true);
    qCDebug(lcUi) << "snapshot displayed," << snapshot.gpus.size() << "GPU(s)," << snapshot.storage.size()
                  << "drive(s)";
}

void MainWindow::copyReport() {
    QClipboard* clipboard = QGuiApplication::clipboard();
    clipboard->clear();
    clipboard->setText(reportText().trimmed());

    statusLabel_->setText("Copied!");
    QTimer::singleShot(kCopiedNoticeMs, statusLabel_, &QLabel::clear);
}

void MainWindow::applyTheme() {
    setStyleSheet(
        "QMainWindow {"
        "  background: #ffffff;"
        "  color: #000000;"
        "}"
        "QPlainTextEdit#reportView {"
        "  background: #ffffff;"
        "  color: #000000;"
        "  border: 1px solid #cccccc;"
        "  padding: 10px;"
        "}"
        "QPlainTextEdit#reportView:focus {"
        "  border: 1px solid #0078d4;"
        "}"
        "QPushButton {"
        "  background: #ffffff;"
        "  color: #000000;"
        "  border: 2px solid #000000;"
        "  border-radius: 8px;"
        "  padding: 8px 14px;"
        "  min-width: 140px;"
        "}"
        "QPushButton:hover {"
        "  background: #efefef;"
        "}"
        "QPushButton:pressed {"
        "  background: #dcdcdc;"
        "}"
        "QPushButton:disabled {"
        "  color: #888888;"
        "  border-color: #888888;"
        "}"
        "QLabel#statusLabel {"
        "  color: #1a7f37;"
        "}"
    );
}
