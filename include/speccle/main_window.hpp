#pragma once

#include "speccle/fact_collector.hpp"
#include "speccle/system_info.hpp"

#include <QFutureWatcher>
#include <QMainWindow>

#include <memory>

class QLabel;
class QPlainTextEdit;
class QPushButton;
class QWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(std::shared_ptr<const speccle::HardwareFactCollector> collector, QWidget* parent = nullptr);

    QString reportText() const;

private slots:
    void showSnapshot();
    void copyReport();

private:
    void startCollection();
    void applyTheme();

    std::shared_ptr<const speccle::HardwareFactCollector> collector_;
    QFutureWatcher<speccle::SystemSnapshot> watcher_;

    QPlainTextEdit* reportView_ = nullptr;
    QPushButton* copyButton_ = nullptr;
    QLabel* statusLabel_ = nullptr;
};
