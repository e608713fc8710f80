#include "speccle/fact_collector.hpp"
#include "speccle/main_window.hpp"

#include <QApplication>

#include <memory>

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("Speccle");

    auto collector = std::make_shared<const speccle::HardwareFactCollector>(
        std::shared_ptr<const speccle::PlatformSource>(speccle::makePlatformSource()));

    MainWindow window(collector);
    window.show();
    return app.exec();
}
