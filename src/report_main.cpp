#include "speccle/system_info.hpp"

#include <QCoreApplication>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("speccle-report");

    try {
        const speccle::SystemSnapshot snapshot = speccle::collectSystemSnapshot();
        std::cout << speccle::renderReport(snapshot) << '\n';
    } catch (const std::exception& e) {
        std::cerr << "speccle error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
