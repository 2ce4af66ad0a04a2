#include <gtest/gtest.h>
#include <QApplication>
#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Widgets without a display server
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);

    kclick::Logger::getInstance().setLogLevel(kclick::Logger::LOG_WARNING);
    return RUN_ALL_TESTS();
}
