#include <QApplication>
#include <QCursor>
#include <QMessageBox>
#include <QMetaObject>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include "core/ClickController.hpp"
#include "core/ConfigManager.hpp"
#include "core/automation/ClickEngine.hpp"
#include "core/automation/QtRepeatingTimer.hpp"
#include "core/automation/SerialExecutor.hpp"
#include "core/io/QtEventTap.hpp"
#include "core/io/ShortcutEngine.hpp"
#include "core/io/X11InputMonitor.hpp"
#include "core/io/X11PointerInjector.hpp"
#include "gui/SettingsWindow.hpp"
#include "utils/Logger.hpp"
#include "x11.h"

using namespace kclick;

int main(int argc, char* argv[]) {
    bool debugMode = false;
    std::string configPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a path\n";
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: kclick [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --config, -c <path>  Use this settings file\n";
            std::cout << "  --debug, -d          Enable debug logging\n";
            std::cout << "  --help, -h           Show this help\n";
            return 0;
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return 1;
        }
    }

    Logger::getInstance().initialize();
    if (debugMode) {
        Logger::getInstance().setLogLevel(Logger::LOG_DEBUG);
    }

    // Initialize config first
    auto& config = Configs::Get();
    if (!configPath.empty()) {
        config.setPath(configPath);
    }
    config.EnsureConfigFile();
    config.Load();
    info("Config path: {}", config.getPath());

    // The GUI thread, the input monitor and the click worker all talk to Xlib
    if (!XInitThreads()) {
        error("Failed to initialize X11 threading support");
        return 1;
    }

    XSetIOErrorHandler([](Display*) -> int {
        error("X11 connection lost - exiting");
        std::exit(1);
        return 0;
    });

    QApplication app(argc, argv);
    QApplication::setApplicationName("KClick");

    automation::SerialExecutor executor("kclick-clicker");
    auto injector = std::make_shared<io::X11PointerInjector>();

    int status = 0;
    try {
        // Monitor events arrive on its own thread; handlers run on the GUI thread
        io::X11InputMonitor globalMonitor([&app](std::function<void()> work) {
            QMetaObject::invokeMethod(&app, std::move(work), Qt::QueuedConnection);
        });
        io::QtEventTap localTap(&app);

        automation::ClickEngine clickEngine(config,
                                            std::make_unique<automation::QtRepeatingTimer>(),
                                            injector,
                                            executor);
        clickEngine.setWindowProbe([]() {
            return QApplication::widgetAt(QCursor::pos()) != nullptr;
        });

        io::ShortcutEngine shortcutEngine(globalMonitor, localTap, config);
        ClickController controller(clickEngine, shortcutEngine);

        SettingsWindow window(clickEngine, shortcutEngine);
        window.show();

        status = app.exec();

        clickEngine.stop();
        const auto stats = clickEngine.stats();
        info("Exiting: {} firings, {} clicks injected, {} suppressed, {} failed",
             stats.firings, stats.injected, stats.suppressed, stats.failed);
    } catch (const io::InputHookError& e) {
        fatal("Cannot observe input: {}", e.what());
        QMessageBox::critical(nullptr, "KClick",
                              QString("Global input monitoring is unavailable:\n%1").arg(e.what()));
        status = 1;
    }

    executor.shutdown();
    return status;
}
