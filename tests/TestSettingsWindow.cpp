#include <gtest/gtest.h>
#include <QApplication>
#include <QEnterEvent>
#include "Fakes.hpp"
#include "core/ConfigManager.hpp"
#include "core/io/KeyMap.hpp"
#include "gui/SettingsWindow.hpp"

using namespace kclick;
using namespace kclick::automation;
using namespace kclick::io;
using namespace kclick::test;

class TestSettingsWindow : public ::testing::Test {
protected:
    TestSettingsWindow() : file("settings-window"), config(file.path) {
        auto timer = std::make_unique<FakeTimer>();
        clickEngine = std::make_unique<ClickEngine>(config, std::move(timer), injector, executor);
        shortcutEngine = std::make_unique<ShortcutEngine>(global, local, config);
        window = std::make_unique<SettingsWindow>(*clickEngine, *shortcutEngine);
    }

    ~TestSettingsWindow() override {
        window.reset();
    }

    TempConfigFile file;
    Configs config;
    FakeInputSource global{false, "global"};
    FakeInputSource local{true, "local"};
    std::shared_ptr<FakePointerInjector> injector = std::make_shared<FakePointerInjector>();
    InlineExecutor executor;
    std::unique_ptr<ClickEngine> clickEngine;
    std::unique_ptr<ShortcutEngine> shortcutEngine;
    std::unique_ptr<SettingsWindow> window;
};

TEST_F(TestSettingsWindow, TestStatusFollowsEngine) {
    EXPECT_EQ(window->statusText(), "Idle");
    clickEngine->start();
    EXPECT_EQ(window->statusText(), "Active");
    clickEngine->setExternalPause(true);
    EXPECT_EQ(window->statusText(), "Paused");
    clickEngine->stop();
    EXPECT_EQ(window->statusText(), "Idle");
}

TEST_F(TestSettingsWindow, TestShortcutButton) {
    EXPECT_EQ(window->shortcutText(), "Not Set");
    shortcutEngine->startRecording();
    EXPECT_EQ(window->shortcutText(), "Recording...");

    local.emit(keyEvent(InputEventType::KeyDown, vk::K, ModCommand, 10));
    EXPECT_EQ(window->shortcutText(), QString::fromUtf8("⌘K"));
}

TEST_F(TestSettingsWindow, TestHintNamesPauseModifier) {
    EXPECT_EQ(window->hintText(), "Hold Fn to pause clicking");
}

TEST_F(TestSettingsWindow, TestStartStopOnlyInToggleMode) {
    EXPECT_TRUE(window->isStartStopShown());
    clickEngine->setMode(ClickMode::Hold);
    window->refresh();
    EXPECT_FALSE(window->isStartStopShown());
}

TEST_F(TestSettingsWindow, TestPointerOverWindowSuppressesClicks) {
    QEnterEvent enter(QPointF(1, 1), QPointF(1, 1), QPointF(1, 1));
    QApplication::sendEvent(window.get(), &enter);
    EXPECT_TRUE(clickEngine->isSuppressed());

    QEvent leave(QEvent::Leave);
    QApplication::sendEvent(window.get(), &leave);
    EXPECT_FALSE(clickEngine->isSuppressed());
}
