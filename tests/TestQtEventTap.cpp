#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QKeyEvent>
#include <QMouseEvent>
#include <X11/keysym.h>
#include <vector>
#include "core/Shortcut.hpp"
#include "core/io/KeyMap.hpp"
#include "core/io/QtEventTap.hpp"

using namespace kclick;
using namespace kclick::io;

class TestQtEventTap : public ::testing::Test {
protected:
    TestQtEventTap() : tap(QCoreApplication::instance()) {}

    void subscribe(bool consume = false) {
        subscription = tap.subscribe([this, consume](const InputEvent& event) {
            events.push_back(event);
            return consume;
        });
    }

    bool sendKey(QEvent::Type type, int qtKey, Qt::KeyboardModifiers modifiers, quint32 keysym,
                 quint64 time, bool autoRepeat = false) {
        QKeyEvent event(type, qtKey, modifiers, 0, keysym, 0, QString(), autoRepeat);
        event.setTimestamp(time);
        return tap.eventFilter(&tap, &event);
    }

    bool sendMouse(QEvent::Type type, Qt::MouseButton button, quint64 time) {
        QMouseEvent event(type, QPointF(5, 5), QPointF(5, 5), button, button, Qt::NoModifier);
        event.setTimestamp(time);
        return tap.eventFilter(&tap, &event);
    }

    QtEventTap tap;
    Subscription subscription;
    std::vector<InputEvent> events;
};

TEST_F(TestQtEventTap, TestKeyPress) {
    subscribe();
    EXPECT_FALSE(sendKey(QEvent::KeyPress, Qt::Key_K, Qt::ShiftModifier | Qt::MetaModifier, XK_K, 1234));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, InputEventType::KeyDown);
    EXPECT_EQ(events[0].code, vk::K);
    EXPECT_EQ(events[0].modifiers, static_cast<uint32_t>(ModShift | ModCommand));
    EXPECT_EQ(events[0].time, 1234u);
    EXPECT_FALSE(events[0].isRepeat);
}

TEST_F(TestQtEventTap, TestConsumingHandlerSwallowsEvent) {
    subscribe(true);
    EXPECT_TRUE(sendKey(QEvent::KeyPress, Qt::Key_Space, Qt::NoModifier, XK_space, 1));
    EXPECT_TRUE(sendMouse(QEvent::MouseButtonPress, Qt::RightButton, 2));
}

TEST_F(TestQtEventTap, TestAutoRepeat) {
    subscribe();
    sendKey(QEvent::KeyPress, Qt::Key_Z, Qt::NoModifier, XK_z, 1);
    sendKey(QEvent::KeyRelease, Qt::Key_Z, Qt::NoModifier, XK_z, 30, true);
    sendKey(QEvent::KeyPress, Qt::Key_Z, Qt::NoModifier, XK_z, 30, true);
    sendKey(QEvent::KeyRelease, Qt::Key_Z, Qt::NoModifier, XK_z, 60);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, InputEventType::KeyDown);
    EXPECT_FALSE(events[0].isRepeat);
    EXPECT_EQ(events[1].type, InputEventType::KeyDown);
    EXPECT_TRUE(events[1].isRepeat);
    EXPECT_EQ(events[2].type, InputEventType::KeyUp);
    EXPECT_FALSE(events[2].isRepeat);
}

TEST_F(TestQtEventTap, TestModifierKeysAreFlagsChanged) {
    subscribe();
    sendKey(QEvent::KeyPress, Qt::Key_Shift, Qt::ShiftModifier, XK_Shift_L, 1);
    sendKey(QEvent::KeyRelease, Qt::Key_Shift, Qt::NoModifier, XK_Shift_L, 2);
    sendKey(QEvent::KeyPress, Qt::Key_Hyper_L, Qt::NoModifier, XK_Hyper_L, 3);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, InputEventType::FlagsChanged);
    EXPECT_EQ(events[0].code, vk::Shift);
    EXPECT_EQ(events[0].modifiers, static_cast<uint32_t>(ModShift));
    EXPECT_EQ(events[1].type, InputEventType::FlagsChanged);
    EXPECT_EQ(events[1].modifiers, static_cast<uint32_t>(ModNone));
    EXPECT_EQ(events[2].code, vk::Function);
    EXPECT_EQ(events[2].modifiers, static_cast<uint32_t>(ModFunction));
}

TEST_F(TestQtEventTap, TestUnknownKeysAreDropped) {
    subscribe();
    EXPECT_FALSE(sendKey(QEvent::KeyPress, Qt::Key_unknown, Qt::NoModifier, 0, 1));
    EXPECT_FALSE(sendKey(QEvent::KeyPress, Qt::Key_unknown, Qt::NoModifier, 0x12345678, 2));
    EXPECT_TRUE(events.empty());
}

TEST_F(TestQtEventTap, TestMouseButtons) {
    subscribe();
    sendMouse(QEvent::MouseButtonPress, Qt::LeftButton, 1);
    sendMouse(QEvent::MouseButtonRelease, Qt::LeftButton, 2);
    sendMouse(QEvent::MouseButtonPress, Qt::MiddleButton, 3);
    sendMouse(QEvent::MouseButtonDblClick, Qt::BackButton, 4);

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, InputEventType::MouseDown);
    EXPECT_EQ(events[0].code, 0);
    EXPECT_EQ(events[1].type, InputEventType::MouseUp);
    EXPECT_EQ(events[2].code, 2);
    EXPECT_EQ(events[3].type, InputEventType::MouseDown);
    EXPECT_EQ(events[3].code, 3);
    EXPECT_EQ(events[3].time, 4u);
}

TEST_F(TestQtEventTap, TestOtherEventsPassThrough) {
    subscribe(true);
    QEvent event(QEvent::Show);
    EXPECT_FALSE(tap.eventFilter(&tap, &event));
    EXPECT_TRUE(events.empty());
}

TEST_F(TestQtEventTap, TestReleasedSubscription) {
    subscribe(true);
    EXPECT_EQ(tap.subscriberCount(), 1u);
    subscription.reset();
    EXPECT_EQ(tap.subscriberCount(), 0u);
    EXPECT_FALSE(sendKey(QEvent::KeyPress, Qt::Key_A, Qt::NoModifier, XK_a, 1));
    EXPECT_TRUE(events.empty());
}

TEST(TestQtEventTapStatics, TestButtonIndex) {
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::LeftButton), 0);
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::RightButton), 1);
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::MiddleButton), 2);
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::BackButton), 3);
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::ForwardButton), 4);
    EXPECT_EQ(QtEventTap::ButtonIndex(Qt::ExtraButton3), 5);
    EXPECT_FALSE(QtEventTap::ButtonIndex(Qt::NoButton).has_value());
}

TEST(TestQtEventTapStatics, TestFlagsFromQt) {
    EXPECT_EQ(QtEventTap::FlagsFromQt(Qt::NoModifier), static_cast<uint32_t>(ModNone));
    EXPECT_EQ(QtEventTap::FlagsFromQt(Qt::ControlModifier | Qt::AltModifier),
              static_cast<uint32_t>(ModControl | ModOption));
    EXPECT_EQ(QtEventTap::FlagsFromQt(Qt::KeypadModifier), static_cast<uint32_t>(ModNone));
}
