#include <gtest/gtest.h>
#include <X11/keysym.h>
#include <vector>
#include "core/Shortcut.hpp"
#include "core/io/KeyMap.hpp"
#include "core/io/ModifierState.hpp"

using namespace kclick;
using namespace kclick::io;

TEST(TestKeyMap, TestFromX11) {
    EXPECT_EQ(KeyMap::FromX11(XK_a), vk::A);
    EXPECT_EQ(KeyMap::FromX11(XK_A), vk::A);
    EXPECT_EQ(KeyMap::FromX11(XK_z), vk::Z);
    EXPECT_EQ(KeyMap::FromX11(XK_space), vk::Space);
    EXPECT_EQ(KeyMap::FromX11(XK_Return), vk::Return);
    EXPECT_EQ(KeyMap::FromX11(XK_ISO_Left_Tab), vk::Tab);
    EXPECT_EQ(KeyMap::FromX11(XK_F1), vk::F1);
    EXPECT_EQ(KeyMap::FromX11(XK_Left), vk::LeftArrow);
    EXPECT_EQ(KeyMap::FromX11(0x12345678UL), -1);
}

TEST(TestKeyMap, TestModifierKeysyms) {
    EXPECT_EQ(KeyMap::FromX11(XK_Shift_L), vk::Shift);
    EXPECT_EQ(KeyMap::FromX11(XK_Shift_R), vk::RightShift);
    EXPECT_EQ(KeyMap::FromX11(XK_Super_L), vk::Command);
    EXPECT_EQ(KeyMap::FromX11(XK_Meta_L), vk::Option);
    EXPECT_EQ(KeyMap::FromX11(XK_Hyper_L), vk::Function);
    EXPECT_EQ(KeyMap::FromX11(XK_Hyper_R), vk::Function);
}

TEST(TestKeyMap, TestNames) {
    EXPECT_EQ(KeyMap::ToString(vk::Space), "Space");
    EXPECT_EQ(KeyMap::ToString(vk::K), "k");
    EXPECT_EQ(KeyMap::ToString(250), "");
}

TEST(TestKeyMap, TestDisplayName) {
    EXPECT_EQ(KeyMap::DisplayName(vk::V), "V");
    EXPECT_EQ(KeyMap::DisplayName(vk::Space), "Space");
    EXPECT_EQ(KeyMap::DisplayName(vk::Escape), "⎋");
    EXPECT_EQ(KeyMap::DisplayName(24), "=");
    EXPECT_EQ(KeyMap::DisplayName(115), "HOME");
    EXPECT_EQ(KeyMap::DisplayName(255), "K255");
}

TEST(TestKeyMap, TestIsModifier) {
    EXPECT_TRUE(KeyMap::IsModifier(vk::Shift));
    EXPECT_TRUE(KeyMap::IsModifier(vk::RightCommand));
    EXPECT_TRUE(KeyMap::IsModifier(vk::Function));
    EXPECT_TRUE(KeyMap::IsModifier(vk::CapsLock));
    EXPECT_FALSE(KeyMap::IsModifier(vk::Space));
    EXPECT_FALSE(KeyMap::IsModifier(vk::A));
}

TEST(TestKeyMap, TestButtons) {
    EXPECT_EQ(KeyMap::FromX11Button(1), 0);
    EXPECT_EQ(KeyMap::FromX11Button(3), 1);
    EXPECT_EQ(KeyMap::FromX11Button(2), 2);
    EXPECT_EQ(KeyMap::FromX11Button(8), 3);
    EXPECT_EQ(KeyMap::FromX11Button(9), 4);
    EXPECT_EQ(KeyMap::FromX11Button(10), 5);
    for (unsigned int wheel = 4; wheel <= 7; ++wheel) {
        EXPECT_FALSE(KeyMap::FromX11Button(wheel).has_value());
    }
    EXPECT_FALSE(KeyMap::FromX11Button(0).has_value());

    EXPECT_EQ(KeyMap::ToX11Button(0), 1u);
    EXPECT_EQ(KeyMap::ToX11Button(1), 3u);
    EXPECT_EQ(KeyMap::ToX11Button(2), 2u);
    EXPECT_EQ(KeyMap::ToX11Button(3), 8u);
    EXPECT_EQ(KeyMap::ToX11Button(-1), 0u);
}

TEST(TestKeyMap, TestPointerMapping) {
    const std::vector<unsigned char> identity = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(KeyMap::LogicalButton(identity, 1), 1u);
    EXPECT_EQ(KeyMap::PhysicalButton(identity, 3), 3u);

    // Left-handed layout swaps the primary and secondary buttons
    const std::vector<unsigned char> leftHanded = {3, 2, 1, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(KeyMap::FromX11Button(KeyMap::LogicalButton(leftHanded, 3)), 0);
    EXPECT_EQ(KeyMap::FromX11Button(KeyMap::LogicalButton(leftHanded, 1)), 1);
    EXPECT_EQ(KeyMap::PhysicalButton(leftHanded, KeyMap::ToX11Button(0)), 3u);

    // Disabled buttons map to 0, buttons beyond the map pass through
    const std::vector<unsigned char> disabled = {1, 0, 3};
    EXPECT_EQ(KeyMap::LogicalButton(disabled, 2), 0u);
    EXPECT_FALSE(KeyMap::FromX11Button(KeyMap::LogicalButton(disabled, 2)).has_value());
    EXPECT_EQ(KeyMap::PhysicalButton(disabled, 2), 0u);
    EXPECT_EQ(KeyMap::LogicalButton(disabled, 9), 9u);
    EXPECT_EQ(KeyMap::PhysicalButton(disabled, 9), 9u);
    EXPECT_EQ(KeyMap::LogicalButton({}, 1), 1u);
    EXPECT_EQ(KeyMap::PhysicalButton({}, 0), 0u);
}

TEST(TestModifierState, TestFlagFor) {
    EXPECT_EQ(ModifierState::FlagFor(vk::Shift), static_cast<uint32_t>(ModShift));
    EXPECT_EQ(ModifierState::FlagFor(vk::RightControl), static_cast<uint32_t>(ModControl));
    EXPECT_EQ(ModifierState::FlagFor(vk::RightOption), static_cast<uint32_t>(ModOption));
    EXPECT_EQ(ModifierState::FlagFor(vk::Command), static_cast<uint32_t>(ModCommand));
    EXPECT_EQ(ModifierState::FlagFor(vk::Function), static_cast<uint32_t>(ModFunction));
    EXPECT_EQ(ModifierState::FlagFor(vk::CapsLock), static_cast<uint32_t>(ModCapsLock));
    EXPECT_EQ(ModifierState::FlagFor(vk::K), static_cast<uint32_t>(ModNone));
}

TEST(TestModifierState, TestBothSidesHeld) {
    ModifierState state;
    EXPECT_TRUE(state.update(vk::Shift, true));
    EXPECT_FALSE(state.update(vk::RightShift, true));
    EXPECT_EQ(state.flags(), static_cast<uint32_t>(ModShift));

    // One side released, the other still holds the flag
    EXPECT_FALSE(state.update(vk::Shift, false));
    EXPECT_EQ(state.flags(), static_cast<uint32_t>(ModShift));
    EXPECT_TRUE(state.update(vk::RightShift, false));
    EXPECT_EQ(state.flags(), static_cast<uint32_t>(ModNone));
}

TEST(TestModifierState, TestIgnoresOrdinaryKeys) {
    ModifierState state;
    EXPECT_FALSE(state.update(vk::K, true));
    EXPECT_FALSE(state.isHeld(vk::K));
    EXPECT_TRUE(state.update(vk::Function, true));
    EXPECT_TRUE(state.update(vk::Command, true));
    EXPECT_EQ(state.flags(), static_cast<uint32_t>(ModFunction | ModCommand));
    state.clear();
    EXPECT_EQ(state.flags(), static_cast<uint32_t>(ModNone));
}
