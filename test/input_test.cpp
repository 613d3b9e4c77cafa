#include "fake_transport.hpp"
#include "wkvm_input.hpp"

#include <rfb/keysym.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <tuple>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace wkvm
{
namespace
{

using namespace std::chrono_literals;
using test::FakeTransport;
using test::FakeWire;

class InputTest : public ::testing::Test
{
  protected:
    InputTest() :
        transport(wire),
        input(io, session, [this]() -> Transport* {
            return available ? &transport : nullptr;
        })
    {
        session.connection.state = ConnectionState::connected;
        session.control.owner = Actor::human;
    }

    boost::asio::io_context io;
    WorkspaceSession session;
    FakeWire wire;
    FakeTransport transport;
    bool available = true;
    Input input;
};

TEST_F(InputTest, ForwardsPointerMoves)
{
    EXPECT_TRUE(input.pointerMove(10, 20));

    ASSERT_EQ(wire.pointers.size(), 1u);
    EXPECT_EQ(wire.pointers[0].x, 10);
    EXPECT_EQ(wire.pointers[0].y, 20);
    EXPECT_EQ(wire.pointers[0].mask, 0);
}

TEST_F(InputTest, NothingIsSentUnlessHumanOwns)
{
    for (Actor owner : {Actor::none, Actor::agent})
    {
        session.control.owner = owner;

        EXPECT_FALSE(input.pointerMove(1, 1));
        EXPECT_FALSE(input.pointerButton(Input::Button::left, true, 1, 1));
        EXPECT_FALSE(input.scroll(Input::ScrollDirection::down, 1, 1));
        EXPECT_FALSE(input.keyEvent("a", true));
        EXPECT_FALSE(input.sendClipboard("text"));
    }

    io.run_for(50ms);
    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, NothingIsSentWhileDisconnected)
{
    session.connection.state = ConnectionState::reconnecting;

    EXPECT_FALSE(input.keyEvent("a", true));
    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, NothingIsSentWithoutTransport)
{
    available = false;

    EXPECT_FALSE(input.pointerMove(5, 5));
    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, ButtonMaskTracksHeldButtons)
{
    input.pointerButton(Input::Button::left, true, 5, 5);
    input.pointerButton(Input::Button::right, true, 6, 6);
    input.pointerMove(7, 7);
    input.pointerButton(Input::Button::left, false, 7, 7);

    ASSERT_EQ(wire.pointers.size(), 4u);
    EXPECT_EQ(wire.pointers[0].mask, 0x1);
    EXPECT_EQ(wire.pointers[1].mask, 0x5);
    EXPECT_EQ(wire.pointers[2].mask, 0x5);
    EXPECT_EQ(wire.pointers[3].mask, 0x4);
}

TEST_F(InputTest, ButtonMasks)
{
    EXPECT_EQ(Input::buttonToMask(Input::Button::left), 1);
    EXPECT_EQ(Input::buttonToMask(Input::Button::middle), 2);
    EXPECT_EQ(Input::buttonToMask(Input::Button::right), 4);
    EXPECT_EQ(Input::scrollToMask(Input::ScrollDirection::up), 8);
    EXPECT_EQ(Input::scrollToMask(Input::ScrollDirection::down), 16);
    EXPECT_EQ(Input::scrollToMask(Input::ScrollDirection::left), 32);
    EXPECT_EQ(Input::scrollToMask(Input::ScrollDirection::right), 64);
}

TEST_F(InputTest, ScrollIsPressThenDelayedRelease)
{
    EXPECT_TRUE(input.scroll(Input::ScrollDirection::up, 100, 200));

    ASSERT_EQ(wire.pointers.size(), 1u);
    EXPECT_EQ(wire.pointers[0].mask, 0x8);

    io.run_for(100ms);

    ASSERT_EQ(wire.pointers.size(), 2u);
    EXPECT_EQ(wire.pointers[1].x, 100);
    EXPECT_EQ(wire.pointers[1].y, 200);
    EXPECT_EQ(wire.pointers[1].mask, 0);
}

TEST_F(InputTest, ScrollKeepsHeldButtons)
{
    input.pointerButton(Input::Button::middle, true, 1, 1);
    input.scroll(Input::ScrollDirection::right, 1, 1);
    io.run_for(100ms);

    ASSERT_EQ(wire.pointers.size(), 3u);
    EXPECT_EQ(wire.pointers[1].mask, 0x42);
    EXPECT_EQ(wire.pointers[2].mask, 0x2);
}

TEST_F(InputTest, OutOfRangePositionIsDropped)
{
    EXPECT_FALSE(input.pointerMove(-1, 10));
    EXPECT_FALSE(input.pointerMove(wire.width, 10));
    EXPECT_FALSE(input.pointerMove(10, wire.height));
    EXPECT_EQ(wire.messages(), 0u);

    // later events still go through
    EXPECT_TRUE(input.pointerMove(wire.width - 1, wire.height - 1));
}

TEST_F(InputTest, WriteFailureIsReportedPerEvent)
{
    wire.writable = false;
    EXPECT_FALSE(input.keyEvent("a", true));

    wire.writable = true;
    EXPECT_TRUE(input.keyEvent("a", false));
}

TEST_F(InputTest, KeysForwardWithKeysyms)
{
    input.keyEvent("Enter", true);
    input.keyEvent("Enter", false);

    ASSERT_EQ(wire.keys.size(), 2u);
    EXPECT_EQ(wire.keys[0].keysym, (uint32_t)XK_Return);
    EXPECT_TRUE(wire.keys[0].down);
    EXPECT_FALSE(wire.keys[1].down);
}

TEST(KeyToKeysym, NamedKeys)
{
    EXPECT_EQ(Input::keyToKeysym("Escape"), (uint32_t)XK_Escape);
    EXPECT_EQ(Input::keyToKeysym("ArrowLeft"), (uint32_t)XK_Left);
    EXPECT_EQ(Input::keyToKeysym("Page_Down"), (uint32_t)XK_Page_Down);
    EXPECT_EQ(Input::keyToKeysym("Control"), (uint32_t)XK_Control_L);
    EXPECT_EQ(Input::keyToKeysym("F1"), (uint32_t)XK_F1);
    EXPECT_EQ(Input::keyToKeysym("F12"), (uint32_t)XK_F12);
    EXPECT_EQ(Input::keyToKeysym("KP_7"), (uint32_t)XK_KP_7);
}

TEST(KeyToKeysym, CharactersMapToCodePoints)
{
    EXPECT_EQ(Input::keyToKeysym("a"), (uint32_t)'a');
    EXPECT_EQ(Input::keyToKeysym("Z"), (uint32_t)'Z');
    EXPECT_EQ(Input::keyToKeysym("é"), 0xe9u);
    EXPECT_EQ(Input::keyToKeysym("€"), 0x010020acu);
}

TEST(KeyToKeysym, UnknownKeysMapToVoidSymbol)
{
    EXPECT_EQ(Input::keyToKeysym("NoSuchKey"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("F25"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym(""), (uint32_t)XK_VoidSymbol);

    // overlong, surrogate and out of range encodings
    EXPECT_EQ(Input::keyToKeysym("\xC0\x80"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("\xC0\xAF"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("\xE0\x80\xAF"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("\xED\xA0\x80"), (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("\xF4\x90\x80\x80"),
              (uint32_t)XK_VoidSymbol);
    EXPECT_EQ(Input::keyToKeysym("\xF7\xBF\xBF\xBF"),
              (uint32_t)XK_VoidSymbol);

    // the largest valid code point still maps
    EXPECT_EQ(Input::keyToKeysym("\xF4\x8F\xBF\xBF"), 0x0110ffffu);
}

TEST_F(InputTest, ZoomShortcutsAreConsumedLocally)
{
    std::vector<std::tuple<Input::LocalAction, double, bool>> actions;

    input.addLocalActionHandler(
        [&actions](Input::LocalAction action, double scale, bool full) {
            actions.emplace_back(action, scale, full);
        });

    EXPECT_FALSE(input.keyEvent("+", true, Input::Modifier::control));
    EXPECT_FALSE(input.keyEvent("+", false, Input::Modifier::control));
    EXPECT_FALSE(input.keyEvent("-", true, Input::Modifier::meta));
    EXPECT_FALSE(input.keyEvent("-", true, Input::Modifier::meta));
    EXPECT_FALSE(input.keyEvent("0", true, Input::Modifier::control));

    EXPECT_EQ(wire.messages(), 0u);
    ASSERT_EQ(actions.size(), 4u);
    EXPECT_EQ(std::get<0>(actions[0]), Input::LocalAction::zoomIn);
    EXPECT_DOUBLE_EQ(std::get<1>(actions[0]), 1.1);
    EXPECT_DOUBLE_EQ(std::get<1>(actions[2]), 0.9);
    EXPECT_EQ(std::get<0>(actions[3]), Input::LocalAction::zoomReset);
    EXPECT_DOUBLE_EQ(input.getScale(), 1.0);
}

TEST_F(InputTest, ZoomIsBounded)
{
    for (int i = 0; i < 20; i++)
    {
        input.keyEvent("=", true, Input::Modifier::control);
    }
    EXPECT_DOUBLE_EQ(input.getScale(), 2.0);

    for (int i = 0; i < 30; i++)
    {
        input.keyEvent("-", true, Input::Modifier::control);
    }
    EXPECT_DOUBLE_EQ(input.getScale(), 0.5);
}

TEST_F(InputTest, FullscreenToggleIsConsumedEvenWithoutControl)
{
    session.control.owner = Actor::agent;

    input.keyEvent("F11", true);
    input.keyEvent("F11", false);
    EXPECT_TRUE(input.isFullscreen());

    input.keyEvent("F11", true);
    EXPECT_FALSE(input.isFullscreen());
    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, UnmodifiedCharactersAreNotShortcuts)
{
    EXPECT_TRUE(input.keyEvent("+", true));
    EXPECT_TRUE(input.keyEvent("0", true, Input::Modifier::shift));
    EXPECT_EQ(wire.keys.size(), 2u);
}

TEST_F(InputTest, ReleaseHeldLiftsKeysAndButtons)
{
    input.keyEvent("Shift", true);
    input.keyEvent("a", true);
    input.pointerButton(Input::Button::left, true, 3, 4);
    wire.keys.clear();
    wire.pointers.clear();

    input.releaseHeld();

    ASSERT_EQ(wire.keys.size(), 2u);
    EXPECT_FALSE(wire.keys[0].down);
    EXPECT_FALSE(wire.keys[1].down);
    ASSERT_EQ(wire.pointers.size(), 1u);
    EXPECT_EQ(wire.pointers[0].x, 3);
    EXPECT_EQ(wire.pointers[0].mask, 0);

    input.releaseHeld();
    EXPECT_EQ(wire.keys.size(), 2u);
    EXPECT_EQ(wire.pointers.size(), 1u);
}

TEST_F(InputTest, ClipboardIsForwardedToOwner)
{
    EXPECT_TRUE(input.sendClipboard("hello"));
    ASSERT_EQ(wire.clipboard.size(), 1u);
    EXPECT_EQ(wire.clipboard[0], "hello");
}

TEST_F(InputTest, SingleTouchDragsWithLeftButton)
{
    EXPECT_TRUE(input.touchStart(1, 10, 20));
    EXPECT_TRUE(input.touchMove(1, 60, 70));
    EXPECT_TRUE(input.touchEnd(1, 60, 70));

    ASSERT_EQ(wire.pointers.size(), 3u);
    EXPECT_EQ(wire.pointers[0].x, 10);
    EXPECT_EQ(wire.pointers[0].mask, 0x1);
    EXPECT_EQ(wire.pointers[1].x, 60);
    EXPECT_EQ(wire.pointers[1].y, 70);
    EXPECT_EQ(wire.pointers[1].mask, 0x1);
    EXPECT_EQ(wire.pointers[2].mask, 0);

    // the drag moved past the slop, so no right click follows
    io.run_for(700ms);
    EXPECT_EQ(wire.pointers.size(), 3u);
}

TEST_F(InputTest, LongPressIsRightClick)
{
    input.touchStart(1, 30, 40);
    input.touchMove(1, 33, 42);
    io.run_for(700ms);

    ASSERT_EQ(wire.pointers.size(), 5u);
    EXPECT_EQ(wire.pointers[0].mask, 0x1);
    EXPECT_EQ(wire.pointers[1].mask, 0x1);
    EXPECT_EQ(wire.pointers[2].mask, 0);
    EXPECT_EQ(wire.pointers[3].mask, 0x4);
    EXPECT_EQ(wire.pointers[3].x, 33);
    EXPECT_EQ(wire.pointers[3].y, 42);
    EXPECT_EQ(wire.pointers[4].mask, 0);

    // lifting the finger afterwards sends nothing more
    EXPECT_FALSE(input.touchEnd(1, 33, 42));
    EXPECT_EQ(wire.pointers.size(), 5u);
}

TEST_F(InputTest, ShortTapIsLeftClickOnly)
{
    input.touchStart(1, 5, 5);
    input.touchEnd(1, 5, 5);
    io.run_for(700ms);

    ASSERT_EQ(wire.pointers.size(), 2u);
    EXPECT_EQ(wire.pointers[0].mask, 0x1);
    EXPECT_EQ(wire.pointers[1].mask, 0);
}

TEST_F(InputTest, PinchZoomsLocally)
{
    std::vector<std::pair<Input::LocalAction, double>> actions;

    input.addLocalActionHandler(
        [&actions](Input::LocalAction action, double scale, bool) {
            actions.emplace_back(action, scale);
        });

    input.touchStart(1, 100, 100);
    EXPECT_TRUE(input.touchStart(2, 200, 100));

    // the second finger lifts the button pressed by the first
    ASSERT_EQ(wire.pointers.size(), 2u);
    EXPECT_EQ(wire.pointers[1].mask, 0);

    // below the step threshold
    EXPECT_FALSE(input.touchMove(2, 205, 100));
    EXPECT_TRUE(actions.empty());

    EXPECT_FALSE(input.touchMove(2, 250, 100));
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].first, Input::LocalAction::pinchZoom);
    EXPECT_DOUBLE_EQ(actions[0].second, 1.5);

    EXPECT_FALSE(input.touchMove(2, 500, 100));
    EXPECT_DOUBLE_EQ(input.getScale(), 2.0);

    EXPECT_FALSE(input.touchMove(2, 110, 100));
    EXPECT_DOUBLE_EQ(input.getScale(), 0.5);

    input.touchEnd(2, 110, 100);
    input.touchEnd(1, 100, 100);
    io.run_for(700ms);

    // pinching never reaches the remote side
    EXPECT_EQ(wire.pointers.size(), 2u);
    EXPECT_TRUE(wire.keys.empty());
}

TEST_F(InputTest, PinchWorksWithoutControl)
{
    session.control.owner = Actor::agent;

    EXPECT_FALSE(input.touchStart(1, 0, 0));
    EXPECT_FALSE(input.touchStart(2, 100, 0));
    input.touchMove(2, 200, 0);
    io.run_for(700ms);

    EXPECT_DOUBLE_EQ(input.getScale(), 2.0);
    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, TouchIsGatedOnOwnership)
{
    session.control.owner = Actor::none;

    EXPECT_FALSE(input.touchStart(1, 10, 10));
    EXPECT_FALSE(input.touchMove(1, 50, 50));
    EXPECT_FALSE(input.touchEnd(1, 50, 50));

    input.touchStart(1, 10, 10);
    io.run_for(700ms);

    EXPECT_EQ(wire.messages(), 0u);
}

TEST_F(InputTest, TouchCancelLiftsTheButton)
{
    input.touchStart(1, 10, 10);
    input.touchCancel();

    ASSERT_EQ(wire.pointers.size(), 2u);
    EXPECT_EQ(wire.pointers[1].mask, 0);

    io.run_for(700ms);
    EXPECT_EQ(wire.pointers.size(), 2u);
    EXPECT_FALSE(input.touchMove(1, 20, 20));
}

TEST_F(InputTest, ReleaseHeldCancelsLongPress)
{
    input.touchStart(1, 10, 10);
    input.releaseHeld();
    io.run_for(700ms);

    ASSERT_EQ(wire.pointers.size(), 2u);
    EXPECT_EQ(wire.pointers[1].mask, 0);

    // the finger no longer holds a button remotely
    EXPECT_FALSE(input.touchEnd(1, 10, 10));
    EXPECT_EQ(wire.pointers.size(), 2u);
}

} // namespace
} // namespace wkvm
