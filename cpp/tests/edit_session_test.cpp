#include <gtest/gtest.h>
#include "tests/text_test_common.h"
#include "textarea/edit_session.h"
#include <memory>
#include <string>
#include <vector>

using namespace textarea;
using namespace textarea_test;

// =============================================================================
// Test Fixture
// =============================================================================

class EditSessionTest : public ::testing::Test {
protected:
    struct FinishedCall {
        TextArea* area;
        bool wasEscaped;
    };

    FixedAdvanceMeasurer measurer;
    EditSession session;
    std::vector<FinishedCall> finished;

    std::unique_ptr<TextArea> makeArea(const std::string& text, bool oneLine = false, bool edit = true) {
        TextAreaOptions o;
        o.measurer = &measurer;
        o.text = text;
        o.width = 200.0f;
        o.height = 48.0f;
        o.oneLine = oneLine;
        o.edit = edit;
        o.scroll = !edit;
        auto area = std::make_unique<TextArea>(o);
        area->setEditingFinishedCallback([this](TextArea& source, bool wasEscaped) {
            finished.push_back({&source, wasEscaped});
        });
        return area;
    }

    void press(std::uint32_t offset) {
        session.keyDown(specialKey(offset));
        session.keyUp(specialKeyUp(offset));
    }

    void type(const std::string& chars) {
        for (char c : chars) {
            session.keyDown(charKey(static_cast<unsigned char>(c)));
            session.keyUp(input::KeyUp{static_cast<unsigned char>(c), std::nullopt});
        }
    }

    void ctrl(char letter) {
        session.keyDown(specialKey(kKeyCtrl));
        session.keyDown(charKey(static_cast<unsigned char>(letter)));
        session.keyUp(specialKeyUp(kKeyCtrl));
    }
};

// =============================================================================
// Focus
// =============================================================================

TEST_F(EditSessionTest, FocusRequiresViewport) {
    TextAreaOptions o;
    o.measurer = &measurer;
    o.text = "abc";
    TextArea area(o);
    EXPECT_THROW(session.focus(area), ConfigurationError);
    EXPECT_EQ(session.focused(), nullptr);
}

TEST_F(EditSessionTest, BlurWithoutChangeDoesNotNotify) {
    auto area = makeArea("abc");
    session.focus(*area);
    EXPECT_TRUE(session.isFocused(*area));
    press(kKeyEsc);
    EXPECT_EQ(session.focused(), nullptr);
    EXPECT_TRUE(finished.empty());
}

TEST_F(EditSessionTest, EscAfterEditNotifiesEscaped) {
    auto area = makeArea("");
    session.focus(*area);
    type("hi");
    press(kKeyEsc);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].area, area.get());
    EXPECT_TRUE(finished[0].wasEscaped);
}

TEST_F(EditSessionTest, SwitchingFocusBlursPreviousArea) {
    auto first = makeArea("");
    auto second = makeArea("");
    session.focus(*first);
    type("x");
    session.focus(*second);

    EXPECT_TRUE(session.isFocused(*second));
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].area, first.get());
    EXPECT_TRUE(finished[0].wasEscaped);
}

TEST_F(EditSessionTest, EnterInOneLineAreaFinishesEditing) {
    auto area = makeArea("", true);
    session.focus(*area);
    type("ok");
    press(kKeyEnter);
    EXPECT_EQ(session.focused(), nullptr);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_FALSE(finished[0].wasEscaped);
    EXPECT_EQ(area->text(), "ok");
}

TEST_F(EditSessionTest, BlurCollapsesSelection) {
    auto area = makeArea("hello");
    session.focus(*area);
    area->selectAll();
    session.blur(BlurReason::Released);
    EXPECT_TRUE(area->selection().empty());
}

// =============================================================================
// Keys
// =============================================================================

TEST_F(EditSessionTest, TypingIsLowercaseUnlessShift) {
    auto area = makeArea("");
    session.focus(*area);
    type("A");
    session.keyDown(specialKey(kKeyShift));
    EXPECT_TRUE(session.modifiers().shift);
    type("B");
    session.keyUp(specialKeyUp(kKeyShift));
    EXPECT_FALSE(session.modifiers().shift);
    type("C");
    EXPECT_EQ(area->text(), "aBc");
}

TEST_F(EditSessionTest, ComposedTextIsInsertedAsIs) {
    auto area = makeArea("");
    session.focus(*area);
    input::KeyDown event;
    event.code = 0xE9;
    event.text = "\xC3\x89";
    session.keyDown(event);
    EXPECT_EQ(area->text(), "\xC3\x89");
}

TEST_F(EditSessionTest, TabEnterBackspaceDelete) {
    auto area = makeArea("");
    session.focus(*area);
    press(kKeyTab);
    EXPECT_EQ(area->text(), "  ");
    press(kKeyEnter);
    EXPECT_EQ(area->text(), "  \n");
    press(kKeyBackspace);
    EXPECT_EQ(area->text(), "  ");
    press(kKeyHome);
    press(kKeyDelete);
    EXPECT_EQ(area->text(), " ");
}

TEST_F(EditSessionTest, ShiftEnterFinishesEditing) {
    auto area = makeArea("");
    session.focus(*area);
    type("x");
    session.keyDown(specialKey(kKeyShift));
    session.keyDown(specialKey(kKeyEnter));
    EXPECT_EQ(session.focused(), nullptr);
    EXPECT_EQ(area->text(), "x");
}

TEST_F(EditSessionTest, ShiftArrowsExtendSelection) {
    auto area = makeArea("abc");
    session.focus(*area);
    area->setCaret(3);
    session.keyDown(specialKey(kKeyShift));
    press(kKeyLeft);
    press(kKeyLeft);
    session.keyUp(specialKeyUp(kKeyShift));
    EXPECT_EQ(area->selection().lo(), 1u);
    EXPECT_EQ(area->selection().hi(), 3u);
    EXPECT_EQ(area->caret(), 1u);

    press(kKeyRight);
    EXPECT_TRUE(area->selection().empty());
    EXPECT_EQ(area->caret(), 2u);
}

TEST_F(EditSessionTest, ArrowsMoveBetweenRows) {
    auto area = makeArea("abc\ndef");
    session.focus(*area);
    area->setCaret(1);
    press(kKeyDown);
    EXPECT_EQ(area->caret(), 5u);
    press(kKeyUp);
    EXPECT_EQ(area->caret(), 1u);
    press(kKeyEnd);
    EXPECT_EQ(area->caret(), 3u);
}

TEST_F(EditSessionTest, CtrlHotkeys) {
    auto area = makeArea("hello");
    session.focus(*area);

    ctrl('A');
    EXPECT_EQ(area->selection().hi(), 5u);
    ctrl('C');
    EXPECT_EQ(session.clipboard().get(), "hello");
    ctrl('X');
    EXPECT_EQ(area->text(), "");
    ctrl('V');
    ctrl('V');
    EXPECT_EQ(area->text(), "hellohello");

    ctrl('Z');
    EXPECT_EQ(area->text(), "hello");
    ctrl('Y');
    EXPECT_EQ(area->text(), "hellohello");

    ctrl('D');
    EXPECT_EQ(area->text(), "hellohello\nhellohello");
}

TEST_F(EditSessionTest, CtrlWithOtherKeysInsertsNothing) {
    auto area = makeArea("");
    session.focus(*area);
    ctrl('Q');
    EXPECT_EQ(area->text(), "");
    EXPECT_FALSE(session.modifiers().ctrl);
}

TEST_F(EditSessionTest, SwappedCtrlWin) {
    auto area = makeArea("abc");
    session.setSwapCtrlWin(true);
    session.focus(*area);
    session.keyDown(specialKey(kKeyWin));
    EXPECT_TRUE(session.modifiers().ctrl);
    session.keyDown(charKey('A'));
    EXPECT_EQ(area->selection().hi(), 3u);
    EXPECT_EQ(area->text(), "abc");
}

TEST_F(EditSessionTest, KeysIgnoredWhenNotEditable) {
    auto area = makeArea("abc", false, false);
    session.focus(*area);
    type("x");
    press(kKeyBackspace);
    EXPECT_EQ(area->text(), "abc");
}

TEST_F(EditSessionTest, ControlCharactersAreIgnored) {
    auto area = makeArea("");
    session.focus(*area);
    session.keyDown(charKey(0x07));
    session.keyDown(charKey(0x7F));
    EXPECT_EQ(area->text(), "");
}

// =============================================================================
// Frame: repeat and blink
// =============================================================================

TEST_F(EditSessionTest, HeldKeyRepeatsAfterDelay) {
    auto area = makeArea("");
    session.focus(*area);
    const std::uint32_t delay = session.timing().repeatDelayFrames();
    const std::uint32_t span = session.timing().repeatSpanFrames();
    ASSERT_GT(delay, 1u);

    session.keyDown(charKey('a'));
    EXPECT_TRUE(session.isKeyRepeating());
    EXPECT_EQ(area->text(), "a");

    FrameState state = session.tick(delay - 1);
    EXPECT_FALSE(state.keyRepeated);
    EXPECT_EQ(area->text(), "a");

    state = session.tick(1);
    EXPECT_TRUE(state.keyRepeated);
    EXPECT_EQ(area->text(), "aa");

    session.tick(span);
    EXPECT_EQ(area->text(), "aaa");

    session.keyUp(input::KeyUp{'a', std::nullopt});
    EXPECT_FALSE(session.isKeyRepeating());
    session.tick(delay + span);
    EXPECT_EQ(area->text(), "aaa");
}

TEST_F(EditSessionTest, ModifierKeysDoNotRepeat) {
    auto area = makeArea("");
    session.focus(*area);
    session.keyDown(specialKey(kKeyShift));
    EXPECT_FALSE(session.isKeyRepeating());
}

TEST_F(EditSessionTest, CaretBlinks) {
    SessionTiming timing;
    timing.cursorShowTime = 30;
    timing.cursorHideTime = 30;
    session.setTiming(timing);

    auto area = makeArea("abc");
    EXPECT_FALSE(session.isCaretVisible());
    session.focus(*area);
    EXPECT_TRUE(session.isCaretVisible());

    EXPECT_FALSE(session.tick(30).caretVisible);
    EXPECT_TRUE(session.tick(30).caretVisible);
    EXPECT_TRUE(session.tick(1).caretVisible);

    // A keystroke restarts the cycle with the caret shown
    session.tick(40);
    EXPECT_FALSE(session.isCaretVisible());
    press(kKeyLeft);
    EXPECT_TRUE(session.isCaretVisible());
}

TEST_F(EditSessionTest, ScrollFocusedAnimates) {
    auto area = makeArea(std::string(40, 'a'), true);
    session.focus(*area);
    area->setCaret(0);
    session.scrollFocusedTo(100.0f, 0.0f);
    EXPECT_TRUE(area->viewport().isAnimating());

    const std::uint32_t frames = session.timing().animationFrames();
    FrameState state = session.tick(frames);
    EXPECT_FALSE(state.animating);
    EXPECT_FLOAT_EQ(area->viewport().anchorX(), 100.0f);
}

// =============================================================================
// Pointer
// =============================================================================

TEST_F(EditSessionTest, MouseDragSelects) {
    auto area = makeArea("hello world");
    session.pointerDown(*area, PointerEvent{26.0f, 6.0f});
    EXPECT_TRUE(session.isFocused(*area));
    EXPECT_EQ(session.pointerMode(), PointerMode::Select);
    EXPECT_EQ(area->caret(), 3u);

    session.pointerMove(PointerEvent{55.0f, 6.0f});
    EXPECT_EQ(area->selection().lo(), 3u);
    EXPECT_EQ(area->selection().hi(), 6u);

    session.pointerUp(PointerEvent{55.0f, 6.0f});
    EXPECT_EQ(session.pointerMode(), PointerMode::Idle);
    EXPECT_EQ(area->selection().hi(), 6u);
    EXPECT_FALSE(area->stickyX().has_value());
}

TEST_F(EditSessionTest, TouchDragScrollsThenTapPlacesCaret) {
    auto area = makeArea(std::string(40, 'a'), true);
    session.pointerDown(*area, PointerEvent{100.0f, 10.0f, true});
    EXPECT_EQ(session.pointerMode(), PointerMode::DragScroll);

    session.pointerMove(PointerEvent{60.0f, 10.0f, true});
    EXPECT_FLOAT_EQ(area->viewport().anchorX(), 40.0f);

    session.pointerUp(PointerEvent{60.0f, 10.0f, true});
    EXPECT_EQ(session.pointerMode(), PointerMode::Idle);
    EXPECT_EQ(area->caret(), 10u);
    EXPECT_TRUE(area->selection().empty());
}

TEST_F(EditSessionTest, ReadOnlyScrollableAreaDragScrolls) {
    auto area = makeArea("abc", false, false);
    session.pointerDown(*area, PointerEvent{5.0f, 5.0f});
    EXPECT_TRUE(session.isFocused(*area));
    EXPECT_EQ(session.pointerMode(), PointerMode::DragScroll);
    EXPECT_FALSE(session.isCaretVisible());
}

TEST_F(EditSessionTest, PressOutsideViewportIgnored) {
    auto area = makeArea("abc");
    session.pointerDown(*area, PointerEvent{250.0f, 5.0f});
    EXPECT_EQ(session.focused(), nullptr);
    EXPECT_EQ(session.pointerMode(), PointerMode::Idle);
}

TEST_F(EditSessionTest, PressOnOtherAreaSwitchesFocus) {
    auto first = makeArea("");
    auto second = makeArea("abc");
    session.focus(*first);
    type("z");
    session.pointerDown(*second, PointerEvent{5.0f, 5.0f});
    EXPECT_TRUE(session.isFocused(*second));
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].area, first.get());
}
