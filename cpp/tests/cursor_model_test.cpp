#include <gtest/gtest.h>
#include "tests/text_test_common.h"
#include "textarea/edit/cursor_model.h"
#include "textarea/text/line_breaker.h"

using namespace textarea;
using namespace textarea::edit;
using namespace textarea::text;
using textarea_test::FixedAdvanceMeasurer;

class CursorModelTest : public ::testing::Test {
protected:
    static constexpr float kLineHeight = 12.0f;

    FixedAdvanceMeasurer measurer;
    CursorModel cursor;

    WrappedLayout layout(const char* text) {
        return wrapLines(measurer, text, WrapOptions{});
    }
};

// =============================================================================
// Hit testing
// =============================================================================

TEST_F(CursorModelTest, HitTestPicksNearestBoundary) {
    // a0 b1 _2 c3 d4 \n5 | e6 f7 g8 h9 sentinel10
    WrappedLayout l = layout("ab cd\nefgh");
    EXPECT_EQ(CursorModel::hitTest(l, 4.0f, 6.0f, kLineHeight, 100.0f), std::uint32_t{0});
    EXPECT_EQ(CursorModel::hitTest(l, 5.0f, 6.0f, kLineHeight, 100.0f), std::uint32_t{1});
    EXPECT_EQ(CursorModel::hitTest(l, 26.0f, 6.0f, kLineHeight, 100.0f), std::uint32_t{3});
    EXPECT_EQ(CursorModel::hitTest(l, 15.0f, 13.0f, kLineHeight, 100.0f), std::uint32_t{8});
}

TEST_F(CursorModelTest, HitPastRowEndLandsOnRowLastCell) {
    WrappedLayout l = layout("ab cd\nefgh");
    // Inside the clip width but right of the row's text
    EXPECT_EQ(CursorModel::hitTest(l, 80.0f, 6.0f, kLineHeight, 100.0f), std::uint32_t{5});
    EXPECT_EQ(CursorModel::hitTest(l, 80.0f, 18.0f, kLineHeight, 100.0f), std::uint32_t{10});
}

TEST_F(CursorModelTest, HitOutsideRowsMisses) {
    WrappedLayout l = layout("ab cd\nefgh");
    EXPECT_FALSE(CursorModel::hitTest(l, 5.0f, 0.0f, kLineHeight, 100.0f).has_value());
    EXPECT_FALSE(CursorModel::hitTest(l, 5.0f, 30.0f, kLineHeight, 100.0f).has_value());
    EXPECT_FALSE(CursorModel::hitTest(l, -1.0f, 6.0f, kLineHeight, 100.0f).has_value());
    EXPECT_FALSE(CursorModel::hitTest(l, 120.0f, 6.0f, kLineHeight, 100.0f).has_value());
    // Without a clip width the row's own extent bounds the hit
    EXPECT_FALSE(CursorModel::hitTest(l, 60.0f, 6.0f, kLineHeight, std::nullopt).has_value());
}

// =============================================================================
// Movement
// =============================================================================

TEST_F(CursorModelTest, HorizontalMovesClampAtEnds) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setPosition(l, 0);
    EXPECT_EQ(cursor.move(l, Direction::Left, false, 1), 0u);
    cursor.setPosition(l, 10);
    EXPECT_EQ(cursor.move(l, Direction::Right, false, 1), 10u);
    cursor.setPosition(l, 99);
    EXPECT_EQ(cursor.position(), 10u);
}

TEST_F(CursorModelTest, HomeAndEndStayOnRow) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setPosition(l, 8);
    EXPECT_EQ(cursor.move(l, Direction::Home, false, 1), 6u);
    EXPECT_EQ(cursor.move(l, Direction::End, false, 1), 10u);
    cursor.setPosition(l, 1);
    EXPECT_EQ(cursor.move(l, Direction::End, false, 1), 5u);
}

TEST_F(CursorModelTest, VerticalMovesKeepStickyColumn) {
    // Row 0: a0..f5 \n6; row 1: a7 b8 \n9; row 2: a10..f15 sentinel16
    WrappedLayout l = layout("abcdef\nab\nabcdef");
    cursor.setPosition(l, 5);

    EXPECT_EQ(cursor.move(l, Direction::Down, false, 1), 9u);
    ASSERT_TRUE(cursor.stickyX().has_value());
    EXPECT_FLOAT_EQ(*cursor.stickyX(), 50.0f);

    // The short row does not lose the column
    EXPECT_EQ(cursor.move(l, Direction::Down, false, 1), 15u);
    EXPECT_FLOAT_EQ(*cursor.stickyX(), 50.0f);

    cursor.move(l, Direction::Left, false, 1);
    EXPECT_FALSE(cursor.stickyX().has_value());
}

TEST_F(CursorModelTest, VerticalMovesPastEdgesGoToTextEnds) {
    WrappedLayout l = layout("abcdef\nab\nabcdef");
    cursor.setPosition(l, 3);
    EXPECT_EQ(cursor.move(l, Direction::Up, false, 1), 0u);
    cursor.setPosition(l, 12);
    EXPECT_EQ(cursor.move(l, Direction::Down, false, 1), 16u);
}

TEST_F(CursorModelTest, PageMovesStepSeveralRows) {
    WrappedLayout l = layout("abcdef\nab\nabcdef");
    cursor.setPosition(l, 5);
    EXPECT_EQ(cursor.move(l, Direction::PageDown, false, 2), 15u);
    EXPECT_EQ(cursor.move(l, Direction::PageUp, false, 2), 5u);
    EXPECT_EQ(cursor.move(l, Direction::PageUp, false, 2), 0u);
}

TEST_F(CursorModelTest, ExtendGrowsSelectionFromOldCaret) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setPosition(l, 2);
    cursor.collapseSelection();

    cursor.move(l, Direction::Right, true, 1);
    EXPECT_EQ(cursor.selection().anchor, 2u);
    EXPECT_EQ(cursor.selection().moving, 3u);

    cursor.move(l, Direction::Right, true, 1);
    EXPECT_EQ(cursor.selection().lo(), 2u);
    EXPECT_EQ(cursor.selection().hi(), 4u);

    cursor.move(l, Direction::Left, false, 1);
    EXPECT_TRUE(cursor.selection().empty());
    EXPECT_EQ(cursor.position(), 3u);
}

TEST_F(CursorModelTest, ClampAfterShorterLayout) {
    WrappedLayout longer = layout("abcdef");
    cursor.setPosition(longer, 6);
    cursor.setSelection(1, 6);
    WrappedLayout shorter = layout("ab");
    cursor.clamp(shorter);
    EXPECT_EQ(cursor.position(), 2u);
    EXPECT_EQ(cursor.selection().hi(), 2u);
}

// =============================================================================
// Geometry
// =============================================================================

TEST_F(CursorModelTest, CaretRectSitsOnCaretRow) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setPosition(l, 8);
    Rect r = cursor.caretRect(l, kLineHeight, 2.0f, 10.0f);
    EXPECT_FLOAT_EQ(r.x, 20.0f);
    EXPECT_FLOAT_EQ(r.y, 12.0f);
    EXPECT_FLOAT_EQ(r.width, 2.0f);
    EXPECT_FLOAT_EQ(r.height, 10.0f);
}

TEST_F(CursorModelTest, SelectionRectsCoverEachRow) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setSelection(8, 1);
    std::vector<Rect> rects = cursor.selectionRects(l, kLineHeight);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_FLOAT_EQ(rects[0].x, 10.0f);
    EXPECT_FLOAT_EQ(rects[0].y, 0.0f);
    EXPECT_FLOAT_EQ(rects[0].width, 40.0f);
    EXPECT_FLOAT_EQ(rects[0].height, kLineHeight);
    EXPECT_FLOAT_EQ(rects[1].x, 0.0f);
    EXPECT_FLOAT_EQ(rects[1].y, 12.0f);
    EXPECT_FLOAT_EQ(rects[1].width, 20.0f);
}

TEST_F(CursorModelTest, SelectionRectsHaveMinimumWidth) {
    WrappedLayout l = layout("ab cd\nefgh");
    cursor.setSelection(5, 6);
    std::vector<Rect> rects = cursor.selectionRects(l, kLineHeight);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_FLOAT_EQ(rects[0].x, 50.0f);
    EXPECT_FLOAT_EQ(rects[0].width, minSelectionRectWidth);
    EXPECT_FLOAT_EQ(rects[1].width, minSelectionRectWidth);

    cursor.setSelection(3, 3);
    EXPECT_TRUE(cursor.selectionRects(l, kLineHeight).empty());
}
