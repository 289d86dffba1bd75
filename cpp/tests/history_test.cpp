#include <gtest/gtest.h>
#include "textarea/edit/history_manager.h"

using textarea::edit::HistoryManager;
using textarea::edit::TextSnapshot;

TEST(HistoryTest, ResetHoldsSingleLevel) {
    HistoryManager history(10);
    history.reset("a");
    EXPECT_EQ(history.getHistorySize(), 1u);
    EXPECT_EQ(history.getCursor(), 0u);
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.canRedo());
    EXPECT_FALSE(history.navigate(-1, 0).has_value());
}

TEST(HistoryTest, UndoRedoSequence) {
    HistoryManager history(10);
    history.reset("a");
    history.recordEdit("ab", 1);
    history.recordEdit("abc", 2);
    EXPECT_TRUE(history.canUndo());

    std::optional<TextSnapshot> s = history.navigate(-1, 3);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->text, "ab");
    EXPECT_EQ(s->caret, std::optional<std::uint32_t>(2u));
    // The live caret was stored on the newest level when leaving it
    EXPECT_EQ(history.entry(2).caret, std::optional<std::uint32_t>(3u));

    s = history.navigate(-1, 2);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->text, "a");
    EXPECT_EQ(s->caret, std::optional<std::uint32_t>(1u));
    EXPECT_FALSE(history.navigate(-1, 1).has_value());

    s = history.navigate(1, 1);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->text, "ab");

    // Large deltas clamp to the newest level
    s = history.navigate(5, 2);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->text, "abc");
    EXPECT_EQ(s->caret, std::optional<std::uint32_t>(3u));
    EXPECT_FALSE(history.canRedo());
}

TEST(HistoryTest, RecordingAfterUndoDropsRedoBranch) {
    HistoryManager history(10);
    history.reset("");
    history.recordEdit("a", 0);
    history.recordEdit("ab", 1);
    ASSERT_TRUE(history.navigate(-1, 2).has_value());
    EXPECT_TRUE(history.canRedo());

    history.recordEdit("ax", 1);
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(history.getHistorySize(), 3u);
    EXPECT_EQ(history.entry(2).text, "ax");
    EXPECT_EQ(history.getCursor(), 2u);
}

TEST(HistoryTest, CapacityEvictsOldestLevel) {
    HistoryManager history(2);
    history.reset("");
    history.recordEdit("1", 0);
    history.recordEdit("12", 1);
    history.recordEdit("123", 2);

    EXPECT_EQ(history.getHistorySize(), 2u);
    EXPECT_EQ(history.entry(0).text, "12");

    std::optional<TextSnapshot> s = history.navigate(-1, 3);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->text, "12");
    EXPECT_FALSE(history.navigate(-1, 2).has_value());
}

TEST(HistoryTest, ZeroCapacityDisablesHistory) {
    HistoryManager history(0);
    history.reset("a");
    history.recordEdit("ab", 1);
    EXPECT_EQ(history.getHistorySize(), 0u);
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.navigate(-1, 0).has_value());
}

TEST(HistoryTest, ShrinkingCapacityKeepsNewestLevels) {
    HistoryManager history(10);
    history.reset("");
    history.recordEdit("a", 0);
    history.recordEdit("ab", 1);
    history.recordEdit("abc", 2);

    history.setCapacity(2);
    EXPECT_EQ(history.getHistorySize(), 2u);
    EXPECT_EQ(history.entry(0).text, "ab");
    EXPECT_EQ(history.getCursor(), 1u);
}
