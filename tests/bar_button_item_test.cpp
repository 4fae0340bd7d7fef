#include "core/bar_button_item.h"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <vector>

namespace chordkit
{
static_assert(!std::is_constructible_v<BarButtonItem, SystemBarItem>, "items are built through Create()");

TEST(BarButtonItemTest, PostInitRunsOnceWithTheSystemItem)
{
    std::vector<SystemBarItem> seen;
    const auto item = BarButtonItem::Create(SystemBarItem::Save, [&seen](BarButtonItem& b, SystemBarItem s) {
        seen.push_back(s);
        EXPECT_EQ(s, b.SystemItem());
        b.SetTitle(std::string("Save Draft"));
    });

    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ(SystemBarItem::Save, seen[0]);
    EXPECT_EQ("Save Draft", item->Title().value());
}

TEST(BarButtonItemTest, PlainItemHasNoKeyCommand)
{
    const auto item = BarButtonItem::Create(SystemBarItem::Save);
    EXPECT_FALSE(item->KeyboardActionValue().has_value());
    EXPECT_FALSE(item->KeyCommand().has_value());
}

TEST(BarButtonItemTest, KeyboardItemAssignsAction)
{
    const auto done = CreateKeyboardBarButtonItem(SystemBarItem::Done);
    ASSERT_TRUE(done->KeyboardActionValue().has_value());
    EXPECT_EQ(KeyboardAction::Done, done->KeyboardActionValue().value());

    const std::optional<CommandDescriptor> cmd = done->KeyCommand();
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(KeyEquivalent(KeyboardAction::Done), cmd->Chord());
    EXPECT_EQ(std::optional<KeyboardAction>(KeyboardAction::Done), ActionFromHandler(cmd->Handler()));

    done->SetEnabled(false);
    EXPECT_FALSE(done->KeyCommand().has_value());
}

TEST(BarButtonItemTest, KeyCommandUsesTitleAsLabel)
{
    const auto trash = CreateKeyboardBarButtonItem(SystemBarItem::Trash);
    trash->SetTitle(std::string("Delete Message"));
    const std::optional<CommandDescriptor> cmd = trash->KeyCommand();
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ("Delete Message", cmd->Label().value());
    EXPECT_EQ(KeyEquivalent(KeyboardAction::Delete), cmd->Chord());
}

TEST(BarButtonItemTest, SystemItemMapping)
{
    EXPECT_EQ(KeyboardAction::Cancel, KeyboardActionForSystemItem(SystemBarItem::Cancel));
    EXPECT_EQ(KeyboardAction::New, KeyboardActionForSystemItem(SystemBarItem::Add));
    EXPECT_EQ(KeyboardAction::Share, KeyboardActionForSystemItem(SystemBarItem::Action));
    EXPECT_EQ(KeyboardAction::Refresh, KeyboardActionForSystemItem(SystemBarItem::Refresh));
    EXPECT_EQ(KeyboardAction::Rewind, KeyboardActionForSystemItem(SystemBarItem::Rewind));
    EXPECT_FALSE(KeyboardActionForSystemItem(SystemBarItem::FlexibleSpace).has_value());
    EXPECT_FALSE(KeyboardActionForSystemItem(SystemBarItem::Camera).has_value());
    EXPECT_FALSE(KeyboardActionForSystemItem(SystemBarItem::Compose).has_value());

    const auto space = CreateKeyboardBarButtonItem(SystemBarItem::FixedSpace);
    EXPECT_FALSE(space->KeyCommand().has_value());

    // Compose is not an alias for Add.
    const auto compose = CreateKeyboardBarButtonItem(SystemBarItem::Compose);
    EXPECT_FALSE(compose->KeyboardActionValue().has_value());
    EXPECT_FALSE(compose->KeyCommand().has_value());
}

} // namespace chordkit
