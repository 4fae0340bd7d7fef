#include "core/tab_selector.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chordkit
{
namespace
{
std::vector<TabDescriptor> MakeTabs(size_t n)
{
    std::vector<TabDescriptor> tabs;
    for (size_t i = 0; i < n; ++i)
        tabs.push_back(TabDescriptor{.title = "Tab " + std::to_string(i)});
    return tabs;
}

std::vector<TabDescriptor> MakeTabs(std::initializer_list<const char*> titles)
{
    std::vector<TabDescriptor> tabs;
    for (const char* t : titles)
        tabs.push_back(TabDescriptor{.title = std::string(t)});
    return tabs;
}

KeyChord PrimaryDigit(char d)
{
    return KeyChord{.modifiers = ModifierFlags::Primary, .trigger = KeyTrigger::Character(d)};
}

class FakeTabHost : public TabHost
{
public:
    std::vector<TabDescriptor> visible;
    size_t configured = 0;
    bool modal = false;
    size_t selected = 0;
    int set_calls = 0;

    std::vector<TabDescriptor> CurrentVisibleTabs() const override { return visible; }
    size_t ConfiguredTabCount() const override { return configured; }
    bool IsModalActive() const override { return modal; }
    size_t SelectedTab() const override { return selected; }
    void SetSelectedTab(size_t index) override
    {
        selected = index;
        ++set_calls;
    }
};

FakeTabHost MakeHost(std::vector<TabDescriptor> tabs)
{
    FakeTabHost host;
    host.configured = tabs.size();
    host.visible = std::move(tabs);
    return host;
}
} // namespace

TEST(TabSelectorTest, CommandCountIsCappedAtNine)
{
    for (size_t n = 0; n <= 20; ++n)
    {
        const std::vector<TabDescriptor> tabs = MakeTabs(n);
        const std::vector<CommandDescriptor> commands = AvailableTabCommands(tabs, false);
        ASSERT_EQ(std::min<size_t>(n, 9), commands.size()) << "n=" << n;
        for (size_t i = 0; i < commands.size(); ++i)
        {
            EXPECT_EQ(PrimaryDigit((char)('1' + i)), commands[i].Chord()) << "n=" << n << " i=" << i;
            EXPECT_EQ(tabs[i].title, commands[i].Label()) << "n=" << n << " i=" << i;
            EXPECT_EQ((HandlerKey)i, commands[i].Handler());
        }
    }
}

TEST(TabSelectorTest, ModalSuppressesAllCommands)
{
    for (size_t n = 0; n <= 20; ++n)
        EXPECT_TRUE(AvailableTabCommands(MakeTabs(n), true).empty()) << "n=" << n;
}

TEST(TabSelectorTest, ThreeNamedTabs)
{
    const std::vector<CommandDescriptor> commands =
        AvailableTabCommands(MakeTabs({"Home", "Search", "Settings"}), false);

    const std::vector<CommandDescriptor> expected = {
        CommandDescriptor(PrimaryDigit('1'), std::string("Home"), 0),
        CommandDescriptor(PrimaryDigit('2'), std::string("Search"), 1),
        CommandDescriptor(PrimaryDigit('3'), std::string("Settings"), 2),
    };
    EXPECT_EQ(expected, commands);
}

TEST(TabSelectorTest, TwelveTabsStopAtTheNinth)
{
    const std::vector<TabDescriptor> tabs = MakeTabs(12);
    const std::vector<CommandDescriptor> commands = AvailableTabCommands(tabs, false);

    ASSERT_EQ(9u, commands.size());
    EXPECT_EQ('9', commands.back().Trigger().character);
    EXPECT_EQ(tabs[8].title, commands.back().Label());
}

TEST(TabSelectorTest, UntitledTabHasNoLabel)
{
    const std::vector<TabDescriptor> tabs = {TabDescriptor{}, TabDescriptor{.title = "Inbox"}};
    const std::vector<CommandDescriptor> commands = AvailableTabCommands(tabs, false);

    ASSERT_EQ(2u, commands.size());
    EXPECT_FALSE(commands[0].Label().has_value());
    EXPECT_EQ("Inbox", commands[1].Label().value());
}

TEST(TabSelectorTest, TabIndexForTriggerDigit)
{
    for (char c = '1'; c <= '9'; ++c)
    {
        const std::optional<size_t> index = TabIndexForTriggerDigit(std::string(1, c));
        ASSERT_TRUE(index.has_value()) << c;
        EXPECT_EQ((size_t)(c - '1'), index.value());
    }

    EXPECT_FALSE(TabIndexForTriggerDigit("0").has_value());
    EXPECT_FALSE(TabIndexForTriggerDigit("a").has_value());
    EXPECT_FALSE(TabIndexForTriggerDigit("10").has_value());
    EXPECT_FALSE(TabIndexForTriggerDigit("").has_value());
    EXPECT_FALSE(TabIndexForTriggerDigit("-1").has_value());
    EXPECT_FALSE(TabIndexForTriggerDigit(" ").has_value());
}

TEST(TabSelectorTest, TriggersRoundTripToTheirPosition)
{
    for (size_t n = 0; n <= 9; ++n)
    {
        const std::vector<CommandDescriptor> commands = AvailableTabCommands(MakeTabs(n), false);
        for (size_t i = 0; i < commands.size(); ++i)
        {
            const char c = commands[i].Trigger().character;
            EXPECT_EQ(std::optional<size_t>(i), TabIndexForTriggerDigit(std::string_view(&c, 1)));
        }
    }
}

TEST(KeyboardTabSelectorTest, KeyCommandsAppendToInherited)
{
    FakeTabHost host = MakeHost(MakeTabs({"Home", "Search"}));
    KeyboardTabSelector selector(host);

    const CommandDescriptor inherited(
        KeyChord{.modifiers = ModifierFlags::Primary, .trigger = KeyTrigger::Character('w')}, std::string("Close"),
        100);
    const std::vector<CommandDescriptor> commands = selector.KeyCommands({inherited});

    ASSERT_EQ(3u, commands.size());
    EXPECT_EQ(inherited, commands[0]);
    EXPECT_EQ("Home", commands[1].Label().value());
    EXPECT_EQ("Search", commands[2].Label().value());
}

TEST(KeyboardTabSelectorTest, KeyCommandsReflectCurrentTabs)
{
    FakeTabHost host = MakeHost(MakeTabs(2));
    KeyboardTabSelector selector(host);
    EXPECT_EQ(2u, selector.KeyCommands().size());

    host.visible = MakeTabs(5);
    host.configured = 5;
    EXPECT_EQ(5u, selector.KeyCommands().size());

    host.modal = true;
    EXPECT_TRUE(selector.KeyCommands().empty());
}

TEST(KeyboardTabSelectorTest, ModalKeepsInheritedCommands)
{
    FakeTabHost host = MakeHost(MakeTabs(3));
    host.modal = true;
    KeyboardTabSelector selector(host);

    const CommandDescriptor inherited(
        KeyChord{.modifiers = ModifierFlags::None, .trigger = KeyTrigger::Named(NamedKey::Escape)}, std::nullopt, 7);
    const std::vector<CommandDescriptor> commands = selector.KeyCommands({inherited});
    ASSERT_EQ(1u, commands.size());
    EXPECT_EQ(inherited, commands[0]);
}

TEST(KeyboardTabSelectorTest, HandleKeyCommandSelectsTab)
{
    FakeTabHost host = MakeHost(MakeTabs(4));
    KeyboardTabSelector selector(host);

    const std::vector<CommandDescriptor> commands = selector.KeyCommands();
    EXPECT_TRUE(selector.HandleKeyCommand(commands[2]));
    EXPECT_EQ(2u, host.selected);
    EXPECT_EQ(1, host.set_calls);

    EXPECT_TRUE(selector.HandleKeyCommand(commands[0]));
    EXPECT_EQ(0u, host.selected);
    EXPECT_EQ(2, host.set_calls);
}

TEST(KeyboardTabSelectorTest, HandleKeyCommandIgnoresUnknownTriggers)
{
    FakeTabHost host = MakeHost(MakeTabs(4));
    host.selected = 1;
    KeyboardTabSelector selector(host);

    const CommandDescriptor zero(PrimaryDigit('0'), std::nullopt, 0);
    const CommandDescriptor letter(PrimaryDigit('a'), std::nullopt, 0);
    const CommandDescriptor escape(KeyChord{.trigger = KeyTrigger::Named(NamedKey::Escape)}, std::nullopt, 0);

    EXPECT_FALSE(selector.HandleKeyCommand(zero));
    EXPECT_FALSE(selector.HandleKeyCommand(letter));
    EXPECT_FALSE(selector.HandleKeyCommand(escape));
    EXPECT_EQ(1u, host.selected);
    EXPECT_EQ(0, host.set_calls);
}

TEST(KeyboardTabSelectorTest, HandleKeyCommandIgnoresTabsThatWentAway)
{
    FakeTabHost host = MakeHost(MakeTabs(5));
    KeyboardTabSelector selector(host);
    const std::vector<CommandDescriptor> commands = selector.KeyCommands();

    host.visible = MakeTabs(2);
    host.configured = 2;
    EXPECT_FALSE(selector.HandleKeyCommand(commands[4]));
    EXPECT_EQ(0, host.set_calls);
}

TEST(KeyboardTabSelectorTest, DisablesFocusNavigation)
{
    FakeTabHost host = MakeHost(MakeTabs(1));
    EXPECT_FALSE(KeyboardTabSelector(host).AllowsFocusNavigation());
}

TEST(KeyboardTabSelectorDeathTest, HiddenTabsAreAConfigurationError)
{
    FakeTabHost host = MakeHost(MakeTabs(5));
    host.configured = 7;
    KeyboardTabSelector selector(host);

    EXPECT_DEATH((void)selector.KeyCommands(), "overflow list");
}

} // namespace chordkit
