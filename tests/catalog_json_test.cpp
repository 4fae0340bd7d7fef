#include "core/catalog_json.h"
#include "core/keyboard_action.h"
#include "core/tab_selector.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using json = nlohmann::json;

namespace chordkit
{
TEST(CatalogJsonTest, CatalogDocument)
{
    const json j = CatalogToJson(Platform::MacOS);

    EXPECT_EQ(1, j["schema_version"].get<int>());
    EXPECT_EQ("macos", j["platform"].get<std::string>());
    ASSERT_TRUE(j["actions"].is_array());
    ASSERT_EQ(kKeyboardActionCount, j["actions"].size());

    const json& cancel = j["actions"][0];
    EXPECT_EQ("cancel", cancel["id"].get<std::string>());
    EXPECT_EQ("Esc", cancel["chord"].get<std::string>());
    EXPECT_TRUE(cancel["modifiers"].empty());
    EXPECT_EQ("escape", cancel["trigger"].get<std::string>());
    EXPECT_TRUE(cancel["cancel_action"].get<bool>());

    const json& rewind = j["actions"][16];
    EXPECT_EQ("rewind", rewind["id"].get<std::string>());
    EXPECT_EQ("Cmd+Left", rewind["chord"].get<std::string>());
    EXPECT_EQ(json::array({"super"}), rewind["modifiers"]);
    EXPECT_EQ("without_mirroring", rewind["mirroring"].get<std::string>());

    EXPECT_EQ(json::array({json::array({"reply", "refresh"})}), j["collisions"]);
}

TEST(CatalogJsonTest, PrimaryModifierFollowsPlatform)
{
    const json j = CatalogToJson(Platform::Linux);
    const json& close = j["actions"][1];
    EXPECT_EQ("close", close["id"].get<std::string>());
    EXPECT_EQ("Ctrl+W", close["chord"].get<std::string>());
    EXPECT_EQ(json::array({"ctrl"}), close["modifiers"]);
    EXPECT_EQ("w", close["trigger"].get<std::string>());
}

TEST(CatalogJsonTest, TabCommands)
{
    const std::vector<TabDescriptor> tabs = {TabDescriptor{.title = "Home"}, TabDescriptor{}};
    const json j = CommandsToJson(AvailableTabCommands(tabs, false), Platform::Windows);

    ASSERT_EQ(2u, j.size());
    EXPECT_EQ("Ctrl+1", j[0]["chord"].get<std::string>());
    EXPECT_EQ("Home", j[0]["label"].get<std::string>());
    EXPECT_EQ(0, j[0]["handler"].get<int>());
    EXPECT_TRUE(j[1]["label"].is_null());
    EXPECT_EQ(1, j[1]["handler"].get<int>());
}

TEST(CatalogJsonTest, SaveCatalogJson)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "chordkit_catalog_test.json";

    std::string err;
    ASSERT_TRUE(SaveCatalogJson(path.string(), Platform::Windows, err)) << err;
    EXPECT_TRUE(err.empty());

    std::ifstream f(path);
    ASSERT_TRUE(f.good());
    json j;
    f >> j;
    EXPECT_EQ(CatalogToJson(Platform::Windows), j);

    f.close();
    std::filesystem::remove(path);
}

TEST(CatalogJsonTest, SaveCatalogJsonReportsOpenFailure)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "chordkit_missing_dir" / "nested" / "catalog.json";

    std::string err;
    EXPECT_FALSE(SaveCatalogJson(path.string(), Platform::Linux, err));
    EXPECT_NE(std::string::npos, err.find("Failed to open"));
}

} // namespace chordkit
