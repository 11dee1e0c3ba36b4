#include "awsctx/context/settings-store.hh"

#include <gtest/gtest.h>

namespace awsctx {

TEST(MemorySettingsStore, missingKey)
{
    MemorySettingsStore store;

    ASSERT_EQ(store.readSetting("aws.profile"), std::nullopt);
    ASSERT_EQ(store.readSetting<std::string>("aws.profile"), std::nullopt);
}

TEST(MemorySettingsStore, mostSpecificTierWins)
{
    MemorySettingsStore store;

    store.writeSetting("aws.profile", "global", SettingsScope::Global);
    ASSERT_EQ(store.readSetting<std::string>("aws.profile"), "global");

    store.writeSetting("aws.profile", "workspace", SettingsScope::Workspace);
    ASSERT_EQ(store.readSetting<std::string>("aws.profile"), "workspace");

    store.writeSetting("aws.profile", "folder", SettingsScope::WorkspaceFolder);
    ASSERT_EQ(store.readSetting<std::string>("aws.profile"), "folder");

    ASSERT_EQ(store.inspect("aws.profile", SettingsScope::Global), nlohmann::json("global"));
}

TEST(MemorySettingsStore, clearingTierExposesNextOne)
{
    MemorySettingsStore store;

    store.writeSetting("aws.profile", "global", SettingsScope::Global);
    store.writeSetting("aws.profile", "workspace", SettingsScope::Workspace);
    store.writeSetting("aws.profile", std::nullopt, SettingsScope::Workspace);

    ASSERT_EQ(store.readSetting<std::string>("aws.profile"), "global");
    ASSERT_EQ(store.inspect("aws.profile", SettingsScope::Workspace), std::nullopt);
}

TEST(MemorySettingsStore, typedReadOfWrongType)
{
    MemorySettingsStore store;

    store.writeSetting("aws.explorerRegions", "us-east-1", SettingsScope::Global);

    ASSERT_THROW(store.readSetting<Strings>("aws.explorerRegions"), SettingsError);
}

TEST(MemorySettingsStore, typedReadOfList)
{
    MemorySettingsStore store;

    store.writeSetting("aws.explorerRegions", Strings{"us-east-1", "eu-west-1"}, SettingsScope::Global);

    ASSERT_EQ(store.readSetting<Strings>("aws.explorerRegions"), Strings({"us-east-1", "eu-west-1"}));
}

TEST(showSettingsScope, names)
{
    ASSERT_EQ(showSettingsScope(SettingsScope::Global), "global");
    ASSERT_EQ(showSettingsScope(SettingsScope::Workspace), "workspace");
    ASSERT_EQ(showSettingsScope(SettingsScope::WorkspaceFolder), "workspace-folder");
}

} // namespace awsctx
