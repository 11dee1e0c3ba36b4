#include "awsctx/context/persistent-state.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/util/file-system.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sys/stat.h>

namespace awsctx {

class FilePersistentStateTest : public ::testing::Test
{
protected:
    AutoDelete tmpDir{createTempDir()};
    std::filesystem::path statePath = std::filesystem::path(tmpDir.path()) / "state" / "context-state.json";
};

TEST_F(FilePersistentStateTest, missingFileIsEmpty)
{
    FilePersistentState state(statePath);

    ASSERT_EQ(state.get("aws.accountId"), std::nullopt);
    ASSERT_FALSE(pathExists(statePath));
}

TEST_F(FilePersistentStateTest, openPersistentStateUsesStateFileSetting)
{
    contextSettings.stateFile = statePath.string();

    openPersistentState()->update("aws.accountId", nlohmann::json("123456789012"));
    auto reopened = openPersistentState();
    contextSettings.stateFile.reset();

    ASSERT_EQ(nlohmann::json::parse(readFile(statePath)), R"({"aws.accountId": "123456789012"})"_json);
    ASSERT_EQ(reopened->get("aws.accountId"), nlohmann::json("123456789012"));
}

TEST_F(FilePersistentStateTest, updateCreatesFileAndSurvivesReopen)
{
    {
        FilePersistentState state(statePath);
        state.update("aws.accountId", nlohmann::json("123456789012"));
        ASSERT_EQ(state.get("aws.accountId"), nlohmann::json("123456789012"));
    }

    ASSERT_TRUE(pathExists(statePath));
    ASSERT_EQ(nlohmann::json::parse(readFile(statePath)), R"({"aws.accountId": "123456789012"})"_json);

    FilePersistentState reopened(statePath);
    ASSERT_EQ(reopened.get("aws.accountId"), nlohmann::json("123456789012"));
}

TEST_F(FilePersistentStateTest, fileIsPrivate)
{
    FilePersistentState state(statePath);
    state.update("k", nlohmann::json(1));

    struct stat st;
    ASSERT_EQ(stat(statePath.c_str(), &st), 0);
    ASSERT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(FilePersistentStateTest, removingKeyKeepsOthers)
{
    FilePersistentState state(statePath);
    state.update("a", nlohmann::json(1));
    state.update("b", nlohmann::json(2));
    state.update("a", std::nullopt);

    ASSERT_EQ(state.get("a"), std::nullopt);
    ASSERT_EQ(nlohmann::json::parse(readFile(statePath)), R"({"b": 2})"_json);
}

TEST_F(FilePersistentStateTest, invalidJSON)
{
    createDirs(statePath.parent_path());
    writeFile(statePath, "{ not json");

    FilePersistentState state(statePath);
    ASSERT_THROW(state.get("aws.accountId"), StateError);
}

TEST_F(FilePersistentStateTest, nonObjectIsMalformed)
{
    createDirs(statePath.parent_path());
    writeFile(statePath, "[1, 2, 3]");

    FilePersistentState state(statePath);
    try {
        state.get("aws.accountId");
        FAIL() << "expected a StateError";
    } catch (StateError & e) {
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("is malformed"));
    }
}

TEST_F(FilePersistentStateTest, failedUpdateKeepsPreviousValue)
{
    FilePersistentState state(statePath);
    state.update("aws.accountId", nlohmann::json("111111111111"));

    /* A directory in place of the file makes the rename fail. */
    std::filesystem::remove(statePath);
    createDirs(statePath);

    ASSERT_THROW(state.update("aws.accountId", nlohmann::json("222222222222")), Error);
    ASSERT_EQ(state.get("aws.accountId"), nlohmann::json("111111111111"));
}

TEST(MemoryPersistentState, getAndUpdate)
{
    MemoryPersistentState state;

    ASSERT_EQ(state.get("k"), std::nullopt);

    state.update("k", nlohmann::json::array({1, 2}));
    ASSERT_EQ(state.get("k"), nlohmann::json::array({1, 2}));

    state.update("k", std::nullopt);
    ASSERT_EQ(state.get("k"), std::nullopt);
}

} // namespace awsctx
