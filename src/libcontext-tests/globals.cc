#include "awsctx/context/globals.hh"
#include "awsctx/context/tests/capturing-logger.hh"
#include "awsctx/context/tests/scoped-env.hh"
#include "awsctx/util/file-system.hh"
#include "awsctx/util/users.hh"

#include <gtest/gtest.h>

namespace awsctx {

TEST(ContextSettings, defaults)
{
    ContextSettings settings;

    ASSERT_EQ(settings.profileSettingKey.get(), "aws.profile");
    ASSERT_EQ(settings.regionsSettingKey.get(), "aws.explorerRegions");
    ASSERT_EQ(settings.accountIdStateKey.get(), "aws.accountId");
    ASSERT_EQ(settings.stateFile.get(), (getStateDir() / "context-state.json").string());
    ASSERT_TRUE(settings.sharedFileCredentials.get());
    ASSERT_TRUE(settings.processCredentials.get());
    ASSERT_EQ(settings.credentialsTimeout.get(), 30u);
}

TEST(ContextSettings, settingsAreSetByName)
{
    ContextSettings settings;

    ASSERT_TRUE(settings.set("regions-setting-key", "explorer.regions"));
    ASSERT_TRUE(settings.set("process-credentials", "false"));
    ASSERT_TRUE(settings.set("credentials-timeout", "5"));
    ASSERT_FALSE(settings.set("no-such-setting", "1"));

    ASSERT_EQ(settings.regionsSettingKey.get(), "explorer.regions");
    ASSERT_FALSE(settings.processCredentials.get());
    ASSERT_EQ(settings.credentialsTimeout.get(), 5u);

    ASSERT_THROW(settings.set("credentials-timeout", "soon"), UsageError);
    ASSERT_THROW(settings.set("state-file", ""), UsageError);
}

TEST(getUserConfigFiles, fromEnvironment)
{
    testing::ScopedEnv env("AWSCTX_USER_CONF_FILES", "/a/awsctx.conf:/b/awsctx.conf");

    ASSERT_EQ(getUserConfigFiles(), std::vector<Path>({"/a/awsctx.conf", "/b/awsctx.conf"}));
}

class LoadConfFileTest : public testing::WithCapturingLogger
{
protected:
    AutoDelete tmpDir{createTempDir()};
    Path dir = tmpDir.path().string();

    testing::ScopedEnv config{"AWSCTX_CONFIG", std::nullopt};

    Path savedConfDir = contextSettings.confDir;
    std::vector<Path> savedUserConfFiles = contextSettings.userConfFiles;

    void SetUp() override
    {
        WithCapturingLogger::SetUp();
        contextSettings.confDir = dir + "/etc";
        contextSettings.userConfFiles = {dir + "/user-high.conf", dir + "/user-low.conf"};
    }

    void TearDown() override
    {
        contextSettings.confDir = savedConfDir;
        contextSettings.userConfFiles = savedUserConfFiles;
        contextSettings.credentialsTimeout.reset();
        WithCapturingLogger::TearDown();
    }
};

TEST_F(LoadConfFileTest, missingFilesAreSkipped)
{
    ContextSettings settings;

    loadConfFile(settings);

    ASSERT_EQ(settings.profileSettingKey.get(), "aws.profile");
}

TEST_F(LoadConfFileTest, laterSourcesOverrideEarlierOnes)
{
    createDirs(dir + "/etc");
    writeFile(
        dir + "/etc/awsctx.conf",
        "profile-setting-key = system.profile\n"
        "regions-setting-key = system.regions\n"
        "account-id-state-key = system.accountId\n");
    writeFile(dir + "/user-low.conf", "regions-setting-key = low.regions\naccount-id-state-key = low.accountId\n");
    writeFile(dir + "/user-high.conf", "regions-setting-key = high.regions # wins over low\n");
    testing::ScopedEnv env("AWSCTX_CONFIG", "shared-file-credentials = false");

    ContextSettings settings;
    loadConfFile(settings);

    ASSERT_EQ(settings.profileSettingKey.get(), "system.profile");
    ASSERT_EQ(settings.regionsSettingKey.get(), "high.regions");
    ASSERT_EQ(settings.accountIdStateKey.get(), "low.accountId");
    ASSERT_FALSE(settings.sharedFileCredentials.get());
}

TEST_F(LoadConfFileTest, badValueNamesItsSource)
{
    writeFile(dir + "/user-low.conf", "credentials-timeout = never\n");

    ContextSettings settings;
    try {
        loadConfFile(settings);
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_EQ(e.info().traces.size(), 1u);
    }
}

TEST_F(LoadConfFileTest, initLibContextConfiguresGlobalSettings)
{
    writeFile(dir + "/user-low.conf", "credentials-timeout = 7\nno-such-setting = 1\n");

    initLibContext();

    ASSERT_EQ(contextSettings.credentialsTimeout.get(), 7u);
    ASSERT_EQ(contextSettings.credentialsTimeout.origin, dir + "/user-low.conf");
    ASSERT_TRUE(capturedLog->contains(lvlWarn, "unknown setting 'no-such-setting'"));
}

} // namespace awsctx
