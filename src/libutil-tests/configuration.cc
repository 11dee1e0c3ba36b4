#include "awsctx/util/configuration.hh"
#include "awsctx/util/error.hh"
#include "awsctx/util/config-global.hh"
#include "awsctx/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace awsctx {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
}

TEST(Config, getDefinedSetting)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "");
    ASSERT_EQ(iter->second.description, "description\n");
    ASSERT_EQ(iter->second.origin, "default");
}

TEST(Config, getDefinedOverriddenSettingNotSet)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_EQ(settings.find("name-of-the-setting"), settings.end());
}

TEST(Config, originFollowsLastAssignment)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_FALSE(setting.isOverridden());

    config.set("name-of-the-setting", "foo", "/etc/awsctx/awsctx.conf");
    ASSERT_EQ(setting.origin, "/etc/awsctx/awsctx.conf");

    setting = "bar";
    ASSERT_EQ(setting.get(), "bar");
    ASSERT_EQ(setting.origin, "<code>");

    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_EQ(settings["name-of-the-setting"].value, "bar");

    setting.reset();
    ASSERT_EQ(setting.get(), "");
    ASSERT_FALSE(setting.isOverridden());
}

TEST(Config, toJSONOnEmptyConfig)
{
    ASSERT_EQ(Config().toJSON().dump(), "{}");
}

TEST(Config, toJSONOnNonEmptyConfig)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    setting.assign("value");

    ASSERT_EQ(
        config.toJSON().dump(),
        R"#({"name-of-the-setting":{"defaultValue":"","description":"description\n","origin":"<code>","value":"value"}})#");
}

TEST(Config, toJSONOfOptionalSetting)
{
    Config config;
    Setting<std::optional<std::string>> setting{&config, std::nullopt, "log-path", "description"};

    ASSERT_TRUE(config.toJSON()["log-path"]["value"].is_null());
    ASSERT_TRUE(config.set("log-path", "/tmp/log"));
    ASSERT_EQ(config.toJSON()["log-path"]["value"], "/tmp/log");
}

TEST(Config, setBool)
{
    Config config;
    Setting<bool> setting{&config, true, "flag", "description"};

    ASSERT_TRUE(config.set("flag", "no"));
    ASSERT_EQ(setting.get(), false);
    ASSERT_TRUE(config.set("flag", "1"));
    ASSERT_EQ(setting.get(), true);
    ASSERT_THROW(config.set("flag", "maybe"), UsageError);
}

TEST(Config, setInteger)
{
    Config config;
    Setting<unsigned int> setting{&config, 30, "timeout", "description"};

    ASSERT_TRUE(config.set("timeout", "5"));
    ASSERT_EQ(setting.get(), 5u);
    ASSERT_THROW(config.set("timeout", "soon"), UsageError);
    ASSERT_THROW(config.set("timeout", "-1"), UsageError);
    ASSERT_EQ(setting.get(), 5u);
}

TEST(Config, failedSetKeepsOrigin)
{
    Config config;
    Setting<bool> setting{&config, true, "flag", "description"};

    ASSERT_THROW(config.set("flag", "maybe", "AWSCTX_CONFIG"), UsageError);
    ASSERT_FALSE(setting.isOverridden());
}

TEST(Config, pathSettingIsNormalised)
{
    Config config;
    PathSetting setting{&config, "/default", "some-path", "description"};

    ASSERT_TRUE(config.set("some-path", "/foo//bar/./baz/"));
    ASSERT_EQ(setting.get(), "/foo/bar/baz");
    ASSERT_THROW(config.set("some-path", ""), UsageError);
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigWithComments)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    config.applyConfig(
        "# a comment\n"
        "name-of-the-setting = value # trailing comment\n"
        "\n",
        "/tmp/awsctx.conf");

    ASSERT_EQ(setting.get(), "value");
    ASSERT_EQ(setting.origin, "/tmp/awsctx.conf");
}

TEST(Config, applyConfigJoinsTokens)
{
    Config config;
    Setting<std::string> setting{&config, "", "name", "description"};

    config.applyConfig("name =   several   words  ");

    ASSERT_EQ(setting.get(), "several words");
}

TEST(Config, applyConfigUnknownSettingIsRemembered)
{
    Config config;
    config.applyConfig("later = value\n", "AWSCTX_CONFIG");

    Setting<std::string> setting{&config, "default", "later", "description"};
    ASSERT_EQ(setting.get(), "value");
    ASSERT_EQ(setting.origin, "AWSCTX_CONFIG");
}

TEST(Config, applyConfigInvalidThrows)
{
    Config config;
    ASSERT_THROW(config.applyConfig("value == key"), UsageError);
    ASSERT_THROW(config.applyConfig("value "), UsageError);
    ASSERT_THROW(config.applyConfig("include"), UsageError);
}

TEST(Config, applyConfigBadValueNamesSource)
{
    Config config;
    Setting<unsigned int> setting{&config, 30, "timeout", "description"};

    try {
        config.applyConfig("timeout = soon\n", "/etc/awsctx/awsctx.conf");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_EQ(e.info().traces.size(), 1u);
    }
}

TEST(Config, applyConfigIncludes)
{
    AutoDelete tmpDir(createTempDir());
    auto main = tmpDir.path() / "awsctx.conf";
    writeFile(tmpDir.path() / "extra.conf", "b = from-include\n");
    writeFile(main, "a = from-main\ninclude extra.conf\n!include missing.conf\n");

    Config config;
    Setting<std::string> a{&config, "", "a", "description"};
    Setting<std::string> b{&config, "", "b", "description"};

    config.applyConfig(readFile(main), main.string());

    ASSERT_EQ(a.get(), "from-main");
    ASSERT_EQ(b.get(), "from-include");
    ASSERT_EQ(b.origin, (tmpDir.path() / "extra.conf").string());
}

TEST(Config, applyConfigMissingIncludeThrows)
{
    AutoDelete tmpDir(createTempDir());
    auto main = tmpDir.path() / "awsctx.conf";

    Config config;
    ASSERT_THROW(config.applyConfig("include missing.conf\n", main.string()), Error);
}

/* ----------------------------------------------------------------------------
 * GlobalConfig
 * --------------------------------------------------------------------------*/

TEST(GlobalConfig, setForwardsToRegisteredConfigs)
{
    static Config config;
    static Setting<std::string> setting{&config, "", "global-config-test-setting", "description"};
    static GlobalConfig::Register r(&config);

    GlobalConfig globals;
    ASSERT_TRUE(globals.set("global-config-test-setting", "value"));
    ASSERT_EQ(setting.get(), "value");
    ASSERT_FALSE(globals.set("global-config-test-unknown", "value"));

    ASSERT_EQ(globals.toJSON()["global-config-test-setting"]["value"], "value");
}

} // namespace awsctx
