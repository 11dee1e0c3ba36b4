#include "awsctx/context/globals.hh"
#include "awsctx/util/config-global.hh"
#include "awsctx/util/config-impl.hh"
#include "awsctx/util/environment-variables.hh"
#include "awsctx/util/file-system.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/strings.hh"
#include "awsctx/util/users.hh"

namespace awsctx {

ContextSettings::ContextSettings()
    : confDir(getEnvNonEmpty("AWSCTX_CONF_DIR").value_or("/etc/awsctx"))
    , userConfFiles(getUserConfigFiles())
    , stateFile(
          this,
          (getStateDir() / "context-state.json").string(),
          "state-file",
          R"(
            The JSON file in which the resolved account id is kept
            across restarts.
          )")
{
}

ContextSettings contextSettings;

static GlobalConfig::Register rContextSettings(&contextSettings);

void loadConfFile(AbstractConfig & config)
{
    auto applyConfigFile = [&](const Path & path) {
        if (!pathExists(path))
            return;
        debug("loading configuration from '%s'", path);
        config.applyConfig(readFile(path), path);
    };

    applyConfigFile(contextSettings.confDir + "/awsctx.conf");

    auto files = contextSettings.userConfFiles;
    for (auto file = files.rbegin(); file != files.rend(); file++) {
        applyConfigFile(*file);
    }

    auto confEnv = getEnv("AWSCTX_CONFIG");
    if (confEnv.has_value()) {
        config.applyConfig(confEnv.value(), "AWSCTX_CONFIG");
    }
}

void initLibContext(bool loadConfig)
{
    if (loadConfig)
        loadConfFile(globalConfig);

    globalConfig.warnUnknownSettings();

    debug("using persistent state file '%s'", contextSettings.stateFile.get());
}

std::vector<Path> getUserConfigFiles()
{
    auto confFiles = getEnv("AWSCTX_USER_CONF_FILES");
    if (confFiles.has_value()) {
        return tokenizeString<std::vector<std::string>>(confFiles.value(), ":");
    }

    std::vector<Path> files;
    for (auto & dir : getConfigDirs()) {
        files.push_back((dir / "awsctx.conf").string());
    }
    return files;
}

} // namespace awsctx
