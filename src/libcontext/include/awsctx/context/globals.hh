#pragma once
///@file

#include "awsctx/util/configuration.hh"
#include "awsctx/util/types.hh"

#include <vector>

namespace awsctx {

struct ContextSettings : public Config
{
    ContextSettings();

    /**
     * The directory holding the system-wide `awsctx.conf`.
     */
    Path confDir;

    /**
     * User configuration files, highest priority first.
     */
    std::vector<Path> userConfFiles;

    Setting<std::string> profileSettingKey{
        this,
        "aws.profile",
        "profile-setting-key",
        R"(
          The settings store key holding the name of the selected
          credential profile.
        )"};

    Setting<std::string> regionsSettingKey{
        this,
        "aws.explorerRegions",
        "regions-setting-key",
        R"(
          The settings store key holding the ordered list of explorer
          regions.
        )"};

    Setting<std::string> accountIdStateKey{
        this,
        "aws.accountId",
        "account-id-state-key",
        "The persistent state key holding the resolved account id."};

    PathSetting stateFile;

    Setting<bool> sharedFileCredentials{
        this,
        true,
        "shared-file-credentials",
        R"(
          Whether to fall back to the shared credentials and config
          files (`~/.aws/credentials`, `~/.aws/config`) when the
          credentials manager cannot resolve a profile.
        )"};

    Setting<bool> processCredentials{
        this,
        true,
        "process-credentials",
        R"(
          Whether to fall back to the `credential_process` configured
          for a profile when the shared files yield nothing.
        )"};

    Setting<unsigned int> credentialsTimeout{
        this,
        30,
        "credentials-timeout",
        "Seconds to wait for a file or process credential provider to answer."};
};

extern ContextSettings contextSettings;

/**
 * Apply the system configuration file, the user configuration files
 * and `$AWSCTX_CONFIG` to `config`, in that order.
 */
void loadConfFile(AbstractConfig & config);

/**
 * Load the configuration files into `globalConfig` (unless
 * `loadConfig` is false) and warn about settings nothing registered.
 */
void initLibContext(bool loadConfig = true);

/**
 * @return User configuration files, from `$AWSCTX_USER_CONF_FILES` if
 * set, otherwise `awsctx.conf` in each XDG config directory.
 */
std::vector<Path> getUserConfigFiles();

} // namespace awsctx
