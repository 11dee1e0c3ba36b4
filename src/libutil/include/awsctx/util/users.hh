#pragma once
///@file

#include "awsctx/util/types.hh"

#include <filesystem>
#include <vector>

namespace awsctx {

/**
 * @return $HOME, or the home directory from the password database if
 * $HOME is unset or belongs to someone else.
 */
std::filesystem::path getHome();

/**
 * @return $AWSCTX_CONFIG_HOME, $XDG_CONFIG_HOME/awsctx or
 * ~/.config/awsctx.
 */
std::filesystem::path getConfigDir();

/**
 * `getConfigDir()` followed by `awsctx` under each of
 * $XDG_CONFIG_DIRS, highest priority first.
 */
std::vector<std::filesystem::path> getConfigDirs();

/**
 * @return $AWSCTX_STATE_HOME, $XDG_STATE_HOME/awsctx or
 * ~/.local/state/awsctx.
 */
std::filesystem::path getStateDir();

/**
 * Replace a leading `~` in `path` by the home directory.
 */
std::string expandTilde(std::string_view path);

} // namespace awsctx
