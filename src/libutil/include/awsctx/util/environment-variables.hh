#pragma once
///@file

#include <optional>
#include <string>

namespace awsctx {

/**
 * The value of environment variable `key`, if set.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv`, but a variable set to the empty string counts as
 * unset.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

} // namespace awsctx
