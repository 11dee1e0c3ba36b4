#pragma once
///@file

#include "awsctx/util/environment-variables.hh"

#include <cstdlib>

namespace awsctx::testing {

/**
 * Set (or with `std::nullopt`, unset) an environment variable for the
 * lifetime of this object, restoring its previous value afterwards.
 */
class ScopedEnv
{
    std::string name;
    std::optional<std::string> saved;

    static void assign(const std::string & name, const std::optional<std::string> & value)
    {
        if (value)
            ::setenv(name.c_str(), value->c_str(), 1);
        else
            ::unsetenv(name.c_str());
    }

public:

    ScopedEnv(std::string name, const std::optional<std::string> & value)
        : name(std::move(name))
        , saved(getEnv(this->name))
    {
        assign(this->name, value);
    }

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv & operator=(const ScopedEnv &) = delete;

    ~ScopedEnv()
    {
        assign(name, saved);
    }
};

} // namespace awsctx::testing
