#pragma once
/**
 * @file
 *
 * Definitions of the `BaseSetting` members that depend on `T`. Include
 * this only when declaring a setting of a type that configuration.cc
 * does not already instantiate.
 */

#include "awsctx/util/configuration.hh"
#include "awsctx/util/error.hh"
#include "awsctx/util/strings.hh"
#include "awsctx/util/json-utils.hh"

#include <type_traits>

#include <nlohmann/json.hpp>

namespace awsctx {

template<typename T>
nlohmann::json BaseSetting<T>::toJSON() const
{
    auto res = nlohmann::json::object();
    res["value"] = value;
    res["defaultValue"] = defaultValue;
    res["description"] = description;
    res["origin"] = origin;
    return res;
}

/* Non-integral settings are specialised in configuration.cc. */
template<> std::string BaseSetting<std::string>::parse(const std::string &) const;
template<> std::string BaseSetting<std::string>::to_string() const;
template<> std::optional<std::string> BaseSetting<std::optional<std::string>>::parse(const std::string &) const;
template<> std::string BaseSetting<std::optional<std::string>>::to_string() const;
template<> bool BaseSetting<bool>::parse(const std::string &) const;
template<> std::string BaseSetting<bool>::to_string() const;

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral_v<T>, "settings without a specialised parser must be integers");

    auto n = string2Int<T>(str);
    if (!n)
        throw UsageError("setting '%s' expects an integer, got '%s'", name, str);
    return *n;
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    return std::to_string(value);
}

} // namespace awsctx
