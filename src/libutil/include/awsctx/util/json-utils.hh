#pragma once
///@file

#include <nlohmann/json.hpp>

#include "awsctx/util/error.hh"
#include "awsctx/util/types.hh"

namespace awsctx {

/**
 * Checked accessors for values read back from a store. Each one throws
 * an `Error` naming the expected and actual JSON type instead of
 * nlohmann's `type_error`.
 */
const nlohmann::json::object_t & getObject(const nlohmann::json & value);
const nlohmann::json::string_t & getString(const nlohmann::json & value);

/**
 * Convert a JSON array of strings, keeping order and duplicates.
 */
Strings getStringList(const nlohmann::json & value);

} // namespace awsctx

namespace nlohmann {

/**
 * `std::nullopt` is written as `null`, and `null` reads back as
 * `std::nullopt`. `T` must not use `null` in its own JSON form.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    static void from_json(const json & json, std::optional<T> & t)
    {
        if (json.is_null())
            t.reset();
        else
            t = json.template get<T>();
    }

    static void to_json(json & json, const std::optional<T> & t)
    {
        json = t ? nlohmann::json(*t) : nlohmann::json(nullptr);
    }
};

} // namespace nlohmann
