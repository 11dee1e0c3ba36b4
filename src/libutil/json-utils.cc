#include "awsctx/util/json-utils.hh"

namespace awsctx {

static const nlohmann::json & expect(const nlohmann::json & value, nlohmann::json::value_t type)
{
    if (value.type() != type)
        throw Error(
            "expected a JSON %s, got %s %s", nlohmann::json(type).type_name(), value.type_name(), value.dump());
    return value;
}

const nlohmann::json::object_t & getObject(const nlohmann::json & value)
{
    return expect(value, nlohmann::json::value_t::object).get_ref<const nlohmann::json::object_t &>();
}

const nlohmann::json::string_t & getString(const nlohmann::json & value)
{
    return expect(value, nlohmann::json::value_t::string).get_ref<const nlohmann::json::string_t &>();
}

Strings getStringList(const nlohmann::json & value)
{
    Strings res;
    for (auto & elem : expect(value, nlohmann::json::value_t::array))
        res.push_back(getString(elem));
    return res;
}

} // namespace awsctx
