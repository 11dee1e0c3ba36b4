#include "awsctx/util/config-global.hh"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace awsctx {

GlobalConfig globalConfig;

bool GlobalConfig::set(const std::string & name, const std::string & value, std::string_view origin)
{
    auto & configs = configRegistrations();
    return std::any_of(
        configs.begin(), configs.end(), [&](Config * config) { return config->set(name, value, origin); });
}

void GlobalConfig::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto config : configRegistrations())
        config->getSettings(res, overriddenOnly);
}

nlohmann::json GlobalConfig::toJSON()
{
    auto res = nlohmann::json::object();
    for (auto config : configRegistrations())
        for (auto & [name, setting] : config->toJSON().items())
            res[name] = setting;
    return res;
}

} // namespace awsctx
