#pragma once
///@file

#include "awsctx/util/configuration.hh"

#include <vector>

namespace awsctx {

/**
 * Every `Config` that registered itself with a static `Register`, seen
 * as one configuration. A name is set in the first registered config
 * that declares it; names nobody declares are kept as unknown settings.
 */
struct GlobalConfig : public AbstractConfig
{
    static std::vector<Config *> & configRegistrations()
    {
        static std::vector<Config *> registrations;
        return registrations;
    }

    bool set(const std::string & name, const std::string & value, std::string_view origin = codeOrigin) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    nlohmann::json toJSON() override;

    struct Register
    {
        Register(Config * config)
        {
            configRegistrations().push_back(config);
        }
    };
};

extern GlobalConfig globalConfig;

} // namespace awsctx
