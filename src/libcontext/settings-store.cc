#include "awsctx/context/settings-store.hh"

namespace awsctx {

std::string_view showSettingsScope(SettingsScope scope)
{
    switch (scope) {
    case SettingsScope::Global:
        return "global";
    case SettingsScope::Workspace:
        return "workspace";
    case SettingsScope::WorkspaceFolder:
        return "workspace-folder";
    }
    throw SettingsError("unknown settings scope %d", (int) scope);
}

std::optional<nlohmann::json> MemorySettingsStore::readSetting(const std::string & key)
{
    auto state_(state.lock());
    for (auto scope : {SettingsScope::WorkspaceFolder, SettingsScope::Workspace, SettingsScope::Global}) {
        auto & tier = state_->tiers[scope];
        if (auto value = get(tier, key))
            return nlohmann::json(*value);
    }
    return std::nullopt;
}

void MemorySettingsStore::writeSetting(
    const std::string & key, std::optional<nlohmann::json> value, SettingsScope scope)
{
    auto state_(state.lock());
    auto & tier = state_->tiers[scope];
    if (value)
        tier.insert_or_assign(key, std::move(*value));
    else
        tier.erase(key);
}

std::optional<nlohmann::json> MemorySettingsStore::inspect(const std::string & key, SettingsScope scope)
{
    auto state_(state.lock());
    if (auto value = get(state_->tiers[scope], key))
        return nlohmann::json(*value);
    return std::nullopt;
}

} // namespace awsctx
