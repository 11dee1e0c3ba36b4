#pragma once
///@file

#include "awsctx/util/error.hh"
#include "awsctx/util/sync.hh"
#include "awsctx/util/types.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>

namespace awsctx {

MakeError(SettingsError, Error);

/**
 * The persistence tier a setting is written to. Reads see the most
 * specific tier that has a value.
 */
enum struct SettingsScope {
    Global,
    Workspace,
    WorkspaceFolder,
};

std::string_view showSettingsScope(SettingsScope scope);

/**
 * A key/value settings backend. Values are JSON.
 */
struct SettingsStore
{
    virtual ~SettingsStore() {}

    /**
     * @return The value of `key`, or `std::nullopt` if no tier has one.
     */
    virtual std::optional<nlohmann::json> readSetting(const std::string & key) = 0;

    /**
     * Read `key` and convert it to `T`.
     *
     * @throws SettingsError if the stored value does not have the
     * expected type.
     */
    template<typename T>
    std::optional<T> readSetting(const std::string & key)
    {
        auto value = readSetting(key);
        if (!value)
            return std::nullopt;
        try {
            return value->template get<T>();
        } catch (nlohmann::json::exception & e) {
            throw SettingsError("setting '%s' has unexpected value %s: %s", key, value->dump(), e.what());
        }
    }

    /**
     * Write `value` to `key` in `scope`; `std::nullopt` clears the
     * slot. Returns once the write has been acknowledged; throws if it
     * failed.
     */
    virtual void writeSetting(const std::string & key, std::optional<nlohmann::json> value, SettingsScope scope) = 0;
};

/**
 * A settings store that keeps every tier in memory.
 */
class MemorySettingsStore : public SettingsStore
{
    struct State
    {
        std::map<SettingsScope, std::map<std::string, nlohmann::json>> tiers;
    };

    Sync<State> state;

public:

    std::optional<nlohmann::json> readSetting(const std::string & key) override;

    using SettingsStore::readSetting;

    void writeSetting(const std::string & key, std::optional<nlohmann::json> value, SettingsScope scope) override;

    /**
     * @return The value of `key` in exactly `scope`, ignoring the other
     * tiers.
     */
    std::optional<nlohmann::json> inspect(const std::string & key, SettingsScope scope);
};

} // namespace awsctx
