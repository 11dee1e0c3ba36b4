#pragma once
///@file

#include "awsctx/context/persistent-state.hh"
#include "awsctx/context/settings-store.hh"

#include <functional>
#include <vector>

namespace awsctx::testing {

/**
 * A `MemorySettingsStore` that records every write, can be made to
 * fail, and can run a hook before a write is acknowledged.
 */
class RecordingSettingsStore : public MemorySettingsStore
{
public:

    struct Write
    {
        std::string key;
        std::optional<nlohmann::json> value;
        SettingsScope scope;

        bool operator==(const Write &) const = default;
    };

    /**
     * Called with the write before it is applied.
     */
    std::function<void(const Write &)> onWrite;

    /**
     * If set, writes throw a `SettingsError` with this message and
     * change nothing.
     */
    std::optional<std::string> failWrites;

    void writeSetting(const std::string & key, std::optional<nlohmann::json> value, SettingsScope scope) override;

    std::vector<Write> writes();

private:

    Sync<std::vector<Write>> _writes;
};

/**
 * A `MemoryPersistentState` that records every update and can be made
 * to fail.
 */
class RecordingPersistentState : public MemoryPersistentState
{
public:

    typedef std::pair<std::string, std::optional<nlohmann::json>> Update;

    std::function<void(const Update &)> onUpdate;

    std::optional<std::string> failUpdates;

    void update(const std::string & key, std::optional<nlohmann::json> value) override;

    std::vector<Update> updates();

private:

    Sync<std::vector<Update>> _updates;
};

} // namespace awsctx::testing
