#include "awsctx/context/tests/recording-stores.hh"

namespace awsctx::testing {

void RecordingSettingsStore::writeSetting(
    const std::string & key, std::optional<nlohmann::json> value, SettingsScope scope)
{
    Write write{key, value, scope};
    if (onWrite)
        onWrite(write);
    if (failWrites)
        throw SettingsError("cannot write setting '%s': %s", key, *failWrites);
    MemorySettingsStore::writeSetting(key, std::move(value), scope);
    _writes.lock()->push_back(std::move(write));
}

std::vector<RecordingSettingsStore::Write> RecordingSettingsStore::writes()
{
    return *_writes.lock();
}

void RecordingPersistentState::update(const std::string & key, std::optional<nlohmann::json> value)
{
    Update update{key, value};
    if (onUpdate)
        onUpdate(update);
    if (failUpdates)
        throw StateError("cannot update '%s': %s", key, *failUpdates);
    MemoryPersistentState::update(key, std::move(value));
    _updates.lock()->push_back(std::move(update));
}

std::vector<RecordingPersistentState::Update> RecordingPersistentState::updates()
{
    return *_updates.lock();
}

} // namespace awsctx::testing
