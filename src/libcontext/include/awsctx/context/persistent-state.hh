#pragma once
///@file

#include "awsctx/util/error.hh"
#include "awsctx/util/ref.hh"
#include "awsctx/util/sync.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>

namespace awsctx {

MakeError(StateError, Error);

/**
 * Key/value storage scoped to one installation that survives
 * restarts.
 */
struct PersistentState
{
    virtual ~PersistentState() {}

    virtual std::optional<nlohmann::json> get(const std::string & key) = 0;

    /**
     * Store `value` under `key`; `std::nullopt` removes the key.
     * Throws if the update could not be persisted.
     */
    virtual void update(const std::string & key, std::optional<nlohmann::json> value) = 0;
};

class MemoryPersistentState : public PersistentState
{
    Sync<std::map<std::string, nlohmann::json>> values;

public:

    std::optional<nlohmann::json> get(const std::string & key) override;

    void update(const std::string & key, std::optional<nlohmann::json> value) override;
};

/**
 * Persistent state kept as a single JSON object in a file. The file is
 * read on first access and rewritten atomically on every update.
 */
class FilePersistentState : public PersistentState
{
    struct State
    {
        std::optional<nlohmann::json::object_t> contents;
    };

    const std::filesystem::path path;

    Sync<State> state;

    nlohmann::json::object_t & load(State & state);

public:

    FilePersistentState(const std::filesystem::path & path);

    const std::filesystem::path & getPath() const
    {
        return path;
    }

    std::optional<nlohmann::json> get(const std::string & key) override;

    void update(const std::string & key, std::optional<nlohmann::json> value) override;
};

/**
 * Open the persistent state file named by the `state-file` setting.
 */
ref<PersistentState> openPersistentState();

} // namespace awsctx
