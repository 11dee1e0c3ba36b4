#include "awsctx/context/persistent-state.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/util/file-system.hh"
#include "awsctx/util/json-utils.hh"
#include "awsctx/util/logging.hh"

namespace awsctx {

std::optional<nlohmann::json> MemoryPersistentState::get(const std::string & key)
{
    auto values_(values.lock());
    if (auto value = awsctx::get(*values_, key))
        return nlohmann::json(*value);
    return std::nullopt;
}

void MemoryPersistentState::update(const std::string & key, std::optional<nlohmann::json> value)
{
    auto values_(values.lock());
    if (value)
        values_->insert_or_assign(key, std::move(*value));
    else
        values_->erase(key);
}

FilePersistentState::FilePersistentState(const std::filesystem::path & path)
    : path(path)
{
}

nlohmann::json::object_t & FilePersistentState::load(State & state)
{
    if (state.contents)
        return *state.contents;

    if (!pathExists(path)) {
        debug("persistent state file '%s' does not exist yet", path.string());
        return state.contents.emplace();
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(readFile(path));
    } catch (nlohmann::json::parse_error & e) {
        throw StateError("persistent state file '%s' is not valid JSON: %s", path.string(), e.what());
    }

    try {
        return state.contents.emplace(getObject(json));
    } catch (Error & e) {
        throw StateError("persistent state file '%s' is malformed: %s", path.string(), e.message());
    }
}

std::optional<nlohmann::json> FilePersistentState::get(const std::string & key)
{
    auto state_(state.lock());
    if (auto value = awsctx::get(load(*state_), key))
        return nlohmann::json(*value);
    return std::nullopt;
}

void FilePersistentState::update(const std::string & key, std::optional<nlohmann::json> value)
{
    auto state_(state.lock());

    auto contents = load(*state_);
    if (value)
        contents.insert_or_assign(key, std::move(*value));
    else
        contents.erase(key);

    try {
        if (path.has_parent_path())
            createDirs(path.parent_path());
        replaceFile(path, nlohmann::json(contents).dump(2) + "\n", 0600);
    } catch (Error & e) {
        e.addTrace("while updating '%s' in persistent state file '%s'", key, path.string());
        throw;
    }

    state_->contents = std::move(contents);
}

ref<PersistentState> openPersistentState()
{
    return make_ref<FilePersistentState>(contextSettings.stateFile.get());
}

} // namespace awsctx
