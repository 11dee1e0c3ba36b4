#include "awsctx/context/context-manager.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/util/json-utils.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/strings.hh"

#include <nlohmann/json.hpp>

namespace awsctx {

void to_json(nlohmann::json & json, const ContextChange & change)
{
    json = {
        {"profileName", change.profileName},
        {"accountId", change.accountId},
        {"regions", change.regions},
    };
}

std::optional<AwsCredentials> AwsContext::getCredentials(const std::optional<std::string> & profileName)
{
    std::promise<std::optional<AwsCredentials>> promise;

    getCredentials(profileName, {[&](std::future<std::optional<AwsCredentials>> result) {
                       try {
                           promise.set_value(result.get());
                       } catch (...) {
                           promise.set_exception(std::current_exception());
                       }
                   }});

    return promise.get_future().get();
}

static CredentialResolvers
prependManager(std::shared_ptr<CredentialsManager> credentialsManager, CredentialResolvers fallbackResolvers)
{
    CredentialResolvers resolvers;
    if (credentialsManager)
        resolvers.push_back(make_ref<CredentialsManagerResolver>(ref<CredentialsManager>(credentialsManager)));
    resolvers.insert(resolvers.end(), fallbackResolvers.begin(), fallbackResolvers.end());
    return resolvers;
}

ContextManager::ContextManager(
    ref<SettingsStore> settingsStore,
    ref<PersistentState> persistentState,
    std::shared_ptr<CredentialsManager> credentialsManager)
    : ContextManager(
          settingsStore, persistentState, credentialsManager, makeDefaultFallbackResolvers(contextSettings))
{
}

ContextManager::ContextManager(
    ref<SettingsStore> settingsStore,
    ref<PersistentState> persistentState,
    std::shared_ptr<CredentialsManager> credentialsManager,
    CredentialResolvers fallbackResolvers)
    : settingsStore(settingsStore)
    , persistentState(persistentState)
    , resolverChain(make_ref<CredentialResolverChain>(prependManager(credentialsManager, std::move(fallbackResolvers))))
    , profileKey(contextSettings.profileSettingKey)
    , regionsKey(contextSettings.regionsSettingKey)
    , accountIdKey(contextSettings.accountIdStateKey)
{
    if (auto profileName = getCredentialProfileName())
        debug("stored credential profile is '%s'", *profileName);
    else
        debug("no credential profile stored");
}

void ContextManager::getCredentials(
    const std::optional<std::string> & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept
{
    std::optional<std::string> effectiveProfile;
    try {
        effectiveProfile = profileName && !profileName->empty() ? profileName : getCredentialProfileName();
    } catch (Error & e) {
        debug("cannot determine the credential profile: %s", e.message());
    }

    if (!effectiveProfile || effectiveProfile->empty()) {
        debug("no credential profile given or stored, not resolving credentials");
        return callback(std::nullopt);
    }

    resolverChain->resolve(*effectiveProfile, std::move(callback));
}

std::optional<std::string> ContextManager::getCredentialProfileName()
{
    auto value = settingsStore->readSetting(profileKey);
    if (!value || value->is_null())
        return std::nullopt;
    try {
        return getString(*value);
    } catch (Error & e) {
        warn("ignoring setting '%s': %s", profileKey, e.message());
        return std::nullopt;
    }
}

void ContextManager::setCredentialProfileName(const std::optional<std::string> & profileName)
{
    std::lock_guard<std::recursive_mutex> lock(mutationLock);

    try {
        settingsStore->writeSetting(
            profileKey,
            profileName ? std::optional<nlohmann::json>(*profileName) : std::nullopt,
            SettingsScope::Global);
    } catch (Error & e) {
        e.addTrace("while writing setting '%s'", profileKey);
        throw;
    }

    printTalkative("credential profile set to %s", profileName ? "'" + *profileName + "'" : "none");

    notify({
        .profileName = profileName,
        .accountId = getCredentialAccountId(),
        .regions = getExplorerRegions(),
    });
}

std::optional<std::string> ContextManager::getCredentialAccountId()
{
    auto value = persistentState->get(accountIdKey);
    if (!value || value->is_null())
        return std::nullopt;
    try {
        return getString(*value);
    } catch (Error & e) {
        warn("ignoring persistent state '%s': %s", accountIdKey, e.message());
        return std::nullopt;
    }
}

void ContextManager::setCredentialAccountId(const std::optional<std::string> & accountId)
{
    std::lock_guard<std::recursive_mutex> lock(mutationLock);

    try {
        persistentState->update(accountIdKey, accountId ? std::optional<nlohmann::json>(*accountId) : std::nullopt);
    } catch (Error & e) {
        e.addTrace("while writing persistent state '%s'", accountIdKey);
        throw;
    }

    printTalkative("credential account id set to %s", accountId ? "'" + *accountId + "'" : "none");

    notify({
        .profileName = getCredentialProfileName(),
        .accountId = accountId,
        .regions = getExplorerRegions(),
    });
}

Strings ContextManager::getExplorerRegions()
{
    auto value = settingsStore->readSetting(regionsKey);
    if (!value || value->is_null())
        return {};
    try {
        return getStringList(*value);
    } catch (Error & e) {
        warn("ignoring setting '%s': %s", regionsKey, e.message());
        return {};
    }
}

void ContextManager::writeRegions(const Strings & regions)
{
    try {
        settingsStore->writeSetting(regionsKey, nlohmann::json(regions), SettingsScope::Global);
    } catch (Error & e) {
        e.addTrace("while writing setting '%s'", regionsKey);
        throw;
    }

    printTalkative("explorer regions set to [%s]", concatStringsSep(", ", regions));

    notify({
        .profileName = getCredentialProfileName(),
        .accountId = getCredentialAccountId(),
        .regions = regions,
    });
}

void ContextManager::addExplorerRegions(const Strings & regions)
{
    std::lock_guard<std::recursive_mutex> lock(mutationLock);

    auto current = getExplorerRegions();
    current.insert(current.end(), regions.begin(), regions.end());
    writeRegions(current);
}

void ContextManager::removeExplorerRegions(const Strings & regions)
{
    std::lock_guard<std::recursive_mutex> lock(mutationLock);

    StringSet toRemove(regions.begin(), regions.end());
    auto current = getExplorerRegions();
    current.remove_if([&](const std::string & region) { return toRemove.count(region) > 0; });
    writeRegions(current);
}

void ContextManager::notify(ContextChange change)
{
    vomit("notifying %d context listeners", contextChanged.size());
    contextChanged.emit(change);
}

std::unique_ptr<Subscription> ContextManager::onDidChangeContext(Event<ContextChange>::Listener listener)
{
    return contextChanged.subscribe(std::move(listener));
}

} // namespace awsctx
