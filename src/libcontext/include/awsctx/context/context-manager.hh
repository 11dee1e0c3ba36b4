#pragma once
///@file

#include "awsctx/context/aws-creds.hh"
#include "awsctx/context/credential-resolver.hh"
#include "awsctx/context/credentials-manager.hh"
#include "awsctx/context/persistent-state.hh"
#include "awsctx/context/settings-store.hh"
#include "awsctx/util/callback.hh"
#include "awsctx/util/event.hh"
#include "awsctx/util/ref.hh"
#include "awsctx/util/types.hh"

#include <nlohmann/json_fwd.hpp>

#include <mutex>
#include <optional>

namespace awsctx {

/**
 * Snapshot of the context passed to change listeners. Always the
 * complete state after the write that triggered it.
 */
struct ContextChange
{
    std::optional<std::string> profileName;
    std::optional<std::string> accountId;
    Strings regions;

    bool operator==(const ContextChange &) const = default;
};

void to_json(nlohmann::json & json, const ContextChange & change);

/**
 * The selected credential profile, the resolved account id and the
 * explorer regions, plus credential resolution for a profile.
 */
struct AwsContext
{
    virtual ~AwsContext() {}

    /**
     * Resolve credentials for `profileName`, or for the stored profile
     * if none is given. An empty `profileName` counts as none given.
     * Reports `std::nullopt` when there is no profile or no step of the
     * resolver chain yields credentials; never reports an exception.
     */
    virtual void getCredentials(
        const std::optional<std::string> & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept = 0;

    std::optional<AwsCredentials> getCredentials(const std::optional<std::string> & profileName = std::nullopt);

    virtual std::optional<std::string> getCredentialProfileName() = 0;

    virtual void setCredentialProfileName(const std::optional<std::string> & profileName) = 0;

    virtual std::optional<std::string> getCredentialAccountId() = 0;

    virtual void setCredentialAccountId(const std::optional<std::string> & accountId) = 0;

    /**
     * @return The stored region list, empty if nothing is stored.
     */
    virtual Strings getExplorerRegions() = 0;

    /**
     * Append `regions` in the given order. Regions already present are
     * appended again.
     */
    virtual void addExplorerRegions(const Strings & regions) = 0;

    /**
     * Remove every occurrence of each of `regions`.
     */
    virtual void removeExplorerRegions(const Strings & regions) = 0;

    template<typename... Regions>
    void addExplorerRegion(const Regions &... regions)
    {
        addExplorerRegions(Strings{std::string(regions)...});
    }

    template<typename... Regions>
    void removeExplorerRegion(const Regions &... regions)
    {
        removeExplorerRegions(Strings{std::string(regions)...});
    }

    /**
     * Register `listener` to be called after every successful mutation.
     * Destroying the returned handle unregisters it.
     */
    virtual std::unique_ptr<Subscription> onDidChangeContext(Event<ContextChange>::Listener listener) = 0;
};

/**
 * The `AwsContext` backed by a settings store (profile and regions)
 * and persistent state (account id).
 *
 * Mutators write through to storage, wait for the write to be
 * acknowledged and then notify listeners synchronously. If the write
 * throws, the exception propagates and no listener is called.
 * Mutations are serialised, including the read-modify-write of the
 * region list; a listener may call back into the manager.
 */
class ContextManager : public AwsContext
{
    ref<SettingsStore> settingsStore;
    ref<PersistentState> persistentState;
    ref<CredentialResolverChain> resolverChain;

    const std::string profileKey;
    const std::string regionsKey;
    const std::string accountIdKey;

    std::recursive_mutex mutationLock;

    Event<ContextChange> contextChanged;

    void notify(ContextChange change);

    void writeRegions(const Strings & regions);

public:

    /**
     * Resolve credentials through `credentialsManager` (if any), then
     * the default fallback resolvers.
     */
    ContextManager(
        ref<SettingsStore> settingsStore,
        ref<PersistentState> persistentState,
        std::shared_ptr<CredentialsManager> credentialsManager = nullptr);

    ContextManager(
        ref<SettingsStore> settingsStore,
        ref<PersistentState> persistentState,
        std::shared_ptr<CredentialsManager> credentialsManager,
        CredentialResolvers fallbackResolvers);

    using AwsContext::getCredentials;

    void getCredentials(
        const std::optional<std::string> & profileName,
        Callback<std::optional<AwsCredentials>> callback) noexcept override;

    std::optional<std::string> getCredentialProfileName() override;

    void setCredentialProfileName(const std::optional<std::string> & profileName) override;

    std::optional<std::string> getCredentialAccountId() override;

    void setCredentialAccountId(const std::optional<std::string> & accountId) override;

    Strings getExplorerRegions() override;

    void addExplorerRegions(const Strings & regions) override;

    void removeExplorerRegions(const Strings & regions) override;

    std::unique_ptr<Subscription> onDidChangeContext(Event<ContextChange>::Listener listener) override;
};

} // namespace awsctx
