#pragma once
///@file

#include "awsctx/context/aws-creds.hh"
#include "awsctx/context/credentials-manager.hh"
#include "awsctx/util/callback.hh"
#include "awsctx/util/ref.hh"

#include <functional>
#include <memory>
#include <vector>

namespace awsctx {

struct ContextSettings;

/**
 * One step of credential resolution. `std::nullopt` means the step has
 * no credentials for the profile; a reported exception means it failed.
 * Either way the next step is tried.
 */
struct CredentialResolver
{
    const std::string name;

    CredentialResolver(const std::string & name)
        : name(name)
    {
    }

    virtual ~CredentialResolver() {}

    virtual void
    resolve(const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept = 0;

    std::optional<AwsCredentials> resolve(const std::string & profileName);
};

typedef std::vector<ref<CredentialResolver>> CredentialResolvers;

/**
 * Asks a `CredentialsManager`; its failures are reported as is.
 */
struct CredentialsManagerResolver : CredentialResolver
{
    ref<CredentialsManager> manager;

    CredentialsManagerResolver(ref<CredentialsManager> manager);

    using CredentialResolver::resolve;

    void resolve(const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept override;
};

/**
 * Runs a synchronous credentials constructor. An `Error` thrown by the
 * constructor means "no credentials from this step".
 */
struct ConstructorResolver : CredentialResolver
{
    typedef std::function<AwsCredentials(const std::string & profileName)> Constructor;

    Constructor constructor;

    ConstructorResolver(const std::string & name, Constructor constructor);

    using CredentialResolver::resolve;

    void resolve(const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept override;
};

/**
 * Tries each resolver in order and stops at the first that yields
 * credentials. Failures are logged and skipped; an exhausted chain
 * yields `std::nullopt`. The chain never reports an exception.
 */
struct CredentialResolverChain : CredentialResolver
{
    const std::shared_ptr<const CredentialResolvers> resolvers;

    CredentialResolverChain(CredentialResolvers resolvers);

    using CredentialResolver::resolve;

    void resolve(const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept override;
};

/**
 * The shared-file resolver followed by the process resolver, each
 * included only if enabled in `settings`.
 */
CredentialResolvers makeDefaultFallbackResolvers(const ContextSettings & settings);

} // namespace awsctx
