#include "awsctx/context/credential-resolver.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/util/logging.hh"

namespace awsctx {

std::optional<AwsCredentials> CredentialResolver::resolve(const std::string & profileName)
{
    std::promise<std::optional<AwsCredentials>> promise;

    resolve(profileName, {[&](std::future<std::optional<AwsCredentials>> result) {
                try {
                    promise.set_value(result.get());
                } catch (...) {
                    promise.set_exception(std::current_exception());
                }
            }});

    return promise.get_future().get();
}

CredentialsManagerResolver::CredentialsManagerResolver(ref<CredentialsManager> manager)
    : CredentialResolver("credentials manager")
    , manager(manager)
{
}

void CredentialsManagerResolver::resolve(
    const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept
{
    auto callbackPtr = std::make_shared<decltype(callback)>(std::move(callback));

    manager->getCredentials(profileName, {[callbackPtr](std::future<AwsCredentials> result) {
                                try {
                                    (*callbackPtr)(std::optional<AwsCredentials>(result.get()));
                                } catch (...) {
                                    callbackPtr->rethrow();
                                }
                            }});
}

ConstructorResolver::ConstructorResolver(const std::string & name, Constructor constructor)
    : CredentialResolver(name)
    , constructor(std::move(constructor))
{
}

void ConstructorResolver::resolve(
    const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept
{
    std::optional<AwsCredentials> res;
    try {
        res = constructor(profileName);
    } catch (Error & e) {
        debug("%s credentials unavailable for profile '%s': %s", name, profileName, e.message());
    } catch (std::exception & e) {
        debug("%s credentials unavailable for profile '%s': %s", name, profileName, e.what());
    } catch (...) {
        debug("%s credentials unavailable for profile '%s'", name, profileName);
    }
    callback(std::move(res));
}

CredentialResolverChain::CredentialResolverChain(CredentialResolvers resolvers)
    : CredentialResolver("chain")
    , resolvers(std::make_shared<const CredentialResolvers>(std::move(resolvers)))
{
}

static void tryResolver(
    std::shared_ptr<const CredentialResolvers> resolvers,
    size_t n,
    const std::string & profileName,
    std::shared_ptr<Callback<std::optional<AwsCredentials>>> callback)
{
    if (n == resolvers->size()) {
        debug("no credentials found for profile '%s'", profileName);
        (*callback)(std::nullopt);
        return;
    }

    auto resolver = (*resolvers)[n];

    resolver->resolve(
        profileName, {[resolvers, n, profileName, callback, resolver](std::future<std::optional<AwsCredentials>> result) {
            std::optional<AwsCredentials> creds;
            try {
                creds = result.get();
                if (!creds)
                    debug("%s has no credentials for profile '%s'", resolver->name, profileName);
            } catch (Error & e) {
                debug("%s failed to resolve profile '%s': %s", resolver->name, profileName, e.message());
            } catch (std::exception & e) {
                debug("%s failed to resolve profile '%s': %s", resolver->name, profileName, e.what());
            } catch (...) {
                debug("%s failed to resolve profile '%s'", resolver->name, profileName);
            }

            if (creds) {
                debug("using credentials from %s for profile '%s'", resolver->name, profileName);
                (*callback)(std::move(creds));
            } else
                tryResolver(resolvers, n + 1, profileName, callback);
        }});
}

void CredentialResolverChain::resolve(
    const std::string & profileName, Callback<std::optional<AwsCredentials>> callback) noexcept
{
    tryResolver(resolvers, 0, profileName, std::make_shared<decltype(callback)>(std::move(callback)));
}

CredentialResolvers makeDefaultFallbackResolvers(const ContextSettings & settings)
{
    CredentialResolvers resolvers;
    if (settings.sharedFileCredentials)
        resolvers.push_back(make_ref<ConstructorResolver>("shared file", makeSharedFileCredentials));
    if (settings.processCredentials)
        resolvers.push_back(make_ref<ConstructorResolver>("process", makeProcessCredentials));
    return resolvers;
}

} // namespace awsctx
