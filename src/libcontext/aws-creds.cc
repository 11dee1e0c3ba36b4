#include "awsctx/context/aws-creds.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/util/logging.hh"

#if AWSCTX_WITH_AWS_AUTH

#  include <aws/crt/Api.h>
#  include <aws/crt/Types.h>
#  include <aws/crt/auth/Credentials.h>
#  include <aws/crt/io/Bootstrap.h>

// The C++ wrapper does not expose the process provider.
#  include <aws/auth/credentials.h>

#  include <boost/unordered/concurrent_flat_map.hpp>

#  include <chrono>
#  include <future>
#  include <memory>

#endif

namespace awsctx {

#if AWSCTX_WITH_AWS_AUTH

AwsAuthError::AwsAuthError(int errorCode)
    : Error("%s (aws-crt error %d)", aws_error_str(errorCode), errorCode)
    , errorCode(errorCode)
{
}

namespace {

enum struct ProviderKind { SharedFile, Process };

std::string_view showProviderKind(ProviderKind kind)
{
    return kind == ProviderKind::SharedFile ? "shared file" : "process";
}

/**
 * Wrap a C credentials provider in the C++ interface, the way
 * aws-crt-cpp does internally.
 */
std::shared_ptr<Aws::Crt::Auth::ICredentialsProvider>
wrapProvider(aws_credentials_provider * raw, Aws::Crt::Allocator * allocator)
{
    if (!raw)
        return nullptr;
    return Aws::Crt::MakeShared<Aws::Crt::Auth::CredentialsProvider>(allocator, raw, allocator);
}

std::string cursorToString(aws_byte_cursor cursor)
{
    auto view = Aws::Crt::ByteCursorToStringView(cursor);
    return std::string(view.data(), view.size());
}

AwsCredentials toAwsCredentials(const Aws::Crt::Auth::Credentials & credentials)
{
    auto sessionToken = cursorToString(credentials.GetSessionToken());
    return {
        .accessKeyId = cursorToString(credentials.GetAccessKeyId()),
        .secretAccessKey = cursorToString(credentials.GetSecretAccessKey()),
        .sessionToken = sessionToken.empty() ? std::nullopt : std::optional(sessionToken),
    };
}

/**
 * Ask `provider` for credentials and wait at most `timeout` for the
 * answer.
 */
AwsCredentials
awaitCredentials(const std::shared_ptr<Aws::Crt::Auth::ICredentialsProvider> & provider, std::chrono::seconds timeout)
{
    if (!provider->IsValid())
        throw AwsAuthError("AWS credential provider is invalid");

    auto promise = std::make_shared<std::promise<AwsCredentials>>();
    auto future = promise->get_future();

    provider->GetCredentials([promise](std::shared_ptr<Aws::Crt::Auth::Credentials> credentials, int errorCode) {
        if (errorCode == 0 && credentials)
            promise->set_value(toAwsCredentials(*credentials));
        else
            promise->set_exception(std::make_exception_ptr(AwsAuthError(errorCode)));
    });

    // The provider has no deadline of its own.
    if (future.wait_for(timeout) == std::future_status::timeout)
        throw AwsAuthError("timed out after %d seconds waiting for AWS credentials", timeout.count());

    return future.get();
}

/**
 * The aws-crt log level that shows about as much as our own verbosity.
 */
Aws::Crt::LogLevel crtLogLevel()
{
    return verbosity >= lvlVomit    ? Aws::Crt::LogLevel::Trace
           : verbosity >= lvlDebug  ? Aws::Crt::LogLevel::Debug
           : verbosity >= lvlChatty ? Aws::Crt::LogLevel::Info
                                    : Aws::Crt::LogLevel::Warn;
}

class AwsCrtProviders
{
public:
    AwsCrtProviders()
    {
        apiHandle.InitializeLogging(crtLogLevel(), stderr);

        /* Profiles that assume a role talk to STS over TLS. */
        auto allocator = Aws::Crt::ApiAllocator();
        auto tlsOptions = Aws::Crt::Io::TlsContextOptions::InitDefaultClient(allocator);
        tlsContext = std::make_shared<Aws::Crt::Io::TlsContext>(tlsOptions, Aws::Crt::Io::TlsMode::CLIENT, allocator);
        if (!*tlsContext) {
            warn("cannot set up TLS for AWS; profiles that assume a role will not resolve");
            tlsContext.reset();
        }

        bootstrap = Aws::Crt::ApiHandle::GetOrCreateStaticDefaultClientBootstrap();
        if (!bootstrap)
            throw AwsAuthError("cannot create the AWS client bootstrap");
    }

    AwsCredentials getCredentials(ProviderKind kind, const std::string & profile)
    {
        auto key = std::string(showProviderKind(kind)) + ":" + profile;
        std::shared_ptr<Aws::Crt::Auth::ICredentialsProvider> provider;

        providerCache.try_emplace_and_cvisit(
            key,
            nullptr,
            [&](auto & kv) { provider = kv.second = createProvider(kind, profile); },
            [&](const auto & kv) { provider = kv.second; });

        if (!provider) {
            providerCache.erase(key);
            throw AwsAuthError(
                "failed to create AWS %s credentials provider for profile '%s'", showProviderKind(kind), profile);
        }

        try {
            return awaitCredentials(provider, std::chrono::seconds(contextSettings.credentialsTimeout.get()));
        } catch (AwsAuthError &) {
            providerCache.erase(key);
            throw;
        }
    }

private:
    std::shared_ptr<Aws::Crt::Auth::ICredentialsProvider> createProvider(ProviderKind kind, const std::string & profile)
    {
        debug("creating AWS %s credentials provider for profile '%s'", showProviderKind(kind), profile);

        auto allocator = Aws::Crt::ApiAllocator();

        switch (kind) {
        case ProviderKind::SharedFile: {
            Aws::Crt::Auth::CredentialsProviderProfileConfig config;
            config.Bootstrap = bootstrap;
            config.TlsContext = tlsContext.get();
            config.ProfileNameOverride = Aws::Crt::ByteCursorFromCString(profile.c_str());
            return Aws::Crt::Auth::CredentialsProvider::CreateCredentialsProviderProfile(config, allocator);
        }
        case ProviderKind::Process: {
            aws_credentials_provider_process_options options{};
            options.profile_to_use = aws_byte_cursor_from_c_str(profile.c_str());
            return wrapProvider(aws_credentials_provider_new_process(allocator, &options), allocator);
        }
        }
        return nullptr;
    }

    Aws::Crt::ApiHandle apiHandle;
    std::shared_ptr<Aws::Crt::Io::TlsContext> tlsContext;
    Aws::Crt::Io::ClientBootstrap * bootstrap;
    boost::concurrent_flat_map<std::string, std::shared_ptr<Aws::Crt::Auth::ICredentialsProvider>> providerCache;
};

AwsCrtProviders & getProviders()
{
    static AwsCrtProviders providers;
    return providers;
}

} // anonymous namespace

AwsCredentials makeSharedFileCredentials(const std::string & profileName)
{
    return getProviders().getCredentials(ProviderKind::SharedFile, profileName);
}

AwsCredentials makeProcessCredentials(const std::string & profileName)
{
    return getProviders().getCredentials(ProviderKind::Process, profileName);
}

#else

AwsCredentials makeSharedFileCredentials(const std::string & profileName)
{
    throw AwsAuthError(
        "cannot read shared file credentials for profile '%s' because awsctx was built without aws-crt", profileName);
}

AwsCredentials makeProcessCredentials(const std::string & profileName)
{
    throw AwsAuthError(
        "cannot run the credential process for profile '%s' because awsctx was built without aws-crt", profileName);
}

#endif

} // namespace awsctx
