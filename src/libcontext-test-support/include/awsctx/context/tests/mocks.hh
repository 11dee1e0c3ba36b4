#pragma once
///@file

#include "awsctx/context/credential-resolver.hh"
#include "awsctx/context/credentials-manager.hh"

#include <gmock/gmock.h>

namespace awsctx::testing {

class MockCredentialsManager : public CredentialsManager
{
public:
    using CredentialsManager::getCredentials;

    MOCK_METHOD(
        void, getCredentials, (const std::string & profileName, Callback<AwsCredentials> callback), (noexcept, override));
};

class MockCredentialResolver : public CredentialResolver
{
public:
    MockCredentialResolver(const std::string & name = "mock")
        : CredentialResolver(name)
    {
    }

    using CredentialResolver::resolve;

    MOCK_METHOD(
        void,
        resolve,
        (const std::string & profileName, Callback<std::optional<AwsCredentials>> callback),
        (noexcept, override));
};

/**
 * Action for `Invoke()` that completes the callback of a mocked async
 * method with `value`.
 */
template<typename T>
auto completeWith(T value)
{
    return [value](const std::string &, Callback<T> callback) {
        auto v = value;
        callback(std::move(v));
    };
}

/**
 * Action for `Invoke()` that fails the callback of a mocked async
 * method with `error`.
 */
template<typename T, typename E>
auto failWith(E error)
{
    return [error](const std::string &, Callback<T> callback) { callback.rethrow(std::make_exception_ptr(error)); };
}

} // namespace awsctx::testing
