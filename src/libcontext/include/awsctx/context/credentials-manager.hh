#pragma once
///@file

#include "awsctx/context/aws-creds.hh"
#include "awsctx/util/callback.hh"

namespace awsctx {

/**
 * Resolves credentials for named profiles through a mechanism of its
 * own (e.g. a cache maintained elsewhere). Optional; when present it is
 * asked before the file and process fallbacks.
 */
struct CredentialsManager
{
    virtual ~CredentialsManager() {}

    /**
     * Asynchronous version of `getCredentials()`. Reports `AwsAuthError`
     * through `callback` for a profile it does not know.
     */
    virtual void getCredentials(const std::string & profileName, Callback<AwsCredentials> callback) noexcept = 0;

    AwsCredentials getCredentials(const std::string & profileName);
};

} // namespace awsctx
