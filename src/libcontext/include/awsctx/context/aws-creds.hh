#pragma once
///@file

#include "awsctx/context/config.hh"
#include "awsctx/util/error.hh"

#include <optional>
#include <string>

namespace awsctx {

/**
 * A resolved access key pair. Temporary credentials (from STS or a
 * credential process) also carry a session token.
 */
struct AwsCredentials
{
    std::string accessKeyId;
    std::string secretAccessKey;
    std::optional<std::string> sessionToken = std::nullopt;

    bool operator==(const AwsCredentials &) const = default;
};

/**
 * A credential provider failed or has nothing for a profile. Errors
 * raised by aws-crt keep its error code.
 */
class AwsAuthError : public Error
{
public:
    using Error::Error;

    std::optional<int> errorCode;

#if AWSCTX_WITH_AWS_AUTH
    explicit AwsAuthError(int errorCode);
#endif
};

/**
 * Resolve credentials for `profileName` from the shared credentials
 * and config files, including role assumption configured there.
 *
 * @throws AwsAuthError if the profile yields no credentials.
 */
AwsCredentials makeSharedFileCredentials(const std::string & profileName);

/**
 * Resolve credentials for `profileName` by running the
 * `credential_process` configured for it.
 *
 * @throws AwsAuthError if the profile has no credential process or the
 * process fails.
 */
AwsCredentials makeProcessCredentials(const std::string & profileName);

} // namespace awsctx
