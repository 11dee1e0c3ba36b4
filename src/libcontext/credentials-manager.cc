#include "awsctx/context/credentials-manager.hh"

namespace awsctx {

AwsCredentials CredentialsManager::getCredentials(const std::string & profileName)
{
    std::promise<AwsCredentials> promise;

    getCredentials(profileName, {[&](std::future<AwsCredentials> result) {
                       try {
                           promise.set_value(result.get());
                       } catch (...) {
                           promise.set_exception(std::current_exception());
                       }
                   }});

    return promise.get_future().get();
}

} // namespace awsctx
